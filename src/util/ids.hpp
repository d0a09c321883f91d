#pragma once
#include <string>

namespace mycelium::util {

// Process-unique id of the form "<prefix>-<process tag>-<counter>".
// The random process tag keeps ids distinct across bridged processes.
std::string generate_id(const std::string& prefix);

// The random tag shared by every id this process generates
const std::string& process_tag();

} // namespace mycelium::util
