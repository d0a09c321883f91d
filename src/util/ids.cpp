#include "util/ids.hpp"
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <random>

namespace mycelium::util {

static std::atomic<uint64_t> g_next_id{1};

const std::string& process_tag() {
    static const std::string tag = [] {
        std::random_device rd;
        char buf[9];
        std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(rd()));
        return std::string(buf);
    }();
    return tag;
}

std::string generate_id(const std::string& prefix) {
    return prefix + "-" + process_tag() + "-" + std::to_string(g_next_id++);
}

} // namespace mycelium::util
