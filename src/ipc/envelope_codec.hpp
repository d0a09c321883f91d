#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"

namespace mycelium::ipc {

using json = nlohmann::json;

json envelope_to_json(const kernel::Envelope& envelope);

// nullopt when a required field is missing or has the wrong type;
// the reason goes to `error` when given
std::optional<kernel::Envelope> envelope_from_json(const json& j, std::string* error = nullptr);

std::string serialize_envelope(const kernel::Envelope& envelope);
std::optional<kernel::Envelope> deserialize_envelope(const std::string& text, std::string* error = nullptr);

} // namespace mycelium::ipc
