#include "ipc/envelope_codec.hpp"

namespace mycelium::ipc {

namespace {

bool fail(std::string* error, const std::string& reason) {
    if (error) {
        *error = reason;
    }
    return false;
}

} // anonymous namespace

json envelope_to_json(const kernel::Envelope& envelope) {
    json j = {
        {"id", envelope.id},
        {"sender", envelope.sender},
        {"recipients", envelope.recipients},
        {"kind", kernel::message_kind_to_string(envelope.kind)},
        {"payload", envelope.payload},
        {"created_at_ms", envelope.created_at_ms},
        {"priority", envelope.priority},
        {"requires_response", envelope.requires_response}
    };
    if (envelope.correlation_id) {
        j["correlation_id"] = *envelope.correlation_id;
    }
    if (envelope.ttl_ms) {
        j["ttl_ms"] = *envelope.ttl_ms;
    }
    return j;
}

std::optional<kernel::Envelope> envelope_from_json(const json& j, std::string* error) {
    if (!j.is_object()) {
        fail(error, "envelope is not an object");
        return std::nullopt;
    }
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        fail(error, "missing id");
        return std::nullopt;
    }
    if (!j.contains("sender") || !j["sender"].is_string()) {
        fail(error, "missing sender");
        return std::nullopt;
    }
    if (!j.contains("recipients") || !j["recipients"].is_array()) {
        fail(error, "missing recipients");
        return std::nullopt;
    }
    if (!j.contains("kind") || !j["kind"].is_string()) {
        fail(error, "missing kind");
        return std::nullopt;
    }

    auto kind = kernel::message_kind_from_string(j["kind"].get<std::string>());
    if (!kind) {
        fail(error, "unknown kind '" + j["kind"].get<std::string>() + "'");
        return std::nullopt;
    }

    kernel::Envelope envelope;
    envelope.id = j["id"].get<std::string>();
    envelope.sender = j["sender"].get<std::string>();
    envelope.kind = *kind;

    for (const auto& recipient : j["recipients"]) {
        if (!recipient.is_string()) {
            fail(error, "recipient is not a string");
            return std::nullopt;
        }
        envelope.recipients.push_back(recipient.get<std::string>());
    }

    envelope.payload = j.value("payload", json::object());
    envelope.created_at_ms = j.value("created_at_ms", static_cast<int64_t>(0));
    envelope.priority = kernel::clamp_priority(j.value("priority", kernel::kDefaultPriority));
    envelope.requires_response = j.value("requires_response", false);

    if (j.contains("correlation_id") && j["correlation_id"].is_string()) {
        envelope.correlation_id = j["correlation_id"].get<std::string>();
    }
    if (j.contains("ttl_ms") && j["ttl_ms"].is_number_integer()) {
        envelope.ttl_ms = j["ttl_ms"].get<int64_t>();
    }

    return envelope;
}

std::string serialize_envelope(const kernel::Envelope& envelope) {
    return envelope_to_json(envelope).dump();
}

std::optional<kernel::Envelope> deserialize_envelope(const std::string& text, std::string* error) {
    try {
        return envelope_from_json(json::parse(text), error);
    } catch (const json::exception& e) {
        fail(error, e.what());
        return std::nullopt;
    }
}

} // namespace mycelium::ipc
