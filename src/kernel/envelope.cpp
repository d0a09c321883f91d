#include "kernel/envelope.hpp"
#include "util/clock.hpp"
#include "util/ids.hpp"
#include <algorithm>

namespace mycelium::kernel {

const char* message_kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::DIRECTIVE: return "directive";
        case MessageKind::REPORT: return "report";
        case MessageKind::QUERY: return "query";
        case MessageKind::COORDINATE: return "coordinate";
        case MessageKind::EVENT: return "event";
    }
    return "unknown";
}

std::optional<MessageKind> message_kind_from_string(const std::string& str) {
    if (str == "directive") return MessageKind::DIRECTIVE;
    if (str == "report") return MessageKind::REPORT;
    if (str == "query") return MessageKind::QUERY;
    if (str == "coordinate") return MessageKind::COORDINATE;
    if (str == "event") return MessageKind::EVENT;
    return std::nullopt;
}

bool Envelope::is_expired(int64_t now_ms) const {
    if (!ttl_ms) {
        return false;
    }
    return now_ms - created_at_ms >= *ttl_ms;
}

std::optional<int64_t> Envelope::remaining_ttl_ms(int64_t now_ms) const {
    if (!ttl_ms) {
        return std::nullopt;
    }
    return *ttl_ms - (now_ms - created_at_ms);
}

const std::string& Envelope::correlation_key() const {
    return correlation_id ? *correlation_id : id;
}

int clamp_priority(int priority) {
    return std::clamp(priority, kMinPriority, kMaxPriority);
}

Envelope make_envelope(MessageKind kind,
                       const std::string& sender,
                       std::vector<std::string> recipients,
                       nlohmann::json payload,
                       int priority) {
    Envelope envelope;
    envelope.id = util::generate_id("env");
    envelope.sender = sender;
    envelope.recipients = std::move(recipients);
    envelope.kind = kind;
    envelope.payload = std::move(payload);
    envelope.created_at_ms = util::wall_now_ms();
    envelope.priority = clamp_priority(priority);
    return envelope;
}

Envelope derive_envelope(const Envelope& cause,
                         MessageKind kind,
                         const std::string& sender,
                         std::vector<std::string> recipients,
                         nlohmann::json payload) {
    Envelope envelope = make_envelope(kind, sender, std::move(recipients),
                                      std::move(payload), cause.priority);
    envelope.correlation_id = cause.correlation_key();
    return envelope;
}

} // namespace mycelium::kernel
