#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mycelium::kernel {

enum class MessageKind : uint8_t {
    DIRECTIVE,   // downward request for work
    REPORT,      // upward result or status
    QUERY,       // request expecting a correlated reply
    COORDINATE,  // peer proposal / acceptance
    EVENT        // fire-and-forget notification
};

const char* message_kind_to_string(MessageKind kind);
std::optional<MessageKind> message_kind_from_string(const std::string& str);

constexpr int kMinPriority = 0;
constexpr int kMaxPriority = 10;
constexpr int kDefaultPriority = 5;

// Message envelope. Never modified once enqueued; transformations go through
// derive_envelope, which assigns a fresh id and carries the correlation id.
struct Envelope {
    std::string id;
    std::string sender;
    std::vector<std::string> recipients;
    MessageKind kind = MessageKind::EVENT;
    nlohmann::json payload = nlohmann::json::object();
    int64_t created_at_ms = 0;
    int priority = kDefaultPriority;
    std::optional<std::string> correlation_id;
    std::optional<int64_t> ttl_ms;
    bool requires_response = false;

    // TTL is a hard expiry measured from created_at_ms
    bool is_expired(int64_t now_ms) const;

    // Remaining TTL, or nullopt when the envelope has none
    std::optional<int64_t> remaining_ttl_ms(int64_t now_ms) const;

    // correlation_id when set, otherwise the envelope's own id
    const std::string& correlation_key() const;
};

int clamp_priority(int priority);

Envelope make_envelope(MessageKind kind,
                       const std::string& sender,
                       std::vector<std::string> recipients,
                       nlohmann::json payload = nlohmann::json::object(),
                       int priority = kDefaultPriority);

// New envelope caused by `cause`: fresh id, correlation_id = cause.correlation_key(),
// same priority as the cause.
Envelope derive_envelope(const Envelope& cause,
                         MessageKind kind,
                         const std::string& sender,
                         std::vector<std::string> recipients,
                         nlohmann::json payload = nlohmann::json::object());

} // namespace mycelium::kernel
