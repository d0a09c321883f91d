#include "kernel/errors.hpp"
#include <array>
#include <utility>

namespace mycelium::kernel {

namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 20> kErrorNames = {{
    {ErrorCode::NONE, "none"},
    {ErrorCode::DUPLICATE_IDENTITY, "duplicate_identity"},
    {ErrorCode::INVALID_IDENTITY, "invalid_identity"},
    {ErrorCode::UNKNOWN_RECIPIENT, "unknown_recipient"},
    {ErrorCode::MAILBOX_FULL, "mailbox_full"},
    {ErrorCode::AGENT_STOPPED, "agent_stopped"},
    {ErrorCode::AGENT_REMOVED, "agent_removed"},
    {ErrorCode::EXPIRED, "expired"},
    {ErrorCode::POOL_EXHAUSTED, "pool_exhausted"},
    {ErrorCode::POOL_FULL, "pool_full"},
    {ErrorCode::CIRCUIT_OPEN, "circuit_open"},
    {ErrorCode::NO_CAPABLE_SUPERVISOR, "no_capable_supervisor"},
    {ErrorCode::RETRIES_EXHAUSTED, "retries_exhausted"},
    {ErrorCode::ABANDONED, "abandoned"},
    {ErrorCode::HANDLER_ERROR, "handler_error"},
    {ErrorCode::HANDLER_FATAL, "handler_fatal"},
    {ErrorCode::MISSING_REPORT, "missing_report"},
    {ErrorCode::DUPLICATE_REPORT, "duplicate_report"},
    {ErrorCode::INVALID_DIRECTIVE, "invalid_directive"},
    {ErrorCode::UNAVAILABLE, "unavailable"},
}};

} // namespace

const char* error_code_to_string(ErrorCode code) {
    for (const auto& [value, name] : kErrorNames) {
        if (value == code) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ErrorCode> error_code_from_string(const std::string& str) {
    for (const auto& [value, name] : kErrorNames) {
        if (str == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool is_retryable_routing_fault(ErrorCode code) {
    switch (code) {
        case ErrorCode::POOL_EXHAUSTED:
        case ErrorCode::CIRCUIT_OPEN:
        case ErrorCode::MAILBOX_FULL:
        case ErrorCode::UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

} // namespace mycelium::kernel
