#pragma once
#include <optional>
#include <string>

namespace mycelium::kernel {

// Typed failures surfaced by the bus, runtimes and supervisors.
// The string forms travel in report payloads as "error_code".
enum class ErrorCode {
    NONE,
    DUPLICATE_IDENTITY,
    INVALID_IDENTITY,
    UNKNOWN_RECIPIENT,
    MAILBOX_FULL,
    AGENT_STOPPED,
    AGENT_REMOVED,
    EXPIRED,
    POOL_EXHAUSTED,
    POOL_FULL,
    CIRCUIT_OPEN,
    NO_CAPABLE_SUPERVISOR,
    RETRIES_EXHAUSTED,
    ABANDONED,
    HANDLER_ERROR,
    HANDLER_FATAL,
    MISSING_REPORT,
    DUPLICATE_REPORT,
    INVALID_DIRECTIVE,
    UNAVAILABLE
};

const char* error_code_to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(const std::string& str);

// Routing faults the caller may retry later (capacity or breaker related)
bool is_retryable_routing_fault(ErrorCode code);

} // namespace mycelium::kernel
