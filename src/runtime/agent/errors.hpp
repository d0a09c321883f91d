#pragma once
#include <stdexcept>
#include <string>
#include "kernel/errors.hpp"

namespace mycelium::runtime {

// Recoverable handler failure. The runtime turns it into a failed report
// carrying code() and retryable().
class AgentError : public std::runtime_error {
public:
    AgentError(const std::string& code, const std::string& message, bool retryable = false)
        : std::runtime_error(message)
        , code_(code)
        , retryable_(retryable) {}

    AgentError(kernel::ErrorCode code, const std::string& message, bool retryable = false)
        : AgentError(std::string(kernel::error_code_to_string(code)), message, retryable) {}

    const std::string& code() const { return code_; }
    bool retryable() const { return retryable_; }

private:
    std::string code_;
    bool retryable_;
};

// Transient infrastructure failure; always retryable
class TransientError : public AgentError {
public:
    explicit TransientError(const std::string& message)
        : AgentError(kernel::ErrorCode::UNAVAILABLE, message, true) {}
};

// Unrecoverable failure: the agent moves to STOPPED and its parent is notified
class FatalAgentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace mycelium::runtime
