#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"

namespace mycelium::kernel {

// Event names carried in event payloads under "event"
constexpr const char* kEventAgentUnhealthy = "agent-unhealthy";
constexpr const char* kEventAgentFatal = "agent-fatal";
constexpr const char* kEventSystemAlert = "system-alert";

// Report payload "type" values
constexpr const char* kReportResult = "result";
constexpr const char* kReportSummary = "summary";
constexpr const char* kReportCapacity = "capacity";

// Directive payload: {"action": name, "params": {...}, "target": optional id}
struct DirectiveView {
    std::string action;
    nlohmann::json params = nlohmann::json::object();
    std::optional<std::string> target;
};

nlohmann::json make_directive_payload(const std::string& action,
                                      nlohmann::json params = nlohmann::json::object(),
                                      const std::string& target = "");
std::optional<DirectiveView> parse_directive(const nlohmann::json& payload);

enum class ReportStatus { SUCCESS, FAILED };

// Report payload: {status, data | (error_code, message, retryable), metrics, type}
struct ReportView {
    ReportStatus status = ReportStatus::FAILED;
    std::string type = kReportResult;
    nlohmann::json data;
    std::string error_code;
    std::string message;
    bool retryable = false;
    nlohmann::json metrics = nlohmann::json::object();

    bool ok() const { return status == ReportStatus::SUCCESS; }
};

nlohmann::json make_success_payload(nlohmann::json data,
                                    nlohmann::json metrics = nlohmann::json::object());
nlohmann::json make_failure_payload(const std::string& error_code,
                                    const std::string& message,
                                    bool retryable,
                                    nlohmann::json metrics = nlohmann::json::object());
nlohmann::json make_failure_payload(ErrorCode code,
                                    const std::string& message,
                                    bool retryable,
                                    nlohmann::json metrics = nlohmann::json::object());
std::optional<ReportView> parse_report(const nlohmann::json& payload);

// Event payload: the free-form fields plus "event": name
nlohmann::json make_event_payload(const std::string& name,
                                  nlohmann::json fields = nlohmann::json::object());
std::string event_name(const nlohmann::json& payload);

} // namespace mycelium::kernel
