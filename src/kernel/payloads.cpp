#include "kernel/payloads.hpp"

using json = nlohmann::json;

namespace mycelium::kernel {

json make_directive_payload(const std::string& action, json params, const std::string& target) {
    json payload;
    payload["action"] = action;
    payload["params"] = params.is_null() ? json::object() : std::move(params);
    if (!target.empty()) {
        payload["target"] = target;
    }
    return payload;
}

std::optional<DirectiveView> parse_directive(const json& payload) {
    if (!payload.is_object() || !payload.contains("action") || !payload["action"].is_string()) {
        return std::nullopt;
    }

    DirectiveView view;
    view.action = payload["action"].get<std::string>();
    if (view.action.empty()) {
        return std::nullopt;
    }
    if (payload.contains("params") && payload["params"].is_object()) {
        view.params = payload["params"];
    }
    if (payload.contains("target") && payload["target"].is_string()) {
        view.target = payload["target"].get<std::string>();
    }
    return view;
}

json make_success_payload(json data, json metrics) {
    json payload;
    payload["type"] = kReportResult;
    payload["status"] = "success";
    payload["data"] = std::move(data);
    payload["metrics"] = metrics.is_null() ? json::object() : std::move(metrics);
    return payload;
}

json make_failure_payload(const std::string& error_code, const std::string& message,
                          bool retryable, json metrics) {
    json payload;
    payload["type"] = kReportResult;
    payload["status"] = "failed";
    payload["error_code"] = error_code;
    payload["message"] = message;
    payload["retryable"] = retryable;
    payload["metrics"] = metrics.is_null() ? json::object() : std::move(metrics);
    return payload;
}

json make_failure_payload(ErrorCode code, const std::string& message, bool retryable, json metrics) {
    return make_failure_payload(error_code_to_string(code), message, retryable, std::move(metrics));
}

std::optional<ReportView> parse_report(const json& payload) {
    if (!payload.is_object() || !payload.contains("status") || !payload["status"].is_string()) {
        return std::nullopt;
    }

    ReportView view;
    std::string status = payload["status"].get<std::string>();
    if (status == "success") {
        view.status = ReportStatus::SUCCESS;
    } else if (status == "failed") {
        view.status = ReportStatus::FAILED;
    } else {
        return std::nullopt;
    }

    try {
        view.type = payload.value("type", std::string(kReportResult));
        if (payload.contains("data")) {
            view.data = payload["data"];
        }
        view.error_code = payload.value("error_code", std::string());
        view.message = payload.value("message", std::string());
        view.retryable = payload.value("retryable", false);
        if (payload.contains("metrics") && payload["metrics"].is_object()) {
            view.metrics = payload["metrics"];
        }
    } catch (const json::exception&) {
        return std::nullopt;
    }
    return view;
}

json make_event_payload(const std::string& name, json fields) {
    if (!fields.is_object()) {
        json wrapped;
        wrapped["data"] = std::move(fields);
        fields = std::move(wrapped);
    }
    fields["event"] = name;
    return fields;
}

std::string event_name(const json& payload) {
    if (!payload.is_object() || !payload.contains("event") || !payload["event"].is_string()) {
        return {};
    }
    return payload["event"].get<std::string>();
}

} // namespace mycelium::kernel
