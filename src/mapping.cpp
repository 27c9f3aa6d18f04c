#include "mapping.hpp"

namespace dbx_provision {

const char* toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "GET";
}

const char* toString(OperationStatus status) {
    switch (status) {
        case OperationStatus::Pending:   return "PENDING";
        case OperationStatus::Running:   return "RUNNING";
        case OperationStatus::Succeeded: return "SUCCEEDED";
        case OperationStatus::Failed:    return "FAILED";
        case OperationStatus::TimedOut:  return "TIMED_OUT";
        case OperationStatus::Unknown:   return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string extractApiErrorMessage(const ApiResponse& response) {
    if (response.parsed && response.body.is_object()) {
        const auto& body = response.body;
        std::string code = body.contains("error_code") && body["error_code"].is_string()
                         ? body["error_code"].get<std::string>() : "";
        std::string msg  = body.contains("message") && body["message"].is_string()
                         ? body["message"].get<std::string>() : "";
        if (msg.empty() && body.contains("error") && body["error"].is_string()) {
            msg = body["error"].get<std::string>();
        }
        if (!code.empty() && !msg.empty()) return code + ": " + msg;
        if (!code.empty()) return code;
        if (!msg.empty())  return msg;
    }

    if (!response.rawBody.empty()) {
        if (response.rawBody.size() <= 200) return response.rawBody;
        return response.rawBody.substr(0, 200) + " ...(truncated)";
    }
    return "";
}

std::string extractApiErrorCode(const ApiResponse& response) {
    if (response.parsed && response.body.is_object() &&
        response.body.contains("error_code") &&
        response.body["error_code"].is_string()) {
        return response.body["error_code"].get<std::string>();
    }
    return "";
}

std::string idToString(const nlohmann::json& value) {
    if (value.is_string())          return value.get<std::string>();
    if (value.is_number_integer())  return std::to_string(value.get<long long>());
    return "";
}

nlohmann::json toJson(const CallRecord& record) {
    return {
        {"method", toString(record.method)},
        {"path", record.path},
        {"attempt", record.attempt},
        {"http_status", record.httpStatus},
        {"outcome", record.outcome},
        {"message", record.message}
    };
}

nlohmann::json toJson(const ProvisionResult& result) {
    nlohmann::json out;
    out["resource_kind"]   = result.resourceKind;
    out["operation"]       = result.operation;
    out["resource_id"]     = result.resourceId;
    out["status"]          = toString(result.status);
    out["reused_existing"] = result.reusedExisting;

    out["calls"] = nlohmann::json::array();
    for (const auto& call : result.calls) {
        out["calls"].push_back(toJson(call));
    }

    if (result.error) {
        const auto& e = *result.error;
        out["error"] = {
            {"category", e.category},
            {"kind", e.kind},
            {"message", e.message},
            {"last_http_status", e.lastHttpStatus},
            {"last_observed_status", e.lastObservedStatus},
            {"attempts", e.attempts}
        };
    } else {
        out["error"] = nullptr;
    }

    if (result.cleanupError) {
        out["cleanup_error"] = *result.cleanupError;
    } else {
        out["cleanup_error"] = nullptr;
    }
    return out;
}

} // namespace dbx_provision
