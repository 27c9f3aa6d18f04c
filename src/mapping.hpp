#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace dbx_provision {

/// Human-readable error from a control-plane error body
/// ({"error_code": ..., "message": ...}).  Falls back to a truncated raw
/// body, or "" when there is nothing useful.
std::string extractApiErrorMessage(const ApiResponse& response);

/// The "error_code" field of an error body, or "" when absent.
std::string extractApiErrorCode(const ApiResponse& response);

/// Render a JSON id (string or integer) as a string; "" for anything else.
std::string idToString(const nlohmann::json& value);

nlohmann::json toJson(const CallRecord& record);

/// Structured record handed back to the calling layer.
nlohmann::json toJson(const ProvisionResult& result);

} // namespace dbx_provision
