#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace dbx_provision {

// Every kind exposes the same set of members; ResourceOrchestrator reaches
// them through std::visit.
//
//   createRequest(spec)            request that creates the resource
//   extractId(createResponse)      new identifier, "" when absent
//   statusRequest(id)              request that reads the current state
//   provisionStatus(response)      state mapping while creating / updating
//   teardownStatus(response)       state mapping while deleting
//   deleteRequest(id)
//   updateRequest(id, spec)        nullopt when the kind cannot be updated
//   lookupRequest(spec)            nullopt when no name lookup is possible
//   findExisting(response, spec)   match by name in a list response
//
// Extractors throw nlohmann::json::exception on an unexpected shape.

/// Compute cluster (clusters API 2.0).
struct ClusterKind {
    static constexpr const char* kName = "cluster";

    ApiRequest                      createRequest(const nlohmann::json& spec) const;
    std::string                     extractId(const ApiResponse& response) const;
    ApiRequest                      statusRequest(const std::string& id) const;
    StatusObservation               provisionStatus(const ApiResponse& response) const;
    StatusObservation               teardownStatus(const ApiResponse& response) const;
    ApiRequest                      deleteRequest(const std::string& id) const;
    std::optional<ApiRequest>       updateRequest(const std::string& id, const nlohmann::json& spec) const;
    std::optional<ApiRequest>       lookupRequest(const nlohmann::json& spec) const;
    std::optional<ExistingResource> findExisting(const ApiResponse& response, const nlohmann::json& spec) const;
};

/// Job definition (jobs API 2.1).  Creation is synchronous, so the status
/// check only confirms the job is readable.
struct JobKind {
    static constexpr const char* kName = "job";

    ApiRequest                      createRequest(const nlohmann::json& spec) const;
    std::string                     extractId(const ApiResponse& response) const;
    ApiRequest                      statusRequest(const std::string& id) const;
    StatusObservation               provisionStatus(const ApiResponse& response) const;
    StatusObservation               teardownStatus(const ApiResponse& response) const;
    ApiRequest                      deleteRequest(const std::string& id) const;
    std::optional<ApiRequest>       updateRequest(const std::string& id, const nlohmann::json& spec) const;
    std::optional<ApiRequest>       lookupRequest(const nlohmann::json& spec) const;
    std::optional<ExistingResource> findExisting(const ApiResponse& response, const nlohmann::json& spec) const;
};

/// Instance pool (instance-pools API 2.0).
struct InstancePoolKind {
    static constexpr const char* kName = "instance-pool";

    ApiRequest                      createRequest(const nlohmann::json& spec) const;
    std::string                     extractId(const ApiResponse& response) const;
    ApiRequest                      statusRequest(const std::string& id) const;
    StatusObservation               provisionStatus(const ApiResponse& response) const;
    StatusObservation               teardownStatus(const ApiResponse& response) const;
    ApiRequest                      deleteRequest(const std::string& id) const;
    std::optional<ApiRequest>       updateRequest(const std::string& id, const nlohmann::json& spec) const;
    std::optional<ApiRequest>       lookupRequest(const nlohmann::json& spec) const;
    std::optional<ExistingResource> findExisting(const ApiResponse& response, const nlohmann::json& spec) const;
};

/// One run of an existing job, started with run-now and followed through
/// its life-cycle state.
struct JobRunKind {
    static constexpr const char* kName = "job-run";

    ApiRequest                      createRequest(const nlohmann::json& spec) const;
    std::string                     extractId(const ApiResponse& response) const;
    ApiRequest                      statusRequest(const std::string& id) const;
    StatusObservation               provisionStatus(const ApiResponse& response) const;
    StatusObservation               teardownStatus(const ApiResponse& response) const;
    ApiRequest                      deleteRequest(const std::string& id) const;
    std::optional<ApiRequest>       updateRequest(const std::string& id, const nlohmann::json& spec) const;
    std::optional<ApiRequest>       lookupRequest(const nlohmann::json& spec) const;
    std::optional<ExistingResource> findExisting(const ApiResponse& response, const nlohmann::json& spec) const;
};

using ResourceKind = std::variant<ClusterKind, JobKind, InstancePoolKind, JobRunKind>;

const char* kindName(const ResourceKind& kind);

/// Accepts "cluster", "job", "instance-pool" / "pool", "job-run" / "run".
/// @throws ConfigurationError for anything else.
ResourceKind parseResourceKind(const std::string& name);

/// JSON form of an identifier: numeric ids (jobs, runs) become integers.
nlohmann::json idToJson(const std::string& id);

} // namespace dbx_provision
