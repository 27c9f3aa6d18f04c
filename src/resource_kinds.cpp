#include "resource_kinds.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace dbx_provision {

namespace {

constexpr const char* kClustersApi = "/api/2.0/clusters";
constexpr const char* kPoolsApi    = "/api/2.0/instance-pools";
constexpr const char* kJobsApi     = "/api/2.1/jobs";

ApiRequest post(const std::string& path, nlohmann::json body) {
    ApiRequest req;
    req.method = HttpMethod::Post;
    req.path   = path;
    req.body   = std::move(body);
    return req;
}

ApiRequest get(const std::string& path,
               std::vector<std::pair<std::string, std::string>> query = {}) {
    ApiRequest req;
    req.method = HttpMethod::Get;
    req.path   = path;
    req.query  = std::move(query);
    return req;
}

/// Throws when a status body lacks the identifier that proves the resource exists.
void requireField(const nlohmann::json& body, const char* field) {
    if (!body.is_object() || !body.contains(field)) {
        throw std::runtime_error(std::string("status body has no '") + field + "' field");
    }
}

/// Desired-spec name used for idempotency lookups, if any.
std::optional<std::string> specName(const nlohmann::json& spec, const char* field) {
    if (!spec.is_object() || !spec.contains(field) || !spec[field].is_string()) {
        return std::nullopt;
    }
    std::string name = spec[field].get<std::string>();
    if (name.empty()) return std::nullopt;
    return name;
}

/// Copy of @p spec with the identifier field set.
nlohmann::json withId(const nlohmann::json& spec, const char* idField, const std::string& id) {
    nlohmann::json body = spec.is_object() ? spec : nlohmann::json::object();
    body[idField] = idToJson(id);
    return body;
}

std::string idField(const ApiResponse& response, const char* field) {
    if (!response.parsed || !response.body.is_object() || !response.body.contains(field)) {
        return "";
    }
    return idToString(response.body[field]);
}

// --- cluster state mapping ---

OperationStatus clusterProvisionState(const std::string& state) {
    if (state == "RUNNING")                          return OperationStatus::Succeeded;
    if (state == "ERROR" || state == "TERMINATED")   return OperationStatus::Failed;
    if (state == "PENDING")                          return OperationStatus::Pending;
    if (state == "RESTARTING" || state == "RESIZING" ||
        state == "TERMINATING")                      return OperationStatus::Running;
    return OperationStatus::Unknown;
}

// --- instance pool state mapping ---

OperationStatus poolProvisionState(const std::string& state) {
    if (state == "ACTIVE")                           return OperationStatus::Succeeded;
    if (state == "STOPPED" || state == "DELETED")    return OperationStatus::Failed;
    return OperationStatus::Pending;
}

// --- job run life-cycle mapping ---

OperationStatus runProvisionState(const std::string& lifeCycle, const std::string& result) {
    if (lifeCycle == "TERMINATED") {
        return result == "SUCCESS" ? OperationStatus::Succeeded : OperationStatus::Failed;
    }
    if (lifeCycle == "SKIPPED" || lifeCycle == "INTERNAL_ERROR") {
        return OperationStatus::Failed;
    }
    if (lifeCycle == "RUNNING" || lifeCycle == "TERMINATING") {
        return OperationStatus::Running;
    }
    if (lifeCycle == "PENDING" || lifeCycle == "QUEUED" || lifeCycle == "BLOCKED" ||
        lifeCycle == "WAITING_FOR_RETRY") {
        return OperationStatus::Pending;
    }
    return OperationStatus::Unknown;
}

/// Scan a list response for entries whose @p nameField equals @p name.
/// A healthy match wins over a failed one.
template <class StateOf>
std::optional<ExistingResource> findByName(const ApiResponse& response,
                                           const char* listField,
                                           const char* nameField,
                                           const char* idFieldName,
                                           const std::string& name,
                                           StateOf stateOf)
{
    if (!response.parsed || !response.body.is_object() ||
        !response.body.contains(listField) || !response.body[listField].is_array()) {
        return std::nullopt;
    }

    std::optional<ExistingResource> failedMatch;
    for (const auto& entry : response.body[listField]) {
        if (!entry.is_object() || entry.value(nameField, std::string()) != name) continue;

        ExistingResource found;
        found.id = entry.contains(idFieldName) ? idToString(entry[idFieldName]) : "";
        if (found.id.empty()) continue;

        const StatusObservation obs = stateOf(entry);
        found.status    = obs.status;
        found.rawStatus = obs.rawStatus;

        if (found.status != OperationStatus::Failed) return found;
        if (!failedMatch) failedMatch = found;
    }
    return failedMatch;
}

} // namespace

nlohmann::json idToJson(const std::string& id) {
    if (!id.empty() && id.size() < 19 &&
        std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::stoll(id);
    }
    return id;
}

// ===========================================================================
// ClusterKind
// ===========================================================================

ApiRequest ClusterKind::createRequest(const nlohmann::json& spec) const {
    return post(std::string(kClustersApi) + "/create", spec);
}

std::string ClusterKind::extractId(const ApiResponse& response) const {
    return idField(response, "cluster_id");
}

ApiRequest ClusterKind::statusRequest(const std::string& id) const {
    return get(std::string(kClustersApi) + "/get", {{"cluster_id", id}});
}

StatusObservation ClusterKind::provisionStatus(const ApiResponse& response) const {
    const std::string state = response.body.at("state").get<std::string>();
    return {clusterProvisionState(state), state};
}

StatusObservation ClusterKind::teardownStatus(const ApiResponse& response) const {
    const std::string state = response.body.at("state").get<std::string>();
    if (state == "TERMINATED") return {OperationStatus::Succeeded, state};
    if (state == "ERROR")      return {OperationStatus::Failed, state};
    return {OperationStatus::Running, state};
}

ApiRequest ClusterKind::deleteRequest(const std::string& id) const {
    return post(std::string(kClustersApi) + "/permanent-delete", {{"cluster_id", id}});
}

std::optional<ApiRequest> ClusterKind::updateRequest(const std::string& id,
                                                     const nlohmann::json& spec) const {
    return post(std::string(kClustersApi) + "/edit", withId(spec, "cluster_id", id));
}

std::optional<ApiRequest> ClusterKind::lookupRequest(const nlohmann::json& spec) const {
    if (!specName(spec, "cluster_name")) return std::nullopt;
    return get(std::string(kClustersApi) + "/list");
}

std::optional<ExistingResource> ClusterKind::findExisting(const ApiResponse& response,
                                                          const nlohmann::json& spec) const {
    const auto name = specName(spec, "cluster_name");
    if (!name) return std::nullopt;
    return findByName(response, "clusters", "cluster_name", "cluster_id", *name,
                      [](const nlohmann::json& entry) {
                          const std::string state = entry.value("state", std::string("UNKNOWN"));
                          return StatusObservation{clusterProvisionState(state), state};
                      });
}

// ===========================================================================
// JobKind
// ===========================================================================

ApiRequest JobKind::createRequest(const nlohmann::json& spec) const {
    return post(std::string(kJobsApi) + "/create", spec);
}

std::string JobKind::extractId(const ApiResponse& response) const {
    return idField(response, "job_id");
}

ApiRequest JobKind::statusRequest(const std::string& id) const {
    return get(std::string(kJobsApi) + "/get", {{"job_id", id}});
}

StatusObservation JobKind::provisionStatus(const ApiResponse& response) const {
    const auto& body = response.body;
    if (body.is_object() && body.contains("job_id") && body.contains("settings")) {
        return {OperationStatus::Succeeded, "CREATED"};
    }
    if (!body.is_object()) {
        throw std::runtime_error("job status body is not an object");
    }
    return {OperationStatus::Pending, "PENDING"};
}

StatusObservation JobKind::teardownStatus(const ApiResponse& response) const {
    requireField(response.body, "job_id");
    return {OperationStatus::Running, "EXISTS"};
}

ApiRequest JobKind::deleteRequest(const std::string& id) const {
    return post(std::string(kJobsApi) + "/delete", {{"job_id", idToJson(id)}});
}

std::optional<ApiRequest> JobKind::updateRequest(const std::string& id,
                                                 const nlohmann::json& spec) const {
    return post(std::string(kJobsApi) + "/reset",
                {{"job_id", idToJson(id)}, {"new_settings", spec}});
}

std::optional<ApiRequest> JobKind::lookupRequest(const nlohmann::json& spec) const {
    const auto name = specName(spec, "name");
    if (!name) return std::nullopt;
    return get(std::string(kJobsApi) + "/list", {{"name", *name}});
}

std::optional<ExistingResource> JobKind::findExisting(const ApiResponse& response,
                                                      const nlohmann::json& spec) const {
    const auto name = specName(spec, "name");
    if (!name || !response.parsed || !response.body.is_object() ||
        !response.body.contains("jobs") || !response.body["jobs"].is_array()) {
        return std::nullopt;
    }

    for (const auto& job : response.body["jobs"]) {
        if (!job.is_object() || !job.contains("settings") || !job["settings"].is_object()) continue;
        if (job["settings"].value("name", std::string()) != *name) continue;

        ExistingResource found;
        found.id = job.contains("job_id") ? idToString(job["job_id"]) : "";
        if (found.id.empty()) continue;
        found.status    = OperationStatus::Succeeded;
        found.rawStatus = "CREATED";
        return found;
    }
    return std::nullopt;
}

// ===========================================================================
// InstancePoolKind
// ===========================================================================

ApiRequest InstancePoolKind::createRequest(const nlohmann::json& spec) const {
    return post(std::string(kPoolsApi) + "/create", spec);
}

std::string InstancePoolKind::extractId(const ApiResponse& response) const {
    return idField(response, "instance_pool_id");
}

ApiRequest InstancePoolKind::statusRequest(const std::string& id) const {
    return get(std::string(kPoolsApi) + "/get", {{"instance_pool_id", id}});
}

StatusObservation InstancePoolKind::provisionStatus(const ApiResponse& response) const {
    const std::string state = response.body.at("state").get<std::string>();
    return {poolProvisionState(state), state};
}

StatusObservation InstancePoolKind::teardownStatus(const ApiResponse& response) const {
    const std::string state = response.body.at("state").get<std::string>();
    if (state == "DELETED") return {OperationStatus::Succeeded, state};
    return {OperationStatus::Running, state};
}

ApiRequest InstancePoolKind::deleteRequest(const std::string& id) const {
    return post(std::string(kPoolsApi) + "/delete", {{"instance_pool_id", id}});
}

std::optional<ApiRequest> InstancePoolKind::updateRequest(const std::string& id,
                                                          const nlohmann::json& spec) const {
    return post(std::string(kPoolsApi) + "/edit", withId(spec, "instance_pool_id", id));
}

std::optional<ApiRequest> InstancePoolKind::lookupRequest(const nlohmann::json& spec) const {
    if (!specName(spec, "instance_pool_name")) return std::nullopt;
    return get(std::string(kPoolsApi) + "/list");
}

std::optional<ExistingResource> InstancePoolKind::findExisting(const ApiResponse& response,
                                                               const nlohmann::json& spec) const {
    const auto name = specName(spec, "instance_pool_name");
    if (!name) return std::nullopt;
    return findByName(response, "instance_pools", "instance_pool_name", "instance_pool_id", *name,
                      [](const nlohmann::json& entry) {
                          const std::string state = entry.value("state", std::string("UNKNOWN"));
                          return StatusObservation{poolProvisionState(state), state};
                      });
}

// ===========================================================================
// JobRunKind
// ===========================================================================

ApiRequest JobRunKind::createRequest(const nlohmann::json& spec) const {
    return post(std::string(kJobsApi) + "/run-now", spec);
}

std::string JobRunKind::extractId(const ApiResponse& response) const {
    return idField(response, "run_id");
}

ApiRequest JobRunKind::statusRequest(const std::string& id) const {
    return get(std::string(kJobsApi) + "/runs/get", {{"run_id", id}});
}

StatusObservation JobRunKind::provisionStatus(const ApiResponse& response) const {
    const auto& state = response.body.at("state");
    const std::string lifeCycle = state.at("life_cycle_state").get<std::string>();
    const std::string result    = state.value("result_state", std::string());

    std::string raw = lifeCycle;
    if (!result.empty()) raw += "/" + result;
    return {runProvisionState(lifeCycle, result), raw};
}

StatusObservation JobRunKind::teardownStatus(const ApiResponse& response) const {
    requireField(response.body, "run_id");
    return {OperationStatus::Running, "EXISTS"};
}

ApiRequest JobRunKind::deleteRequest(const std::string& id) const {
    return post(std::string(kJobsApi) + "/runs/delete", {{"run_id", idToJson(id)}});
}

std::optional<ApiRequest> JobRunKind::updateRequest(const std::string&,
                                                    const nlohmann::json&) const {
    return std::nullopt;
}

std::optional<ApiRequest> JobRunKind::lookupRequest(const nlohmann::json&) const {
    return std::nullopt;
}

std::optional<ExistingResource> JobRunKind::findExisting(const ApiResponse&,
                                                         const nlohmann::json&) const {
    return std::nullopt;
}

// ===========================================================================
// Dispatch helpers
// ===========================================================================

const char* kindName(const ResourceKind& kind) {
    return std::visit([](const auto& k) { return std::decay_t<decltype(k)>::kName; }, kind);
}

ResourceKind parseResourceKind(const std::string& name) {
    if (name == "cluster")                         return ClusterKind{};
    if (name == "job")                             return JobKind{};
    if (name == "instance-pool" || name == "pool") return InstancePoolKind{};
    if (name == "job-run" || name == "run")        return JobRunKind{};
    throw ConfigurationError("Unknown resource kind: " + name);
}

} // namespace dbx_provision
