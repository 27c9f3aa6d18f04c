/// @file test_resource_kinds.cpp
/// Unit tests for resource_kinds.hpp: REST request shapes and state mapping.

#include "resource_kinds.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace dbx_provision;
using json = nlohmann::json;

namespace {

ApiResponse ok(const json& body) {
    ApiResponse resp;
    resp.httpStatus = 200;
    resp.body       = body;
    resp.rawBody    = body.dump();
    resp.parsed     = true;
    return resp;
}

std::string queryValue(const ApiRequest& req, const std::string& name) {
    for (const auto& [key, value] : req.query) {
        if (key == name) return value;
    }
    return "";
}

OperationStatus clusterState(const std::string& state) {
    return ClusterKind{}.provisionStatus(ok({{"state", state}})).status;
}

OperationStatus poolState(const std::string& state) {
    return InstancePoolKind{}.provisionStatus(ok({{"state", state}})).status;
}

OperationStatus runState(const std::string& lifeCycle, const std::string& result = "") {
    json state = {{"life_cycle_state", lifeCycle}};
    if (!result.empty()) state["result_state"] = result;
    return JobRunKind{}.provisionStatus(ok({{"run_id", 7}, {"state", state}})).status;
}

} // namespace

// ============================================================================
// ClusterKind
// ============================================================================

TEST(ClusterKind, RequestShapes) {
    ClusterKind k;
    json spec = {{"cluster_name", "etl"}, {"spark_version", "14.3.x-scala2.12"}};

    auto create = k.createRequest(spec);
    EXPECT_EQ(create.method, HttpMethod::Post);
    EXPECT_EQ(create.path, "/api/2.0/clusters/create");
    ASSERT_TRUE(create.body.has_value());
    EXPECT_EQ(*create.body, spec);

    auto status = k.statusRequest("0123-abc");
    EXPECT_EQ(status.method, HttpMethod::Get);
    EXPECT_EQ(status.path, "/api/2.0/clusters/get");
    EXPECT_EQ(queryValue(status, "cluster_id"), "0123-abc");

    auto del = k.deleteRequest("0123-abc");
    EXPECT_EQ(del.path, "/api/2.0/clusters/permanent-delete");
    EXPECT_EQ((*del.body)["cluster_id"], "0123-abc");

    auto edit = k.updateRequest("0123-abc", spec);
    ASSERT_TRUE(edit.has_value());
    EXPECT_EQ(edit->path, "/api/2.0/clusters/edit");
    EXPECT_EQ((*edit->body)["cluster_id"], "0123-abc");
    EXPECT_EQ((*edit->body)["spark_version"], "14.3.x-scala2.12");
}

TEST(ClusterKind, ExtractsId) {
    ClusterKind k;
    EXPECT_EQ(k.extractId(ok({{"cluster_id", "0123-abc"}})), "0123-abc");
    EXPECT_EQ(k.extractId(ok(json::object())), "");

    ApiResponse raw;
    raw.rawBody = "created";
    EXPECT_EQ(k.extractId(raw), "");
}

TEST(ClusterKind, ProvisionStateMapping) {
    EXPECT_EQ(clusterState("RUNNING"), OperationStatus::Succeeded);
    EXPECT_EQ(clusterState("ERROR"), OperationStatus::Failed);
    EXPECT_EQ(clusterState("TERMINATED"), OperationStatus::Failed);
    EXPECT_EQ(clusterState("PENDING"), OperationStatus::Pending);
    EXPECT_EQ(clusterState("RESTARTING"), OperationStatus::Running);
    EXPECT_EQ(clusterState("RESIZING"), OperationStatus::Running);
    EXPECT_EQ(clusterState("TERMINATING"), OperationStatus::Running);
    EXPECT_EQ(clusterState("SOMETHING_NEW"), OperationStatus::Unknown);
}

TEST(ClusterKind, RawStatusIsPreserved) {
    auto obs = ClusterKind{}.provisionStatus(ok({{"state", "ERROR"}}));
    EXPECT_EQ(obs.rawStatus, "ERROR");
}

TEST(ClusterKind, TeardownStateMapping) {
    ClusterKind k;
    EXPECT_EQ(k.teardownStatus(ok({{"state", "TERMINATED"}})).status, OperationStatus::Succeeded);
    EXPECT_EQ(k.teardownStatus(ok({{"state", "ERROR"}})).status, OperationStatus::Failed);
    EXPECT_EQ(k.teardownStatus(ok({{"state", "TERMINATING"}})).status, OperationStatus::Running);
}

TEST(ClusterKind, MissingStateThrows) {
    EXPECT_THROW(ClusterKind{}.provisionStatus(ok({{"cluster_id", "x"}})), json::exception);
}

TEST(ClusterKind, LookupRequiresName) {
    ClusterKind k;
    EXPECT_FALSE(k.lookupRequest(json::object()).has_value());
    EXPECT_FALSE(k.lookupRequest({{"cluster_name", ""}}).has_value());

    auto lookup = k.lookupRequest({{"cluster_name", "etl"}});
    ASSERT_TRUE(lookup.has_value());
    EXPECT_EQ(lookup->path, "/api/2.0/clusters/list");
}

TEST(ClusterKind, FindExistingPrefersHealthyMatch) {
    ClusterKind k;
    json list = {{"clusters", {
        {{"cluster_id", "c-old"}, {"cluster_name", "etl"}, {"state", "ERROR"}},
        {{"cluster_id", "c-other"}, {"cluster_name", "adhoc"}, {"state", "RUNNING"}},
        {{"cluster_id", "c-new"}, {"cluster_name", "etl"}, {"state", "PENDING"}}
    }}};

    auto found = k.findExisting(ok(list), {{"cluster_name", "etl"}});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "c-new");
    EXPECT_EQ(found->status, OperationStatus::Pending);
    EXPECT_EQ(found->rawStatus, "PENDING");
}

TEST(ClusterKind, FindExistingReportsFailedMatchWhenOnlyOne) {
    ClusterKind k;
    json list = {{"clusters", {
        {{"cluster_id", "c-old"}, {"cluster_name", "etl"}, {"state", "ERROR"}}
    }}};

    auto found = k.findExisting(ok(list), {{"cluster_name", "etl"}});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->status, OperationStatus::Failed);
}

TEST(ClusterKind, FindExistingWithoutMatch) {
    ClusterKind k;
    EXPECT_FALSE(k.findExisting(ok(json::object()), {{"cluster_name", "etl"}}).has_value());
    EXPECT_FALSE(k.findExisting(ok({{"clusters", json::array()}}),
                                {{"cluster_name", "etl"}}).has_value());
}

// ============================================================================
// JobKind
// ============================================================================

TEST(JobKind, RequestShapes) {
    JobKind k;
    json settings = {{"name", "nightly"}, {"tasks", json::array()}};

    EXPECT_EQ(k.createRequest(settings).path, "/api/2.1/jobs/create");

    auto status = k.statusRequest("42");
    EXPECT_EQ(status.path, "/api/2.1/jobs/get");
    EXPECT_EQ(queryValue(status, "job_id"), "42");

    auto del = k.deleteRequest("42");
    EXPECT_EQ(del.path, "/api/2.1/jobs/delete");
    EXPECT_EQ((*del.body)["job_id"], 42);

    auto reset = k.updateRequest("42", settings);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(reset->path, "/api/2.1/jobs/reset");
    EXPECT_EQ((*reset->body)["job_id"], 42);
    EXPECT_EQ((*reset->body)["new_settings"], settings);
}

TEST(JobKind, NumericIdIsRenderedAsString) {
    EXPECT_EQ(JobKind{}.extractId(ok({{"job_id", 1234567}})), "1234567");
}

TEST(JobKind, ReadableJobIsSucceeded) {
    JobKind k;
    auto obs = k.provisionStatus(ok({{"job_id", 42}, {"settings", {{"name", "nightly"}}}}));
    EXPECT_EQ(obs.status, OperationStatus::Succeeded);
    EXPECT_EQ(k.provisionStatus(ok({{"job_id", 42}})).status, OperationStatus::Pending);
    EXPECT_THROW(k.provisionStatus(ok(json::array())), std::runtime_error);
}

TEST(JobKind, TeardownSeesExistingJobAsRunning) {
    EXPECT_EQ(JobKind{}.teardownStatus(ok({{"job_id", 42}})).status, OperationStatus::Running);
}

TEST(JobKind, TeardownRejectsBodyWithoutJobId) {
    EXPECT_THROW(JobKind{}.teardownStatus(ok({{"settings", json::object()}})), std::runtime_error);
    EXPECT_THROW(JobKind{}.teardownStatus(ok(json("gone"))), std::runtime_error);
}

TEST(JobKind, LookupFiltersByName) {
    JobKind k;
    auto lookup = k.lookupRequest({{"name", "nightly etl"}});
    ASSERT_TRUE(lookup.has_value());
    EXPECT_EQ(lookup->path, "/api/2.1/jobs/list");
    EXPECT_EQ(queryValue(*lookup, "name"), "nightly etl");

    json list = {{"jobs", {
        {{"job_id", 1}, {"settings", {{"name", "other"}}}},
        {{"job_id", 2}, {"settings", {{"name", "nightly etl"}}}}
    }}};
    auto found = k.findExisting(ok(list), {{"name", "nightly etl"}});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "2");
    EXPECT_EQ(found->status, OperationStatus::Succeeded);
}

// ============================================================================
// InstancePoolKind
// ============================================================================

TEST(InstancePoolKind, RequestShapes) {
    InstancePoolKind k;
    EXPECT_EQ(k.createRequest({{"instance_pool_name", "p"}}).path,
              "/api/2.0/instance-pools/create");
    EXPECT_EQ(queryValue(k.statusRequest("p-1"), "instance_pool_id"), "p-1");
    EXPECT_EQ(k.deleteRequest("p-1").path, "/api/2.0/instance-pools/delete");
    EXPECT_EQ(k.updateRequest("p-1", json::object())->path, "/api/2.0/instance-pools/edit");
    EXPECT_EQ(k.extractId(ok({{"instance_pool_id", "p-1"}})), "p-1");
}

TEST(InstancePoolKind, StateMapping) {
    EXPECT_EQ(poolState("ACTIVE"), OperationStatus::Succeeded);
    EXPECT_EQ(poolState("STOPPED"), OperationStatus::Failed);
    EXPECT_EQ(poolState("DELETED"), OperationStatus::Failed);
    EXPECT_EQ(poolState("PENDING"), OperationStatus::Pending);

    InstancePoolKind k;
    EXPECT_EQ(k.teardownStatus(ok({{"state", "DELETED"}})).status, OperationStatus::Succeeded);
    EXPECT_EQ(k.teardownStatus(ok({{"state", "ACTIVE"}})).status, OperationStatus::Running);
}

TEST(InstancePoolKind, FindExistingByPoolName) {
    json list = {{"instance_pools", {
        {{"instance_pool_id", "p-1"}, {"instance_pool_name", "warm"}, {"state", "ACTIVE"}}
    }}};
    auto found = InstancePoolKind{}.findExisting(ok(list), {{"instance_pool_name", "warm"}});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "p-1");
    EXPECT_EQ(found->status, OperationStatus::Succeeded);
}

// ============================================================================
// JobRunKind
// ============================================================================

TEST(JobRunKind, RequestShapes) {
    JobRunKind k;
    EXPECT_EQ(k.createRequest({{"job_id", 42}}).path, "/api/2.1/jobs/run-now");
    EXPECT_EQ(k.statusRequest("7").path, "/api/2.1/jobs/runs/get");
    EXPECT_EQ(queryValue(k.statusRequest("7"), "run_id"), "7");
    EXPECT_EQ(k.deleteRequest("7").path, "/api/2.1/jobs/runs/delete");
    EXPECT_EQ(k.extractId(ok({{"run_id", 7}, {"number_in_job", 7}})), "7");
}

TEST(JobRunKind, LifeCycleMapping) {
    EXPECT_EQ(runState("TERMINATED", "SUCCESS"), OperationStatus::Succeeded);
    EXPECT_EQ(runState("TERMINATED", "FAILED"), OperationStatus::Failed);
    EXPECT_EQ(runState("TERMINATED", "CANCELED"), OperationStatus::Failed);
    EXPECT_EQ(runState("SKIPPED"), OperationStatus::Failed);
    EXPECT_EQ(runState("INTERNAL_ERROR"), OperationStatus::Failed);
    EXPECT_EQ(runState("RUNNING"), OperationStatus::Running);
    EXPECT_EQ(runState("TERMINATING"), OperationStatus::Running);
    EXPECT_EQ(runState("PENDING"), OperationStatus::Pending);
    EXPECT_EQ(runState("QUEUED"), OperationStatus::Pending);
    EXPECT_EQ(runState("BLOCKED"), OperationStatus::Pending);
    EXPECT_EQ(runState("WAITING_FOR_RETRY"), OperationStatus::Pending);
}

TEST(JobRunKind, RawStatusCombinesResult) {
    auto obs = JobRunKind{}.provisionStatus(
        ok({{"state", {{"life_cycle_state", "TERMINATED"}, {"result_state", "FAILED"}}}}));
    EXPECT_EQ(obs.rawStatus, "TERMINATED/FAILED");
}

TEST(JobRunKind, TeardownRequiresRunId) {
    EXPECT_EQ(JobRunKind{}.teardownStatus(ok({{"run_id", 7}})).status, OperationStatus::Running);
    EXPECT_THROW(JobRunKind{}.teardownStatus(ok({{"job_id", 42}})), std::runtime_error);
}

TEST(JobRunKind, NoUpdateOrLookup) {
    JobRunKind k;
    EXPECT_FALSE(k.updateRequest("7", json::object()).has_value());
    EXPECT_FALSE(k.lookupRequest({{"name", "x"}}).has_value());
}

// ============================================================================
// Dispatch helpers
// ============================================================================

TEST(ParseResourceKind, KnownNamesAndAliases) {
    EXPECT_STREQ(kindName(parseResourceKind("cluster")), "cluster");
    EXPECT_STREQ(kindName(parseResourceKind("job")), "job");
    EXPECT_STREQ(kindName(parseResourceKind("instance-pool")), "instance-pool");
    EXPECT_STREQ(kindName(parseResourceKind("pool")), "instance-pool");
    EXPECT_STREQ(kindName(parseResourceKind("job-run")), "job-run");
    EXPECT_STREQ(kindName(parseResourceKind("run")), "job-run");
}

TEST(ParseResourceKind, UnknownNameIsConfigurationError) {
    EXPECT_THROW(parseResourceKind("warehouse"), ConfigurationError);
    EXPECT_THROW(parseResourceKind(""), ConfigurationError);
}

TEST(IdToJson, NumericIdsBecomeIntegers) {
    EXPECT_EQ(idToJson("42"), json(42));
    EXPECT_EQ(idToJson("0123-456789-abc"), json("0123-456789-abc"));
    EXPECT_EQ(idToJson(""), json(""));
}
