/// @file test_mapping.cpp
/// Unit tests for mapping.hpp: error-body extraction and result serialization.

#include "mapping.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace dbx_provision;
using json = nlohmann::json;

namespace {

ApiResponse jsonResponse(unsigned int status, const json& body) {
    ApiResponse resp;
    resp.httpStatus = status;
    resp.body       = body;
    resp.rawBody    = body.dump();
    resp.parsed     = true;
    return resp;
}

ApiResponse rawResponse(unsigned int status, const std::string& body) {
    ApiResponse resp;
    resp.httpStatus = status;
    resp.rawBody    = body;
    return resp;
}

} // namespace

// ============================================================================
// extractApiErrorMessage / extractApiErrorCode
// ============================================================================

TEST(ExtractApiErrorMessage, CodeAndMessage) {
    auto resp = jsonResponse(400, {{"error_code", "INVALID_PARAMETER_VALUE"},
                                   {"message", "Missing required field: spark_version"}});
    EXPECT_EQ(extractApiErrorMessage(resp),
              "INVALID_PARAMETER_VALUE: Missing required field: spark_version");
    EXPECT_EQ(extractApiErrorCode(resp), "INVALID_PARAMETER_VALUE");
}

TEST(ExtractApiErrorMessage, CodeOnly) {
    auto resp = jsonResponse(429, {{"error_code", "REQUEST_LIMIT_EXCEEDED"}});
    EXPECT_EQ(extractApiErrorMessage(resp), "REQUEST_LIMIT_EXCEEDED");
}

TEST(ExtractApiErrorMessage, ErrorFieldFallback) {
    auto resp = jsonResponse(401, {{"error", "invalid_token"}});
    EXPECT_EQ(extractApiErrorMessage(resp), "invalid_token");
    EXPECT_EQ(extractApiErrorCode(resp), "");
}

TEST(ExtractApiErrorMessage, RawBodyWhenNotJson) {
    EXPECT_EQ(extractApiErrorMessage(rawResponse(502, "Bad Gateway")), "Bad Gateway");
    EXPECT_EQ(extractApiErrorCode(rawResponse(502, "Bad Gateway")), "");
}

TEST(ExtractApiErrorMessage, LongRawBodyIsTruncated) {
    const std::string page(1000, 'x');
    auto msg = extractApiErrorMessage(rawResponse(502, page));
    EXPECT_EQ(msg.substr(0, 200), page.substr(0, 200));
    EXPECT_NE(msg.find("(truncated)"), std::string::npos);
    EXPECT_LT(msg.size(), page.size());
}

TEST(ExtractApiErrorMessage, NothingUseful) {
    EXPECT_EQ(extractApiErrorMessage(rawResponse(500, "")), "");
}

TEST(ExtractApiErrorCode, NonStringCodeIgnored) {
    EXPECT_EQ(extractApiErrorCode(jsonResponse(400, {{"error_code", 17}})), "");
}

// ============================================================================
// idToString
// ============================================================================

TEST(IdToString, StringsIntegersAndOthers) {
    EXPECT_EQ(idToString(json("0123-abc")), "0123-abc");
    EXPECT_EQ(idToString(json(1234567890123LL)), "1234567890123");
    EXPECT_EQ(idToString(json(nullptr)), "");
    EXPECT_EQ(idToString(json(1.5)), "");
}

// ============================================================================
// toJson
// ============================================================================

TEST(ToJson, StatusNames) {
    EXPECT_STREQ(toString(OperationStatus::Succeeded), "SUCCEEDED");
    EXPECT_STREQ(toString(OperationStatus::TimedOut), "TIMED_OUT");
    EXPECT_STREQ(toString(OperationStatus::Unknown), "UNKNOWN");
    EXPECT_STREQ(toString(HttpMethod::Post), "POST");
}

TEST(ToJson, SuccessfulResult) {
    ProvisionResult result;
    result.resourceKind = "cluster";
    result.operation    = "create";
    result.resourceId   = "c-1";
    result.status       = OperationStatus::Succeeded;

    CallRecord call;
    call.method     = HttpMethod::Post;
    call.path       = "/api/2.0/clusters/create";
    call.httpStatus = 200;
    call.outcome    = "Success";
    result.calls.push_back(call);

    auto out = toJson(result);
    EXPECT_EQ(out["resource_kind"], "cluster");
    EXPECT_EQ(out["operation"], "create");
    EXPECT_EQ(out["resource_id"], "c-1");
    EXPECT_EQ(out["status"], "SUCCEEDED");
    EXPECT_EQ(out["reused_existing"], false);
    EXPECT_TRUE(out["error"].is_null());
    EXPECT_TRUE(out["cleanup_error"].is_null());

    ASSERT_EQ(out["calls"].size(), 1u);
    EXPECT_EQ(out["calls"][0]["method"], "POST");
    EXPECT_EQ(out["calls"][0]["http_status"], 200);
    EXPECT_EQ(out["calls"][0]["attempt"], 1);
    EXPECT_EQ(out["calls"][0]["outcome"], "Success");
}

TEST(ToJson, FailedResultCarriesDiagnostics) {
    ProvisionResult result;
    result.resourceKind = "instance-pool";
    result.operation    = "create";
    result.resourceId   = "p-1";
    result.status       = OperationStatus::Failed;

    ErrorDetail detail;
    detail.category           = "ResourceState";
    detail.kind               = "Failed";
    detail.message            = "instance-pool p-1 reached terminal state STOPPED";
    detail.lastHttpStatus     = 200;
    detail.lastObservedStatus = "STOPPED";
    detail.attempts           = 4;
    result.error        = detail;
    result.cleanupError = "Cleanup delete of instance-pool p-1 failed: HTTP 403";

    auto out = toJson(result);
    EXPECT_EQ(out["status"], "FAILED");
    EXPECT_TRUE(out["calls"].is_array());
    EXPECT_EQ(out["error"]["category"], "ResourceState");
    EXPECT_EQ(out["error"]["kind"], "Failed");
    EXPECT_EQ(out["error"]["last_http_status"], 200);
    EXPECT_EQ(out["error"]["last_observed_status"], "STOPPED");
    EXPECT_EQ(out["error"]["attempts"], 4);
    EXPECT_EQ(out["cleanup_error"], "Cleanup delete of instance-pool p-1 failed: HTTP 403");
}
