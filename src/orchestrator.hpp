#pragma once

#include "auth_context.hpp"
#include "cancellation.hpp"
#include "models.hpp"
#include "poller.hpp"
#include "request_executor.hpp"
#include "resource_kinds.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace dbx_provision {

struct OrchestratorOptions {
    RetryOptions retry;
    PollOptions  poll;

    /// Overall limit imposed by the execution host; applies to every
    /// backoff, request and poll wait of one run.
    std::optional<std::chrono::milliseconds> wallClockBudget;

    /// Query the kind's list endpoint for a same-named resource first.
    bool lookupExisting   = false;
    bool cleanupOnFailure = true;
    bool verbose          = false;

    /// Empty means random jitter.
    JitterSource jitter;
};

/// Custom idempotency lookup; receives the desired spec.
using ExistingResourceLookup =
    std::function<std::optional<ExistingResource>(const Credential&, const nlohmann::json&)>;

/// Drives one resource kind through create -> poll -> verify, update or
/// delete and folds every outcome into a single ProvisionResult.
///
/// Holds no per-run state: one instance may run several orchestrations
/// concurrently as long as the executor's transport allows it.
class ResourceOrchestrator {
public:
    /// @param executor  must outlive the orchestrator.
    /// @param clock     must outlive the orchestrator.
    ResourceOrchestrator(ResourceKind kind,
                         const RequestExecutor& executor,
                         Clock& clock,
                         OrchestratorOptions options = {},
                         CancellationToken cancel = CancellationToken());

    // mPoller refers to mRetry.
    ResourceOrchestrator(const ResourceOrchestrator&) = delete;
    ResourceOrchestrator& operator=(const ResourceOrchestrator&) = delete;

    /// Replaces the kind's REST lookup and enables lookups.
    void setExistingResourceLookup(ExistingResourceLookup lookup);

    ProvisionResult provision(const Credential& credential,
                              const nlohmann::json& desiredSpec) const;

    ProvisionResult update(const Credential& credential,
                           const std::string& resourceId,
                           const nlohmann::json& desiredSpec) const;

    ProvisionResult remove(const Credential& credential,
                           const std::string& resourceId) const;

    const char* kind() const { return kindName(mKind); }

private:
    ResourceKind           mKind;
    const RequestExecutor& mExecutor;
    Clock&                 mClock;
    OrchestratorOptions    mOptions;
    CancellationToken      mCancel;
    ExistingResourceLookup mLookup;
    RetryPolicy            mRetry;
    OperationPoller        mPoller;

    std::optional<Clock::time_point> budgetDeadline() const;

    std::optional<ExistingResource> findExisting(const Credential& credential,
                                                 const nlohmann::json& desiredSpec,
                                                 CallTrace& trace,
                                                 std::optional<Clock::time_point> deadline) const;

    PollOutcome awaitTerminal(const Credential& credential,
                              const std::string& resourceId,
                              bool teardown,
                              CallTrace& trace,
                              std::optional<Clock::time_point> deadline) const;

    void cleanupFailed(const Credential& credential,
                       ProvisionResult& result,
                       std::optional<Clock::time_point> deadline) const;
};

} // namespace dbx_provision
