#include "orchestrator.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <utility>

namespace dbx_provision {

namespace {

ErrorDetail makeDetail(const char* category, const std::string& kind, const std::string& message) {
    ErrorDetail detail;
    detail.category = category;
    detail.kind     = kind;
    detail.message  = message;
    return detail;
}

/// Run @p body and turn any escaping error into a failed result.
/// Keeps the one-result-per-run contract even for unexpected exceptions.
template <class Body>
void runGuarded(ProvisionResult& result, Body&& body) {
    try {
        body();
    } catch (const RetryExhausted& e) {
        result.status = OperationStatus::Failed;
        result.error  = makeDetail("RetryExhausted", toString(e.lastError().kind()), e.what());
    } catch (const ExecutionError& e) {
        result.status = OperationStatus::Failed;
        result.error  = makeDetail("ExecutionError", toString(e.kind()), e.what());
    } catch (const PollError& e) {
        // A cancelled run leaves the remote resource in an unknown state.
        result.status = e.kind() == PollError::Kind::Cancelled ? OperationStatus::Unknown
                                                               : OperationStatus::Failed;
        result.error  = makeDetail("PollError", toString(e.kind()), e.what());
    } catch (const ProvisioningError& e) {
        result.status = OperationStatus::Failed;
        result.error  = makeDetail("ProvisioningError", toString(e.kind()), e.what());
    } catch (const ConfigurationError& e) {
        result.status = OperationStatus::Failed;
        result.error  = makeDetail("ConfigurationError", "ConfigurationError", e.what());
    } catch (const std::exception& e) {
        result.status = OperationStatus::Failed;
        result.error  = makeDetail("InternalError", "InternalError", e.what());
    }
}

/// Fill the diagnostic fields every error detail carries.
/// Only the first @p primaryCalls records count towards lastHttpStatus, so
/// cleanup traffic never hides the reply that caused the failure.
void finalize(ProvisionResult& result, const std::string& lastObserved,
              std::optional<std::size_t> primaryCalls = std::nullopt) {
    if (!result.error) return;

    auto& detail = *result.error;
    const std::size_t end = std::min(primaryCalls.value_or(result.calls.size()),
                                     result.calls.size());
    for (std::size_t i = end; i > 0; --i) {
        if (result.calls[i - 1].httpStatus != 0) {
            detail.lastHttpStatus = result.calls[i - 1].httpStatus;
            break;
        }
    }
    detail.lastObservedStatus = lastObserved;
    detail.attempts           = static_cast<int>(result.calls.size());
}

} // namespace

ResourceOrchestrator::ResourceOrchestrator(ResourceKind kind,
                                           const RequestExecutor& executor,
                                           Clock& clock,
                                           OrchestratorOptions options,
                                           CancellationToken cancel)
    : mKind(std::move(kind))
    , mExecutor(executor)
    , mClock(clock)
    , mOptions(std::move(options))
    , mCancel(std::move(cancel))
    , mRetry(mExecutor, mClock, mOptions.retry,
             mOptions.jitter ? mOptions.jitter : makeRandomJitter(),
             mOptions.verbose)
    , mPoller(mRetry, mClock, mOptions.verbose) {}

void ResourceOrchestrator::setExistingResourceLookup(ExistingResourceLookup lookup) {
    mLookup = std::move(lookup);
}

// ---------------------------------------------------------------------------
// Public: lifecycle operations
// ---------------------------------------------------------------------------

ProvisionResult ResourceOrchestrator::provision(const Credential& credential,
                                                const nlohmann::json& desiredSpec) const
{
    ProvisionResult result;
    result.resourceKind = kind();
    result.operation    = "create";

    const auto  deadline = budgetDeadline();
    std::string lastObserved;
    std::optional<std::size_t> primaryCalls;
    bool        created = false;

    runGuarded(result, [&] {
        // --- idempotency gate ---
        if (auto existing = findExisting(credential, desiredSpec, result.calls, deadline)) {
            if (existing->status != OperationStatus::Failed) {
                result.resourceId     = existing->id;
                result.reusedExisting = true;
                lastObserved          = existing->rawStatus;
                if (mOptions.verbose) {
                    std::cerr << "[Orchestrator] Reusing existing " << kind() << " "
                              << existing->id << " (" << existing->rawStatus << ")\n";
                }
            } else if (mOptions.verbose) {
                std::cerr << "[Orchestrator] Existing " << kind() << " " << existing->id
                          << " is " << existing->rawStatus << "; creating a new one\n";
            }
        }

        // --- create ---
        if (!result.reusedExisting) {
            const ApiResponse response = mRetry.execute(credential, [&] {
                return std::visit([&](const auto& k) { return k.createRequest(desiredSpec); }, mKind);
            }, result.calls, mCancel, deadline);

            result.resourceId = std::visit([&](const auto& k) { return k.extractId(response); }, mKind);
            if (result.resourceId.empty()) {
                throw ProvisioningError(ProvisioningError::Kind::CreateFailed,
                                        std::string("Create response for ") + kind()
                                        + " did not contain a resource identifier");
            }
            created = true;
            if (mOptions.verbose) {
                std::cerr << "[Orchestrator] Created " << kind() << " " << result.resourceId << "\n";
            }
        }

        // --- poll ---
        const PollOutcome outcome = awaitTerminal(credential, result.resourceId,
                                                  /*teardown=*/false, result.calls, deadline);
        if (!outcome.lastRawStatus.empty()) lastObserved = outcome.lastRawStatus;
        result.status = outcome.status;

        if (outcome.status == OperationStatus::Failed) {
            result.error = makeDetail("ResourceState", "Failed",
                                      std::string(kind()) + " " + result.resourceId
                                      + " reached terminal state " + lastObserved);
            // Only resources this run created are torn down.
            if (created && mOptions.cleanupOnFailure) {
                primaryCalls = result.calls.size();
                cleanupFailed(credential, result, deadline);
            }
        } else if (outcome.status == OperationStatus::TimedOut) {
            result.error = makeDetail("ResourceState", "TimedOut",
                                      std::string(kind()) + " " + result.resourceId
                                      + " did not reach a terminal state in time; last observed "
                                      + (lastObserved.empty() ? "nothing" : lastObserved));
        }
    });

    finalize(result, lastObserved, primaryCalls);
    return result;
}

ProvisionResult ResourceOrchestrator::update(const Credential& credential,
                                             const std::string& resourceId,
                                             const nlohmann::json& desiredSpec) const
{
    ProvisionResult result;
    result.resourceKind = kind();
    result.operation    = "update";
    result.resourceId   = resourceId;

    const auto  deadline = budgetDeadline();
    std::string lastObserved;

    runGuarded(result, [&] {
        auto editRequest = std::visit([&](const auto& k) { return k.updateRequest(resourceId, desiredSpec); },
                                      mKind);
        if (!editRequest) {
            result.status = OperationStatus::Failed;
            result.error  = makeDetail("ExecutionError", toString(ErrorKind::InvalidRequest),
                                       std::string("Resource kind ") + kind()
                                       + " does not support update");
            return;
        }

        mRetry.execute(credential, [&] {
            return *std::visit([&](const auto& k) { return k.updateRequest(resourceId, desiredSpec); },
                               mKind);
        }, result.calls, mCancel, deadline);

        const PollOutcome outcome = awaitTerminal(credential, resourceId,
                                                  /*teardown=*/false, result.calls, deadline);
        lastObserved  = outcome.lastRawStatus;
        result.status = outcome.status;

        if (outcome.status == OperationStatus::Failed) {
            result.error = makeDetail("ResourceState", "Failed",
                                      std::string(kind()) + " " + resourceId
                                      + " reached terminal state " + lastObserved + " after update");
        } else if (outcome.status == OperationStatus::TimedOut) {
            result.error = makeDetail("ResourceState", "TimedOut",
                                      std::string(kind()) + " " + resourceId
                                      + " did not settle after update in time");
        }
    });

    finalize(result, lastObserved);
    return result;
}

ProvisionResult ResourceOrchestrator::remove(const Credential& credential,
                                             const std::string& resourceId) const
{
    ProvisionResult result;
    result.resourceKind = kind();
    result.operation    = "delete";
    result.resourceId   = resourceId;

    const auto  deadline = budgetDeadline();
    std::string lastObserved;

    runGuarded(result, [&] {
        try {
            mRetry.execute(credential, [&] {
                return std::visit([&](const auto& k) { return k.deleteRequest(resourceId); }, mKind);
            }, result.calls, mCancel, deadline);
        } catch (const ExecutionError& e) {
            if (!isNotFound(e)) throw;
            // Already gone: the delete has nothing left to do.
            if (mOptions.verbose) {
                std::cerr << "[Orchestrator] " << kind() << " " << resourceId
                          << " does not exist; nothing to delete\n";
            }
            result.status = OperationStatus::Succeeded;
            lastObserved  = "RESOURCE_DOES_NOT_EXIST";
            return;
        }

        const PollOutcome outcome = awaitTerminal(credential, resourceId,
                                                  /*teardown=*/true, result.calls, deadline);
        lastObserved  = outcome.lastRawStatus;
        result.status = outcome.status;

        if (outcome.status == OperationStatus::Failed) {
            result.error = makeDetail("ResourceState", "Failed",
                                      std::string(kind()) + " " + resourceId
                                      + " entered " + lastObserved + " while deleting");
        } else if (outcome.status == OperationStatus::TimedOut) {
            result.error = makeDetail("ResourceState", "TimedOut",
                                      std::string(kind()) + " " + resourceId
                                      + " was not gone in time; last observed " + lastObserved);
        }
    });

    finalize(result, lastObserved);
    return result;
}

// ---------------------------------------------------------------------------
// Private
// ---------------------------------------------------------------------------

std::optional<Clock::time_point> ResourceOrchestrator::budgetDeadline() const {
    if (!mOptions.wallClockBudget) return std::nullopt;
    return mClock.now() + *mOptions.wallClockBudget;
}

std::optional<ExistingResource>
ResourceOrchestrator::findExisting(const Credential& credential,
                                   const nlohmann::json& desiredSpec,
                                   CallTrace& trace,
                                   std::optional<Clock::time_point> deadline) const
{
    if (mLookup) {
        return mLookup(credential, desiredSpec);
    }
    if (!mOptions.lookupExisting) {
        return std::nullopt;
    }

    auto listRequest = std::visit([&](const auto& k) { return k.lookupRequest(desiredSpec); }, mKind);
    if (!listRequest) {
        return std::nullopt;
    }

    const ApiResponse response = mRetry.execute(credential, [&] {
        return *std::visit([&](const auto& k) { return k.lookupRequest(desiredSpec); }, mKind);
    }, trace, mCancel, deadline);

    return std::visit([&](const auto& k) { return k.findExisting(response, desiredSpec); }, mKind);
}

PollOutcome ResourceOrchestrator::awaitTerminal(const Credential& credential,
                                                const std::string& resourceId,
                                                bool teardown,
                                                CallTrace& trace,
                                                std::optional<Clock::time_point> deadline) const
{
    const RequestBuilder statusRequest = [this, &resourceId] {
        return std::visit([&](const auto& k) { return k.statusRequest(resourceId); }, mKind);
    };
    const StatusExtractor extractStatus = [this, teardown](const ApiResponse& response) {
        return std::visit([&](const auto& k) {
            return teardown ? k.teardownStatus(response) : k.provisionStatus(response);
        }, mKind);
    };

    std::optional<OperationStatus> whenMissing;
    if (teardown) {
        whenMissing = OperationStatus::Succeeded;
    }

    return mPoller.pollUntilTerminal(credential, statusRequest, extractStatus,
                                     mOptions.poll, trace, mCancel, whenMissing, deadline);
}

void ResourceOrchestrator::cleanupFailed(const Credential& credential,
                                         ProvisionResult& result,
                                         std::optional<Clock::time_point> deadline) const
{
    const std::string& id = result.resourceId;
    try {
        mRetry.execute(credential, [&] {
            return std::visit([&](const auto& k) { return k.deleteRequest(id); }, mKind);
        }, result.calls, mCancel, deadline);

        if (mOptions.verbose) {
            std::cerr << "[Orchestrator] Cleanup delete issued for " << kind() << " " << id << "\n";
        }
    } catch (const ProvisionError& e) {
        const ProvisioningError failure(ProvisioningError::Kind::CleanupFailed,
                                        std::string("Cleanup delete of ") + kind() + " " + id
                                        + " failed: " + e.what());
        result.cleanupError = failure.what();
        std::cerr << "[Orchestrator] Warning: " << failure.what() << "\n";
    }
}

} // namespace dbx_provision
