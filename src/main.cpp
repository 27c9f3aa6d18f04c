#include "auth_context.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "mapping.hpp"
#include "orchestrator.hpp"
#include "request_executor.hpp"
#include "resource_kinds.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <thread>

namespace net = boost::asio;

namespace {

constexpr int kExitFailure     = 1;
constexpr int kExitConfigError = 2;

struct Config {
    std::string                kind;
    std::string                action     = "create";
    std::string                specFile;
    std::string                specJson;
    std::string                resourceId;
    std::string                host;
    std::string                token;
    int                        timeoutS   = 30 * 60;
    int                        intervalS  = 15;
    std::optional<int>         budgetS;
    int                        maxAttempts = 5;
    int                        requestTimeoutMs = 30000;
    bool                       lookupExisting = false;
    bool                       cleanup    = true;
    bool                       verbose    = false;
};

void printUsage() {
    std::cout
        << "Usage: dbx_provision --kind KIND [options]\n\n"
        << "Options:\n"
        << "  --kind KIND             cluster | job | instance-pool | job-run\n"
        << "  --action ACTION         create | update | delete   (default: create)\n"
        << "  --spec FILE             Desired-state JSON file\n"
        << "  --spec-json JSON        Desired-state JSON given inline\n"
        << "  --id ID                 Resource id (update / delete)\n"
        << "  --host URL              Workspace URL     (default: $DATABRICKS_HOST)\n"
        << "  --token TOKEN           Bearer token      (default: $DATABRICKS_TOKEN)\n"
        << "  --timeout-s N           Poll timeout      (default: 1800)\n"
        << "  --interval-s N          Poll interval     (default: 15)\n"
        << "  --budget-s N            Overall wall-clock budget\n"
        << "  --max-attempts N        Attempts per call (default: 5)\n"
        << "  --request-timeout-ms N  Per-attempt HTTP timeout (default: 30000)\n"
        << "  --lookup-existing       Reuse a same-named resource if present\n"
        << "  --no-cleanup            Keep resources that end up FAILED\n"
        << "  --verbose               Enable verbose diagnostics\n"
        << "  --help, -h              Show this message\n";
}

int intFlag(const std::string& flag, const char* value) {
    try {
        size_t used = 0;
        const int parsed = std::stoi(value, &used);
        if (used == std::string(value).size() && parsed >= 0) return parsed;
    } catch (const std::logic_error&) {
        // Reported below.
    }
    throw dbx_provision::ConfigurationError(flag + " expects a non-negative integer, got '"
                                            + value + "'");
}

Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--kind" && i + 1 < argc) {
            cfg.kind = argv[++i];
        } else if (arg == "--action" && i + 1 < argc) {
            cfg.action = argv[++i];
        } else if (arg == "--spec" && i + 1 < argc) {
            cfg.specFile = argv[++i];
        } else if (arg == "--spec-json" && i + 1 < argc) {
            cfg.specJson = argv[++i];
        } else if (arg == "--id" && i + 1 < argc) {
            cfg.resourceId = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            cfg.host = argv[++i];
        } else if (arg == "--token" && i + 1 < argc) {
            cfg.token = argv[++i];
        } else if (arg == "--timeout-s" && i + 1 < argc) {
            cfg.timeoutS = intFlag(arg, argv[++i]);
        } else if (arg == "--interval-s" && i + 1 < argc) {
            cfg.intervalS = intFlag(arg, argv[++i]);
        } else if (arg == "--budget-s" && i + 1 < argc) {
            cfg.budgetS = intFlag(arg, argv[++i]);
        } else if (arg == "--max-attempts" && i + 1 < argc) {
            cfg.maxAttempts = intFlag(arg, argv[++i]);
        } else if (arg == "--request-timeout-ms" && i + 1 < argc) {
            cfg.requestTimeoutMs = intFlag(arg, argv[++i]);
        } else if (arg == "--lookup-existing") {
            cfg.lookupExisting = true;
        } else if (arg == "--no-cleanup") {
            cfg.cleanup = false;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(kExitConfigError);
        }
    }
    return cfg;
}

/// Flags win over the environment; a bare host gets https://.
dbx_provision::AuthConfig resolveAuth(const Config& cfg) {
    dbx_provision::AuthConfig auth;
    auth.baseUrl = cfg.host;
    auth.token   = cfg.token;

    if (auth.baseUrl.empty()) {
        if (const char* env = std::getenv("DATABRICKS_HOST")) auth.baseUrl = env;
    }
    if (auth.token.empty()) {
        if (const char* env = std::getenv("DATABRICKS_TOKEN")) auth.token = env;
    }
    if (!auth.baseUrl.empty() && auth.baseUrl.find("://") == std::string::npos) {
        auth.baseUrl = "https://" + auth.baseUrl;
    }
    return auth;
}

nlohmann::json loadSpec(const Config& cfg) {
    try {
        if (!cfg.specJson.empty()) {
            return nlohmann::json::parse(cfg.specJson);
        }
        if (!cfg.specFile.empty()) {
            std::ifstream in(cfg.specFile);
            if (!in) {
                throw dbx_provision::ConfigurationError("Cannot open spec file: " + cfg.specFile);
            }
            std::stringstream buffer;
            buffer << in.rdbuf();
            return nlohmann::json::parse(buffer.str());
        }
    } catch (const nlohmann::json::parse_error& e) {
        throw dbx_provision::ConfigurationError(std::string("Invalid desired-state JSON: ") + e.what());
    }
    return nlohmann::json::object();
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace dbx_provision;

    try {
        const Config cfg = parseArgs(argc, argv);

        if (cfg.kind.empty()) {
            throw ConfigurationError("--kind is required");
        }
        const ResourceKind kind = parseResourceKind(cfg.kind);
        const Credential credential = makeCredential(resolveAuth(cfg));
        const nlohmann::json spec = loadSpec(cfg);

        if ((cfg.action == "update" || cfg.action == "delete") && cfg.resourceId.empty()) {
            throw ConfigurationError("--id is required for " + cfg.action);
        }
        if (cfg.action != "create" && cfg.action != "update" && cfg.action != "delete") {
            throw ConfigurationError("Unknown action: " + cfg.action);
        }

        if (cfg.verbose) {
            std::cerr
                << "=== dbx_provision ===\n"
                << "Endpoint:   " << credential.baseUrl() << "\n"
                << "Kind:       " << kindName(kind)      << "\n"
                << "Action:     " << cfg.action          << "\n"
                << "Timeout:    " << cfg.timeoutS        << " s\n"
                << "Interval:   " << cfg.intervalS       << " s\n"
                << "=====================\n";
        }

        OrchestratorOptions options;
        options.retry.maxAttempts = cfg.maxAttempts;
        options.poll.timeout      = std::chrono::seconds(cfg.timeoutS);
        options.poll.interval     = std::chrono::seconds(cfg.intervalS);
        if (cfg.budgetS) {
            options.wallClockBudget = std::chrono::seconds(*cfg.budgetS);
        }
        options.lookupExisting   = cfg.lookupExisting;
        options.cleanupOnFailure = cfg.cleanup;
        options.verbose          = cfg.verbose;

        CancellationToken cancel;
        BeastHttpTransport transport(cfg.verbose);
        RequestExecutor    executor(transport, std::chrono::milliseconds(cfg.requestTimeoutMs),
                                    cfg.verbose);
        SteadyClock        clock;
        ResourceOrchestrator orchestrator(kind, executor, clock, options, cancel);

        // SIGINT / SIGTERM cancel the run at the next suspension point.
        net::io_context   signalIoc;
        net::signal_set   signals(signalIoc, SIGINT, SIGTERM);
        signals.async_wait([cancel](const boost::system::error_code& ec, int) mutable {
            if (!ec) {
                std::cerr << "[Main] Signal received, cancelling...\n";
                cancel.cancel();
            }
        });
        std::thread signalThread([&signalIoc] { signalIoc.run(); });

        ProvisionResult result;
        if (cfg.action == "create") {
            result = orchestrator.provision(credential, spec);
        } else if (cfg.action == "update") {
            result = orchestrator.update(credential, cfg.resourceId, spec);
        } else {
            result = orchestrator.remove(credential, cfg.resourceId);
        }

        signals.cancel();
        signalIoc.stop();
        signalThread.join();

        std::cout << toJson(result).dump(2) << "\n";
        return result.status == OperationStatus::Succeeded ? 0 : kExitFailure;

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitConfigError;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitFailure;
    }
}
