#include <cstdio>
#include <cstring>
#include <string>

#include <curl/curl.h>

#include "auditor/report.h"
#include "auditor/strict_auditor.h"
#include "auditor/telemetry.h"
#include "common/logging.h"
#include "common/macros.h"
#include "common/time_utils.h"
#include "config/config_manager.h"

namespace {

using namespace StrictKit;
using namespace StrictKit::Audit;

constexpr int EXIT_PASSED = 0;
constexpr int EXIT_VIOLATIONS = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_ROOT_UNREADABLE = 3;

struct CliOptions {
    const char* root_path = ".";
    const char* config_path = nullptr;
    const char* junit_path = nullptr;
    const char* explain_rule = nullptr;
    bool explain = false;
    bool json = false;
    bool quiet = false;
};

COLD_FUNCTION void printUsage() {
    const char* usage = R"(
USAGE: strictkit [audit] [path] [OPTIONS]
       strictkit explain <RULE>

StrictKit - policy gates for TypeScript/JavaScript projects

OPTIONS:
    --json                  Print the report as JSON on stdout
    --junit <file>          Also write a JUnit XML report
    --config <file>         Configuration file (default: <path>/.strictkit.conf)
    --quiet                 Print only the conclusion line
    --version               Print the version and exit
    --help                  Show this help message

GATES:
    NO_ANY    [SK-INT-001]  explicit 'any' in *.ts / *.tsx
    SECRETS   [SK-SEC-001]  credential patterns in source and config files
    DOCKER    [SK-INF-001]  unpinned base images in ./Dockerfile
    CONSOLE   [SK-DBG-001]  console.log() calls outside tests
    LOCKFILE  [SK-DEP-001]  missing dependency lockfile

EXIT CODES:
    0 - All gates passed (warnings allowed)
    1 - At least one gate failed
    2 - Usage or configuration error
    3 - Project path cannot be read

ENVIRONMENT:
    STRICTKIT_TELEMETRY=off   Disable anonymous usage metrics
    STRICTKIT_LOGS_DIR=<dir>  Log directory (default: /tmp)
    STRICTKIT_DEBUG=true      Print telemetry status on stderr

)";
    fprintf(stdout, "%s", usage);
}

COLD_FUNCTION int explainRule(const char* rule) {
    if (!rule) {
        fprintf(stderr, "Usage: strictkit explain [INTEGRITY|SECURITY|INFRA|CONSOLE|LOCKFILE]\n");
        return EXIT_USAGE;
    }

    const GateDoctrine* doc = findDoctrine(rule);
    if (!doc) {
        fprintf(stderr, "Unknown rule: %s\n", rule);
        fprintf(stderr, "Usage: strictkit explain [INTEGRITY|SECURITY|INFRA|CONSOLE|LOCKFILE]\n");
        return EXIT_USAGE;
    }

    printf("\nStrictKit Doctrine: %s [%s]\n", doc->rule, doc->doctrine_id);
    printf("==============================================\n");
    printf("Gate:        %s\n", doc->name);
    printf("Philosophy:  %s\n", doc->philosophy);
    printf("Action:      %s\n\n", doc->fix);
    return EXIT_PASSED;
}

// Returns -1 on success, otherwise the exit code to stop with
int parseArgs(int argc, char* argv[], CliOptions& opts) {
    bool have_root = false;
    int first = 1;

    if (argc > 1 && std::strcmp(argv[1], "audit") == 0) {
        first = 2;
    } else if (argc > 1 && std::strcmp(argv[1], "explain") == 0) {
        opts.explain = true;
        opts.explain_rule = argc > 2 ? argv[2] : nullptr;
        return -1;
    }

    for (int i = first; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage();
            return EXIT_PASSED;
        }
        else if (std::strcmp(argv[i], "--version") == 0 || std::strcmp(argv[i], "-v") == 0) {
            printf("strictkit %s\n", STRICTKIT_VERSION);
            return EXIT_PASSED;
        }
        else if (std::strcmp(argv[i], "--json") == 0) {
            opts.json = true;
        }
        else if (std::strcmp(argv[i], "--quiet") == 0 || std::strcmp(argv[i], "-q") == 0) {
            opts.quiet = true;
        }
        else if (std::strcmp(argv[i], "--junit") == 0 && i + 1 < argc) {
            opts.junit_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_path = argv[++i];
        }
        else if (argv[i][0] != '-' && !have_root) {
            opts.root_path = argv[i];
            have_root = true;
        }
        else {
            fprintf(stderr, "Unknown or incomplete option: %s\n", argv[i]);
            printUsage();
            return EXIT_USAGE;
        }
    }
    return -1;
}

void startLogging(const AuditConfig& config) {
    Common::Logger::setMinLevel(Common::Logger::parseLevel(config.log_level));

    char stamp[32];
    if (!Common::formatFileStamp(stamp, sizeof(stamp))) {
        SAFE_STRCPY(stamp, "unknown");
    }

    char log_path[512];
    snprintf(log_path, sizeof(log_path), "%s/strictkit_%s.log", config.logs_dir, stamp);
    Common::initLogging(log_path);
}

int runAuditCommand(const CliOptions& opts) {
    if (!ConfigManager::init(opts.config_path, opts.root_path)) {
        fprintf(stderr, "Cannot read configuration file: %s\n", opts.config_path);
        return EXIT_USAGE;
    }
    const AuditConfig& config = ConfigManager::getConfig();
    startLogging(config);
    ConfigManager::reportDiagnostics();

    const StrictAuditor auditor(config);
    const auto report = auditor.runAudit(opts.root_path);
    if (!report) {
        fprintf(stderr, "Cannot read project path: %s\n", opts.root_path);
        return EXIT_ROOT_UNREADABLE;
    }

    TelemetryClient telemetry(config);
    if (!telemetry.trackAudit(*report)) {
        LOG_DEBUG("No telemetry event sent");
    }

    if (opts.json) {
        const std::string json = toJson(*report);
        fprintf(stdout, "%s\n", json.c_str());
    } else if (opts.quiet) {
        printf("%s\n", report->success ? "✅ StrictKit: PASSED" : "❌ StrictKit: FAILED");
    } else {
        printf("==============================================\n");
        printf("STRICTKIT AUDIT REPORT\n");
        printf("==============================================\n");
        printf("Path: %s\n\n", report->meta.root_path.c_str());
        printf("%s", toText(*report).c_str());
        if (telemetry.isEnabled()) {
            printf("\nAnonymous usage metrics collected. Set STRICTKIT_TELEMETRY=off to disable.\n");
        }
    }

    if (opts.junit_path) {
        if (!writeJUnit(*report, opts.junit_path)) {
            fprintf(stderr, "Cannot write JUnit report: %s\n", opts.junit_path);
            LOG_ERROR("JUnit export failed: %s", opts.junit_path);
        } else if (!opts.json && !opts.quiet) {
            printf("JUnit report exported to: %s\n", opts.junit_path);
        }
    }

    fflush(stdout);
    return report->success ? EXIT_PASSED : EXIT_VIOLATIONS;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    const int parse_result = parseArgs(argc, argv, opts);
    if (parse_result >= 0) return parse_result;

    if (opts.explain) {
        return explainRule(opts.explain_rule);
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    const int exit_code = runAuditCommand(opts);
    curl_global_cleanup();

    if (Common::isLoggingActive()) {
        LOG_INFO("Exit code %d", exit_code);
        Common::shutdownLogging();
    }
    return exit_code;
}
