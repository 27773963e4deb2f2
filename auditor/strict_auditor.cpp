#include "auditor/strict_auditor.h"

#include <climits>
#include <cstdlib>
#include <dirent.h>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include "auditor/gates/container_gate.h"
#include "auditor/gates/debug_output_gate.h"
#include "auditor/gates/lockfile_gate.h"
#include "auditor/gates/secret_gate.h"
#include "auditor/gates/type_escape_gate.h"
#include "common/logging.h"
#include "common/thread_utils.h"
#include "common/time_utils.h"

namespace StrictKit::Audit {

StrictAuditor::StrictAuditor(const AuditConfig& config)
    : config_(config) {
    gates_.push_back(std::make_unique<TypeEscapeGate>(any_matcher_));
    gates_.push_back(std::make_unique<SecretGate>());
    gates_.push_back(std::make_unique<ContainerGate>());
    gates_.push_back(std::make_unique<DebugOutputGate>());
    gates_.push_back(std::make_unique<LockfileGate>());
}

StrictAuditor::StrictAuditor(const AuditConfig& config, std::vector<std::unique_ptr<IGate>> gates)
    : config_(config),
      gates_(std::move(gates)) {
}

auto StrictAuditor::resolveRoot(const char* root_path) -> std::optional<std::string> {
    if (!root_path || !*root_path) return std::nullopt;

    char resolved[PATH_MAX];
    if (!realpath(root_path, resolved)) {
        LOG_ERROR("Cannot resolve project root: %s", root_path);
        return std::nullopt;
    }

    DIR* dir = opendir(resolved);
    if (!dir) {
        LOG_ERROR("Cannot open project root: %s", resolved);
        return std::nullopt;
    }
    closedir(dir);

    return std::string(resolved);
}

auto StrictAuditor::makeMetadata(const std::string& root_path) -> ReportMetadata {
    ReportMetadata meta;
    meta.version = STRICTKIT_VERSION;
    meta.root_path = root_path;

    char stamp[40];
    if (Common::formatIso8601(Common::getWallClockNanos(), stamp, sizeof(stamp))) {
        meta.timestamp = stamp;
    }
    return meta;
}

auto StrictAuditor::runAudit(const char* root_path) const -> std::optional<Report> {
    const auto root = resolveRoot(root_path);
    if (!root) return std::nullopt;

    LOG_INFO("Auditing %s", root->c_str());

    const FsFileEnumerator files(*root, FsFileEnumerator::splitIgnoreList(config_.extra_ignore_dirs));
    const FsContentReader reader(*root);

    return runGates(files, reader, makeMetadata(*root));
}

auto StrictAuditor::evaluateGuarded(const IGate& gate, const GateInput& input) const -> Finding {
    const GateId id = gate.id();
    const uint64_t start = Common::getNanosSinceEpoch();

    Finding finding;
    try {
        finding = gate.evaluate(input);
    } catch (const std::exception& e) {
        LOG_ERROR("Gate %s failed: %s", gateName(id), e.what());
        finding = makeFinding(id, GateStatus::WARN,
                              std::string("Gate could not be evaluated: ") + e.what());
    } catch (...) {
        LOG_ERROR("Gate %s failed with a non-standard exception", gateName(id));
        finding = makeFinding(id, GateStatus::WARN, "Gate could not be evaluated.");
    }
    finding.gate = id;

    LOG_INFO("Gate %s: %s in %llu us", gateName(id), statusToString(finding.status),
             static_cast<unsigned long long>((Common::getNanosSinceEpoch() - start) / 1000));
    return finding;
}

auto StrictAuditor::runGates(const IFileEnumerator& files, const IContentReader& reader,
                             ReportMetadata meta) const -> Report {
    const GateInput input{files, reader, config_};
    std::vector<Finding> findings(gates_.size());

    if (config_.parallel_gates && gates_.size() > 1) {
        std::vector<std::thread> workers;
        workers.reserve(gates_.size());

        for (size_t i = 0; i < gates_.size(); ++i) {
            try {
                workers.push_back(Common::createNamedThread("sk-gate", [this, &input, &findings, i] {
                    findings[i] = evaluateGuarded(*gates_[i], input);
                }));
            } catch (const std::system_error& e) {
                LOG_WARN("Cannot start gate thread (%s), evaluating %s inline",
                         e.what(), gateName(gates_[i]->id()));
                findings[i] = evaluateGuarded(*gates_[i], input);
            }
        }

        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (size_t i = 0; i < gates_.size(); ++i) {
            findings[i] = evaluateGuarded(*gates_[i], input);
        }
    }

    Report report = aggregate(std::move(findings), std::move(meta));
    LOG_INFO("Audit complete: %u passed, %u failed, %u warned",
             report.summary.passed, report.summary.failed, report.summary.warned);
    return report;
}

} // namespace StrictKit::Audit
