#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "auditor/any_type_matcher.h"
#include "auditor/gates/gate.h"
#include "auditor/report.h"
#include "config/config_manager.h"

#ifndef STRICTKIT_VERSION
#define STRICTKIT_VERSION "0.0.0-dev"
#endif

namespace StrictKit::Audit {

/// Runs every registered gate over one project tree and builds the Report.
///
/// The default gate set, in registration order, is NO_ANY, SECRETS,
/// DOCKER, CONSOLE, LOCKFILE. With `parallel_gates` each gate runs on its
/// own thread; findings are still stored by registration index.
class StrictAuditor {
public:
    explicit StrictAuditor(const AuditConfig& config);

    // Custom gate list, used as given
    StrictAuditor(const AuditConfig& config, std::vector<std::unique_ptr<IGate>> gates);

    ~StrictAuditor() = default;

    /// Audit the tree at `root_path`.
    /// Returns nullopt only when the root cannot be resolved or opened.
    [[nodiscard]] auto runAudit(const char* root_path) const -> std::optional<Report>;

    /// Evaluate all gates against the given collaborators.
    auto runGates(const IFileEnumerator& files, const IContentReader& reader,
                  ReportMetadata meta) const -> Report;

    [[nodiscard]] auto gateCount() const noexcept -> size_t { return gates_.size(); }

    // Absolute, symlink-free path of a readable directory, or nullopt
    static auto resolveRoot(const char* root_path) -> std::optional<std::string>;

    // Envelope for a run started now
    static auto makeMetadata(const std::string& root_path) -> ReportMetadata;

    // Delete copy/move operations
    StrictAuditor(const StrictAuditor&) = delete;
    StrictAuditor& operator=(const StrictAuditor&) = delete;
    StrictAuditor(StrictAuditor&&) = delete;
    StrictAuditor& operator=(StrictAuditor&&) = delete;

private:
    // Evaluate one gate; an escaped exception becomes a WARN for that gate
    auto evaluateGuarded(const IGate& gate, const GateInput& input) const -> Finding;

    AuditConfig config_;
    AnyTypeMatcher any_matcher_;
    std::vector<std::unique_ptr<IGate>> gates_;
};

} // namespace StrictKit::Audit
