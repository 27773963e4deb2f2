#pragma once

#include <string>
#include <vector>

#include "auditor/finding.h"
#include "auditor/project_files.h"
#include "config/config_manager.h"

namespace StrictKit::Audit {

/// Everything a gate may look at. Gates only read through these.
struct GateInput {
    const IFileEnumerator& files;
    const IContentReader& reader;
    const AuditConfig& config;
};

/// Base interface for all policy gates.
///
/// A gate is a pure function of its input: it keeps no state between
/// runs and produces exactly one Finding per evaluation. Gates may throw;
/// the auditor converts escaped exceptions into a WARN for that gate.
class IGate {
public:
    IGate() = default;
    virtual ~IGate() = default;

    virtual auto id() const noexcept -> GateId = 0;
    virtual auto evaluate(const GateInput& input) const -> Finding = 0;

    // Delete copy/move operations
    IGate(const IGate&) = delete;
    IGate& operator=(const IGate&) = delete;
    IGate(IGate&&) = delete;
    IGate& operator=(IGate&&) = delete;
};

// Extension sets shared between gates
namespace Extensions {
    const std::vector<std::string>& typescript();
    const std::vector<std::string>& scripts();
    const std::vector<std::string>& secretScan();
}

/// Test fixtures and specs are assumed not to ship: a file is test-designated
/// when its name contains ".test." or ".spec.", or when any directory
/// segment is __tests__, __mocks__, test, tests or spec.
bool isTestDesignatedPath(const std::string& rel_path);

} // namespace StrictKit::Audit
