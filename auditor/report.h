#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "auditor/finding.h"

namespace StrictKit::Audit {

struct ReportMetadata {
    std::string tool_name{"StrictKit"};
    std::string version;
    std::string timestamp;   // ISO-8601 UTC
    std::string root_path;   // absolute
};

struct ReportSummary {
    uint32_t total{0};
    uint32_t passed{0};
    uint32_t failed{0};
    uint32_t warned{0};
};

/// Outcome of one audit run.
///
/// Invariants: summary.total == findings.size() == passed + failed + warned,
/// and success == (failed == 0). Findings keep gate registration order.
struct Report {
    ReportMetadata meta;
    std::vector<Finding> findings;
    ReportSummary summary;
    bool success{true};
};

// Tally findings and compute success. Findings are taken as given.
Report aggregate(std::vector<Finding> findings, ReportMetadata meta);

// Gate doctrine ids of every non-PASS finding, in report order
std::vector<std::string> brokenRuleIds(const Report& report);

// ========== Rendering ==========

std::string toJson(const Report& report, bool pretty = true);

// One line per gate plus a summary and conclusion line
std::string toText(const Report& report);

// JUnit XML, one testcase per gate. False if the file cannot be written.
[[nodiscard]] bool writeJUnit(const Report& report, const char* path) noexcept;

// Escape &, <, >, " and ' into `out`. Returns bytes written, excluding
// the terminator; output is truncated at a whole entity.
size_t xmlEscape(const char* in, char* out, size_t out_size) noexcept;

} // namespace StrictKit::Audit
