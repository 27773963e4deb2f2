#include "auditor/gates/debug_output_gate.h"

#include <cstdio>
#include <iterator>

#include "auditor/sanitizer.h"
#include "common/logging.h"

namespace StrictKit::Audit {

DebugOutputGate::DebugOutputGate()
    : call_pattern_(R"(\bconsole\.log\s{0,64}\()", std::regex::ECMAScript | std::regex::optimize) {
}

auto DebugOutputGate::countCallSites(const std::string& source) const -> uint32_t {
    const std::string masked = stripStrings(stripComments(source));
    const auto begin = std::sregex_iterator(masked.begin(), masked.end(), call_pattern_);
    return static_cast<uint32_t>(std::distance(begin, std::sregex_iterator()));
}

auto DebugOutputGate::evaluate(const GateInput& input) const -> Finding {
    const auto files = input.files.listFiles(Extensions::scripts());

    uint32_t total = 0;
    uint32_t affected = 0;

    for (const auto& path : files) {
        if (isTestDesignatedPath(path)) continue;

        const auto content = input.reader.read(path);
        if (!content) continue;

        const uint32_t calls = countCallSites(*content);
        if (calls > 0) {
            total += calls;
            ++affected;
            LOG_DEBUG("CONSOLE: %u in %s", calls, path.c_str());
        }
    }

    LOG_INFO("CONSOLE: %u call(s) in %u file(s)", total, affected);

    Finding finding;
    finding.gate = GateId::CONSOLE;
    finding.count = total;
    finding.affected_files = affected;

    if (total > 0) {
        char msg[128];
        snprintf(msg, sizeof(msg), "%u console.log() call(s) in %u file(s).", total, affected);
        finding.status = GateStatus::FAIL;
        finding.message = msg;
    } else {
        finding.status = GateStatus::PASS;
        finding.message = "No console.log() calls found.";
    }
    return finding;
}

} // namespace StrictKit::Audit
