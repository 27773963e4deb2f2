#include "auditor/gates/type_escape_gate.h"

#include <cstdio>

#include "common/logging.h"

namespace StrictKit::Audit {

auto TypeEscapeGate::evaluate(const GateInput& input) const -> Finding {
    const auto files = input.files.listFiles(Extensions::typescript());
    if (files.empty()) {
        return makeFinding(GateId::NO_ANY, GateStatus::WARN, "No TypeScript files found.");
    }

    uint32_t total = 0;
    uint32_t affected = 0;
    uint32_t parsed = 0;

    for (const auto& path : files) {
        const auto content = input.reader.read(path);
        if (!content) continue;

        const auto markers = counter_.countEscapeMarkers(path, *content);
        if (!markers) {
            LOG_WARN("NO_ANY: could not parse %s", path.c_str());
            continue;
        }

        ++parsed;
        if (*markers > 0) {
            total += *markers;
            ++affected;
            LOG_DEBUG("NO_ANY: %u in %s", *markers, path.c_str());
        }
    }

    LOG_INFO("NO_ANY: %zu file(s), %u parsed, %u usage(s)", files.size(), parsed, total);

    if (parsed == 0) {
        return makeFinding(GateId::NO_ANY, GateStatus::WARN,
                           "Scan could not be completed: no TypeScript file could be parsed.");
    }

    Finding finding;
    finding.gate = GateId::NO_ANY;
    finding.count = total;
    finding.affected_files = affected;

    if (total > 0) {
        char msg[128];
        snprintf(msg, sizeof(msg), "%u usages of 'any' in %u file(s).", total, affected);
        finding.status = GateStatus::FAIL;
        finding.message = msg;
    } else {
        finding.status = GateStatus::PASS;
        finding.message = "No explicit 'any' types found.";
    }
    return finding;
}

} // namespace StrictKit::Audit
