#include "auditor/gates/lockfile_gate.h"

#include "common/logging.h"

namespace StrictKit::Audit {

auto LockfileGate::evaluate(const GateInput& input) const -> Finding {
    for (const char* name : LOCKFILES) {
        if (input.reader.exists(name)) {
            LOG_INFO("LOCKFILE: found %s", name);
            return makeFinding(GateId::LOCKFILE, GateStatus::PASS,
                               std::string("Dependency lockfile present (") + name + ").");
        }
    }

    LOG_WARN("LOCKFILE: no lockfile at project root");
    return makeFinding(GateId::LOCKFILE, GateStatus::FAIL,
                       "No dependency lockfile found (package-lock.json, yarn.lock, "
                       "pnpm-lock.yaml or bun.lockb).");
}

} // namespace StrictKit::Audit
