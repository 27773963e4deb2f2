#pragma once

#include "auditor/gates/gate.h"

namespace StrictKit::Audit {

/// LOCKFILE: a dependency lockfile must exist at the project root.
class LockfileGate : public IGate {
public:
    static constexpr const char* LOCKFILES[] = {
        "package-lock.json", "yarn.lock", "pnpm-lock.yaml", "bun.lockb"
    };

    auto id() const noexcept -> GateId override { return GateId::LOCKFILE; }
    auto evaluate(const GateInput& input) const -> Finding override;
};

} // namespace StrictKit::Audit
