#pragma once

#include <regex>
#include <string>

#include "auditor/gates/gate.h"

namespace StrictKit::Audit {

/// CONSOLE: console.log() call sites left in shipped scripts.
///
/// Comments and string literals are masked before matching, so only real
/// call sites count. Test-designated paths are skipped.
class DebugOutputGate : public IGate {
public:
    DebugOutputGate();

    auto id() const noexcept -> GateId override { return GateId::CONSOLE; }
    auto evaluate(const GateInput& input) const -> Finding override;

    // Call sites in raw source text, after masking
    auto countCallSites(const std::string& source) const -> uint32_t;

private:
    std::regex call_pattern_;
};

} // namespace StrictKit::Audit
