#pragma once

#include "auditor/any_type_matcher.h"
#include "auditor/gates/gate.h"

namespace StrictKit::Audit {

/// NO_ANY: explicit `any` in TypeScript sources.
///
/// FAIL when at least one `any` keyword type is found, WARN when there are
/// no *.ts/*.tsx files, WARN when none of them could be parsed, PASS
/// otherwise. Unreadable and unparseable files contribute zero.
class TypeEscapeGate : public IGate {
public:
    explicit TypeEscapeGate(const IMarkerCounter& counter) noexcept
        : counter_(counter) {}

    auto id() const noexcept -> GateId override { return GateId::NO_ANY; }
    auto evaluate(const GateInput& input) const -> Finding override;

private:
    const IMarkerCounter& counter_;
};

} // namespace StrictKit::Audit
