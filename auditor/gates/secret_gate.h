#pragma once

#include <regex>
#include <string>
#include <vector>

#include "auditor/gates/gate.h"

namespace StrictKit::Audit {

/// SECRETS: credential signatures committed to source and config files.
///
/// Lockfiles, .env* files and test-designated paths are not scanned. Each
/// file stops at its first matching signature. Any match yields the
/// configured severity (FAIL unless SECRET_SEVERITY=WARN).
class SecretGate : public IGate {
public:
    struct Signature {
        const char* name;
        std::regex pattern;
    };

    // Lines longer than this are skipped; minified bundles are not scanned
    static constexpr size_t MAX_LINE_BYTES = 64 * 1024;

    SecretGate();

    auto id() const noexcept -> GateId override { return GateId::SECRETS; }
    auto evaluate(const GateInput& input) const -> Finding override;

    // Name of the first signature found in `content`, or nullptr
    auto firstMatch(const std::string& content) const -> const char*;

    static auto isExcludedPath(const std::string& rel_path) -> bool;

private:
    std::vector<Signature> signatures_;
};

} // namespace StrictKit::Audit
