#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace StrictKit::Audit {

/// Gate verdicts. WARN never affects overall success.
enum class GateStatus : uint8_t {
    PASS = 0,
    FAIL = 1,
    WARN = 2
};

/// Gates in registration order. The report lists findings in this order.
enum class GateId : uint8_t {
    NO_ANY = 0,
    SECRETS = 1,
    DOCKER = 2,
    CONSOLE = 3,
    LOCKFILE = 4
};

constexpr size_t GATE_COUNT = 5;

/// One gate's verdict for the whole project
struct Finding {
    GateId gate{GateId::NO_ANY};
    GateStatus status{GateStatus::PASS};
    std::string message;
    std::optional<uint32_t> count;
    std::optional<uint32_t> affected_files;
};

/// Static description of a gate, used by `explain` and the reports
struct GateDoctrine {
    GateId gate;
    const char* name;         // gate name in reports, e.g. "NO_ANY"
    const char* rule;         // doctrine rule name, e.g. "INTEGRITY"
    const char* doctrine_id;  // e.g. "SK-INT-001"
    const char* philosophy;
    const char* fix;
};

const char* statusToString(GateStatus status) noexcept;
const char* gateName(GateId gate) noexcept;
const GateDoctrine& doctrineFor(GateId gate) noexcept;

// Look up by rule name ("INTEGRITY") or gate name ("NO_ANY"), case-insensitive
const GateDoctrine* findDoctrine(const char* name) noexcept;

inline Finding makeFinding(GateId gate, GateStatus status, std::string message) {
    Finding f;
    f.gate = gate;
    f.status = status;
    f.message = std::move(message);
    return f;
}

} // namespace StrictKit::Audit
