#pragma once

#include <cstdint>
#include <cstddef>

#include "common/macros.h"

namespace StrictKit {

/// Status a gate reports when the policy it enforces is violated.
enum class ViolationSeverity : uint8_t {
    FAIL = 0,
    WARN = 1
};

// Fixed-size configuration structure, filled from a KEY=VALUE file
struct AuditConfig {
    // Logging
    char logs_dir[256]{"/tmp"};
    char log_level[16]{"INFO"};

    // Gate policy
    ViolationSeverity secret_severity{ViolationSeverity::FAIL};
    bool parallel_gates{false};

    // Extra directory names skipped by enumeration, comma separated
    char extra_ignore_dirs[512]{};

    // Telemetry
    bool telemetry_enabled{true};
    char telemetry_endpoint[256]{"https://www.strictkit.dev/api/telemetry"};
    uint32_t telemetry_timeout_ms{1500};

    bool is_valid{false};
};

class ConfigManager {
public:
    static constexpr const char* DEFAULT_FILE_NAME = ".strictkit.conf";
    static constexpr uint32_t MAX_TELEMETRY_TIMEOUT_MS = 10000;
    static constexpr size_t MAX_DIAGNOSTICS = 16;
    static constexpr size_t MAX_DIAGNOSTIC_LEN = 256;

    /// Build the process configuration.
    ///
    /// `config_file` is read when given; otherwise `<root>/.strictkit.conf`
    /// is read if it exists. Environment overrides are applied last.
    /// Returns false only when an explicitly named file cannot be opened.
    [[nodiscard]] static auto init(const char* config_file, const char* root_path) noexcept -> bool;

    [[nodiscard]] static auto getConfig() noexcept -> const AuditConfig& {
        return config_;
    }

    [[nodiscard]] static auto isInitialized() noexcept -> bool {
        return initialized_ && config_.is_valid;
    }

    // Parse a whole file into `out`. False if the file cannot be opened.
    [[nodiscard]] static auto parseFile(const char* path, AuditConfig& out) noexcept -> bool;

    // Apply one "KEY=VALUE" line; comments and blank lines are ignored.
    // Returns false for lines that are neither blank, comment nor a known key.
    static auto parseLine(const char* line, AuditConfig& out) noexcept -> bool;

    // STRICTKIT_LOGS_DIR and STRICTKIT_TELEMETRY=off
    static auto applyEnvOverrides(AuditConfig& out) noexcept -> void;

    static auto reset() noexcept -> void;

    /// Problems found while parsing: unknown keys, malformed values.
    /// Parsing runs before the logger starts, so callers report these
    /// once logging is up. Cleared by init() and reset().
    [[nodiscard]] static auto diagnosticCount() noexcept -> size_t {
        return diagnostic_count_;
    }
    [[nodiscard]] static auto diagnostic(size_t index) noexcept -> const char*;

    // Emit collected diagnostics through LOG_WARN and to stderr
    static auto reportDiagnostics() noexcept -> void;

private:
    static AuditConfig config_;
    static bool initialized_;
    static char diagnostics_[MAX_DIAGNOSTICS][MAX_DIAGNOSTIC_LEN];
    static size_t diagnostic_count_;

    static auto addDiagnostic(const char* format, ...) noexcept -> void
        __attribute__((format(printf, 1, 2)));

    static auto parseBool(const char* value, bool* out) noexcept -> bool;
};

} // namespace StrictKit
