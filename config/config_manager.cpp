#include "config/config_manager.h"

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

#include "common/logging.h"

namespace StrictKit {

// Static member definitions
AuditConfig ConfigManager::config_{};
bool ConfigManager::initialized_ = false;
char ConfigManager::diagnostics_[MAX_DIAGNOSTICS][MAX_DIAGNOSTIC_LEN]{};
size_t ConfigManager::diagnostic_count_ = 0;

namespace {

// Trim leading/trailing whitespace in place, returns the new start
char* trim(char* s) noexcept {
    while (*s && std::isspace(static_cast<unsigned char>(*s))) ++s;
    size_t len = std::strlen(s);
    while (len > 0 && std::isspace(static_cast<unsigned char>(s[len - 1]))) {
        s[--len] = '\0';
    }
    return s;
}

bool fileExists(const char* path) noexcept {
    struct stat st;
    return stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

auto ConfigManager::init(const char* config_file, const char* root_path) noexcept -> bool {
    AuditConfig cfg{};
    diagnostic_count_ = 0;

    if (config_file) {
        if (!parseFile(config_file, cfg)) {
            std::fprintf(stderr, "Failed to open config file: %s\n", config_file);
            return false;
        }
    } else if (root_path) {
        char default_path[1024];
        std::snprintf(default_path, sizeof(default_path), "%s/%s", root_path, DEFAULT_FILE_NAME);
        if (fileExists(default_path) && !parseFile(default_path, cfg)) {
            std::fprintf(stderr, "Warning: could not read %s, using defaults\n", default_path);
        }
    }

    applyEnvOverrides(cfg);

    cfg.is_valid = true;
    config_ = cfg;
    initialized_ = true;
    return true;
}

auto ConfigManager::parseFile(const char* path, AuditConfig& out) noexcept -> bool {
    FILE* fp = std::fopen(path, "r");
    if (!fp) {
        return false;
    }

    char line[1024];
    uint32_t line_num = 0;
    while (std::fgets(line, sizeof(line), fp)) {
        ++line_num;
        if (!parseLine(line, out)) {
            line[std::strcspn(line, "\r\n")] = '\0';
            addDiagnostic("%s:%u: ignoring unrecognized line '%s'", path, line_num, line);
        }
    }

    std::fclose(fp);
    return true;
}

auto ConfigManager::parseLine(const char* raw, AuditConfig& out) noexcept -> bool {
    char buf[1024];
    SAFE_STRCPY(buf, raw);

    char* line = trim(buf);
    if (line[0] == '\0' || line[0] == '#') {
        return true;
    }

    char* eq = std::strchr(line, '=');
    if (!eq) {
        return false;
    }
    *eq = '\0';
    const char* key = trim(line);
    const char* value = trim(eq + 1);

    if (std::strcmp(key, "LOGS_DIR") == 0) {
        SAFE_STRCPY(out.logs_dir, value);
    } else if (std::strcmp(key, "LOG_LEVEL") == 0) {
        SAFE_STRCPY(out.log_level, value);
    } else if (std::strcmp(key, "SECRET_SEVERITY") == 0) {
        if (std::strcmp(value, "WARN") == 0) {
            out.secret_severity = ViolationSeverity::WARN;
        } else if (std::strcmp(value, "FAIL") == 0) {
            out.secret_severity = ViolationSeverity::FAIL;
        } else {
            addDiagnostic("SECRET_SEVERITY must be FAIL or WARN, got '%s'", value);
        }
    } else if (std::strcmp(key, "PARALLEL_GATES") == 0) {
        if (!parseBool(value, &out.parallel_gates)) {
            addDiagnostic("PARALLEL_GATES expects true/false, got '%s'", value);
        }
    } else if (std::strcmp(key, "EXTRA_IGNORE_DIRS") == 0) {
        SAFE_STRCPY(out.extra_ignore_dirs, value);
    } else if (std::strcmp(key, "TELEMETRY_ENABLED") == 0) {
        if (!parseBool(value, &out.telemetry_enabled)) {
            addDiagnostic("TELEMETRY_ENABLED expects true/false, got '%s'", value);
        }
    } else if (std::strcmp(key, "TELEMETRY_ENDPOINT") == 0) {
        SAFE_STRCPY(out.telemetry_endpoint, value);
    } else if (std::strcmp(key, "TELEMETRY_TIMEOUT_MS") == 0) {
        char* end = nullptr;
        const unsigned long ms = std::strtoul(value, &end, 10);
        if (end != value && *end == '\0' && ms > 0 && ms <= MAX_TELEMETRY_TIMEOUT_MS) {
            out.telemetry_timeout_ms = static_cast<uint32_t>(ms);
        } else {
            addDiagnostic("TELEMETRY_TIMEOUT_MS out of range: '%s'", value);
        }
    } else {
        return false;
    }

    return true;
}

auto ConfigManager::applyEnvOverrides(AuditConfig& out) noexcept -> void {
    const char* logs_dir = std::getenv("STRICTKIT_LOGS_DIR");
    if (logs_dir && logs_dir[0] != '\0') {
        SAFE_STRCPY(out.logs_dir, logs_dir);
    }

    const char* telemetry = std::getenv("STRICTKIT_TELEMETRY");
    if (telemetry && std::strcmp(telemetry, "off") == 0) {
        out.telemetry_enabled = false;
    }
}

auto ConfigManager::reset() noexcept -> void {
    config_ = AuditConfig{};
    initialized_ = false;
    diagnostic_count_ = 0;
}

auto ConfigManager::diagnostic(size_t index) noexcept -> const char* {
    return index < diagnostic_count_ ? diagnostics_[index] : nullptr;
}

auto ConfigManager::reportDiagnostics() noexcept -> void {
    for (size_t i = 0; i < diagnostic_count_; ++i) {
        LOG_WARN("Config: %s", diagnostics_[i]);
        std::fprintf(stderr, "Warning: config %s\n", diagnostics_[i]);
    }
}

auto ConfigManager::addDiagnostic(const char* format, ...) noexcept -> void {
    if (diagnostic_count_ >= MAX_DIAGNOSTICS) return;
    va_list args;
    va_start(args, format);
    std::vsnprintf(diagnostics_[diagnostic_count_], MAX_DIAGNOSTIC_LEN, format, args);
    va_end(args);
    ++diagnostic_count_;
}

auto ConfigManager::parseBool(const char* value, bool* out) noexcept -> bool {
    if (std::strcmp(value, "true") == 0 || std::strcmp(value, "1") == 0 ||
        std::strcmp(value, "on") == 0) {
        *out = true;
        return true;
    }
    if (std::strcmp(value, "false") == 0 || std::strcmp(value, "0") == 0 ||
        std::strcmp(value, "off") == 0) {
        *out = false;
        return true;
    }
    return false;
}

} // namespace StrictKit
