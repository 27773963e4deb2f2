#pragma once

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "auditor/report.h"
#include "config/config_manager.h"

namespace StrictKit::Audit {

struct TelemetryEvent {
    std::string anonymous_id;
    std::string source;      // "ci", "container" or "local"
    std::string version;
    std::string result;      // "PASS" or "FAIL"
    std::vector<std::string> rules_broken;
    std::string timestamp;
};

/// Anonymous, opt-out usage event sent after an audit.
///
/// The POST runs on a background thread with the configured timeout and
/// never changes the audit outcome. The destructor waits for it, so the
/// process exits at most TELEMETRY_TIMEOUT_MS after the report is out.
class TelemetryClient {
public:
    static constexpr const char* EVENT_NAME = "audit_completed";
    static constexpr const char* ID_DIR = ".strictkit";
    static constexpr const char* ID_FILE = "anon-id";
    static constexpr const char* UNKNOWN_ID = "unknown-machine";

    explicit TelemetryClient(const AuditConfig& config);
    ~TelemetryClient();

    /// Start sending the event for `report`. False when telemetry is
    /// disabled or the sender could not be started.
    auto trackAudit(const Report& report) -> bool;

    // Block until the in-flight request, if any, is finished
    void wait() noexcept;

    [[nodiscard]] auto isEnabled() const noexcept -> bool { return enabled_; }

    static auto buildEvent(const Report& report, const char* home_dir) -> TelemetryEvent;
    static auto buildPayload(const TelemetryEvent& event) -> std::string;

    // "ci" when CI, GITHUB_ACTIONS or GITLAB_CI is set, "container" when
    // /.dockerenv exists, "local" otherwise
    static auto detectSource() noexcept -> const char*;

    // Read <home>/.strictkit/anon-id, creating it with a random 128-bit hex
    // id on first use. UNKNOWN_ID if it can be neither read nor created.
    static auto loadOrCreateAnonymousId(const char* home_dir) -> std::string;

    static auto isDebugEnabled() noexcept -> bool;

    // Delete copy/move operations
    TelemetryClient(const TelemetryClient&) = delete;
    TelemetryClient& operator=(const TelemetryClient&) = delete;
    TelemetryClient(TelemetryClient&&) = delete;
    TelemetryClient& operator=(TelemetryClient&&) = delete;

private:
    void post(const std::string& payload) const noexcept;

    bool enabled_;
    std::string endpoint_;
    uint32_t timeout_ms_;
    std::thread sender_;
};

} // namespace StrictKit::Audit
