#include "auditor/telemetry.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

#include <curl/curl.h>
#include <openssl/rand.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "common/logging.h"
#include "common/thread_utils.h"

namespace StrictKit::Audit {

namespace {

constexpr size_t ID_BYTES = 16;

size_t discardBody(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

bool envSet(const char* name) noexcept {
    const char* value = getenv(name);
    return value && *value;
}

std::string trimmed(const char* s, size_t len) {
    size_t start = 0;
    while (start < len && (s[start] == ' ' || s[start] == '\t' ||
                           s[start] == '\n' || s[start] == '\r')) ++start;
    while (len > start && (s[len - 1] == ' ' || s[len - 1] == '\t' ||
                           s[len - 1] == '\n' || s[len - 1] == '\r')) --len;
    return std::string(s + start, len - start);
}

} // namespace

TelemetryClient::TelemetryClient(const AuditConfig& config)
    : enabled_(config.telemetry_enabled),
      endpoint_(config.telemetry_endpoint),
      timeout_ms_(config.telemetry_timeout_ms) {
}

TelemetryClient::~TelemetryClient() {
    wait();
}

void TelemetryClient::wait() noexcept {
    if (sender_.joinable()) {
        sender_.join();
    }
}

auto TelemetryClient::isDebugEnabled() noexcept -> bool {
    const char* value = getenv("STRICTKIT_DEBUG");
    return value && strcmp(value, "true") == 0;
}

auto TelemetryClient::detectSource() noexcept -> const char* {
    if (envSet("CI") || envSet("GITHUB_ACTIONS") || envSet("GITLAB_CI")) return "ci";
    if (access("/.dockerenv", F_OK) == 0) return "container";
    return "local";
}

auto TelemetryClient::loadOrCreateAnonymousId(const char* home_dir) -> std::string {
    if (!home_dir || !*home_dir) return UNKNOWN_ID;

    char dir_path[512];
    char id_path[512];
    snprintf(dir_path, sizeof(dir_path), "%s/%s", home_dir, ID_DIR);
    snprintf(id_path, sizeof(id_path), "%s/%s", dir_path, ID_FILE);

    if (mkdir(dir_path, 0700) != 0 && errno != EEXIST) {
        LOG_DEBUG("Telemetry: cannot create %s: %s", dir_path, strerror(errno));
        return UNKNOWN_ID;
    }

    // Existing id
    int fd = open(id_path, O_RDONLY);
    if (fd >= 0) {
        char buffer[128];
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        close(fd);
        if (n > 0) {
            std::string id = trimmed(buffer, static_cast<size_t>(n));
            if (!id.empty()) return id;
        }
    }

    unsigned char bytes[ID_BYTES];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        LOG_WARN("Telemetry: RAND_bytes failed");
        return UNKNOWN_ID;
    }

    char hex[ID_BYTES * 2 + 1];
    for (size_t i = 0; i < ID_BYTES; ++i) {
        snprintf(hex + i * 2, 3, "%02x", bytes[i]);
    }

    fd = open(id_path, O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        LOG_DEBUG("Telemetry: cannot write %s: %s", id_path, strerror(errno));
        return UNKNOWN_ID;
    }
    const ssize_t written = write(fd, hex, ID_BYTES * 2);
    close(fd);
    if (written != static_cast<ssize_t>(ID_BYTES * 2)) {
        return UNKNOWN_ID;
    }

    return std::string(hex, ID_BYTES * 2);
}

auto TelemetryClient::buildEvent(const Report& report, const char* home_dir) -> TelemetryEvent {
    TelemetryEvent event;
    event.anonymous_id = loadOrCreateAnonymousId(home_dir);
    event.source = detectSource();
    event.version = report.meta.version;
    event.result = report.success ? "PASS" : "FAIL";
    event.rules_broken = brokenRuleIds(report);
    event.timestamp = report.meta.timestamp;
    return event;
}

auto TelemetryClient::buildPayload(const TelemetryEvent& event) -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);

    w.StartObject();
    w.Key("event");       w.String(EVENT_NAME);
    w.Key("anonymousId"); w.String(event.anonymous_id.c_str());
    w.Key("source");      w.String(event.source.c_str());
    w.Key("version");     w.String(event.version.c_str());
    w.Key("result");      w.String(event.result.c_str());
    w.Key("rulesBroken");
    w.StartArray();
    for (const auto& id : event.rules_broken) {
        w.String(id.c_str());
    }
    w.EndArray();
    w.Key("timestamp");   w.String(event.timestamp.c_str());
    w.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

auto TelemetryClient::trackAudit(const Report& report) -> bool {
    if (!enabled_) {
        LOG_DEBUG("Telemetry disabled");
        return false;
    }
    if (sender_.joinable()) {
        LOG_WARN("Telemetry: event already in flight");
        return false;
    }

    const std::string payload = buildPayload(buildEvent(report, getenv("HOME")));

    try {
        sender_ = Common::createNamedThread("sk-telemetry", [this, payload] { post(payload); });
    } catch (const std::system_error& e) {
        LOG_WARN("Telemetry: cannot start sender: %s", e.what());
        return false;
    }
    return true;
}

void TelemetryClient::post(const std::string& payload) const noexcept {
    const bool debug = isDebugEnabled();

    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_WARN("Telemetry: curl_easy_init failed");
        return;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardBody);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        LOG_DEBUG("Telemetry: %s", curl_easy_strerror(res));
        if (debug) fprintf(stderr, "[Telemetry Error] %s\n", curl_easy_strerror(res));
    } else {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        LOG_DEBUG("Telemetry: HTTP %ld", http_code);
        if (debug) fprintf(stderr, "[Telemetry] Status: %ld\n", http_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
}

} // namespace StrictKit::Audit
