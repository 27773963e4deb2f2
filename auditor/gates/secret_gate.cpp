#include "auditor/gates/secret_gate.h"

#include <cstddef>
#include <cstdio>

#include "common/logging.h"

namespace StrictKit::Audit {

namespace {

constexpr const char* LOCKFILE_NAMES[] = {
    "package-lock.json", "npm-shrinkwrap.json", "pnpm-lock.yaml", "yarn.lock", "bun.lockb"
};

// Signatures never span lines, so every line is searched on its own
template <typename Fn>
void forEachLine(const std::string& content, Fn&& fn) {
    size_t start = 0;
    while (start <= content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) end = content.size();
        if (!fn(start, end - start)) return;
        start = end + 1;
    }
}

} // namespace

SecretGate::SecretGate() {
    const auto flags = std::regex::ECMAScript | std::regex::optimize;

    signatures_.push_back({"stripe-live-key", std::regex(R"(sk_live_[0-9a-zA-Z]{24})", flags)});
    signatures_.push_back({"aws-access-key-id", std::regex(R"(AKIA[0-9A-Z]{16})", flags)});
    signatures_.push_back({"github-token", std::regex(R"(gh[pousr]_[A-Za-z0-9]{36})", flags)});
    signatures_.push_back({"openai-key", std::regex(R"(\bsk-[A-Za-z0-9]{32})", flags)});
    signatures_.push_back({"google-api-key", std::regex(R"(AIza[0-9A-Za-z_\-]{35})", flags)});
    signatures_.push_back({"private-key-block",
        std::regex(R"(-----BEGIN (RSA |EC |DSA |OPENSSH )?PRIVATE KEY-----)", flags)});
    // Repetitions stay bounded; std::regex recursion depth grows with every
    // repeated character
    signatures_.push_back({"bearer-jwt",
        std::regex(R"([Bb]earer\s{1,16}[A-Za-z0-9_\-]{10,1024}\.[A-Za-z0-9_\-]{10,2048}\.[A-Za-z0-9_\-]{10,1024})",
                   flags)});
    signatures_.push_back({"quoted-api-key",
        std::regex(R"(["'](api_key|apikey|secret_key)["']\s{0,16}[:=]\s{0,16}["'][^"'\r\n]{10,512}["'])",
                   flags | std::regex::icase)});
}

auto SecretGate::isExcludedPath(const std::string& rel_path) -> bool {
    const std::string name = baseName(rel_path);
    if (name.compare(0, 4, ".env") == 0) return true;
    for (const char* lockfile : LOCKFILE_NAMES) {
        if (name == lockfile) return true;
    }
    return isTestDesignatedPath(rel_path);
}

auto SecretGate::firstMatch(const std::string& content) const -> const char* {
    const char* found = nullptr;

    forEachLine(content, [&](size_t offset, size_t length) {
        if (length > MAX_LINE_BYTES) {
            LOG_DEBUG("SECRETS: skipping %zu byte line", length);
            return true;
        }
        const auto first = content.cbegin() + static_cast<std::ptrdiff_t>(offset);
        const auto last = first + static_cast<std::ptrdiff_t>(length);
        for (const auto& sig : signatures_) {
            if (std::regex_search(first, last, sig.pattern)) {
                found = sig.name;
                return false;
            }
        }
        return true;
    });

    return found;
}

auto SecretGate::evaluate(const GateInput& input) const -> Finding {
    const auto files = input.files.listFiles(Extensions::secretScan());

    std::vector<std::string> offenders;
    uint32_t scanned = 0;

    for (const auto& path : files) {
        if (isExcludedPath(path)) continue;

        const auto content = input.reader.read(path);
        if (!content) continue;
        ++scanned;

        if (const char* sig = firstMatch(*content)) {
            LOG_WARN("SECRETS: %s signature in %s", sig, path.c_str());
            offenders.push_back(path);
        }
    }

    LOG_INFO("SECRETS: %u file(s) scanned, %zu with secrets", scanned, offenders.size());

    Finding finding;
    finding.gate = GateId::SECRETS;
    finding.affected_files = static_cast<uint32_t>(offenders.size());

    if (offenders.empty()) {
        finding.status = GateStatus::PASS;
        finding.message = "No obvious secret patterns detected.";
        return finding;
    }

    finding.status = input.config.secret_severity == ViolationSeverity::WARN
        ? GateStatus::WARN : GateStatus::FAIL;
    finding.message = "Secrets detected in " + offenders.front();
    if (offenders.size() > 1) {
        char tail[64];
        snprintf(tail, sizeof(tail), " (and %zu other file(s))", offenders.size() - 1);
        finding.message += tail;
    }
    return finding;
}

} // namespace StrictKit::Audit
