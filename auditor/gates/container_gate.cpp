#include "auditor/gates/container_gate.h"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <strings.h>
#include <utility>

#include "common/logging.h"

namespace StrictKit::Audit {

namespace {

constexpr const char* FLOATING_TAGS[] = {
    "latest", "stable", "lts", "current", "edge", "nightly", "rolling"
};

constexpr std::string_view DIGEST_PREFIX = "sha256:";
constexpr size_t DIGEST_HEX_LEN = 64;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitWords(const std::string& line) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        const size_t start = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i > start) words.push_back(line.substr(start, i - start));
    }
    return words;
}

bool isValidDigest(std::string_view digest) noexcept {
    if (digest.substr(0, DIGEST_PREFIX.size()) != DIGEST_PREFIX) return false;
    const auto hex = digest.substr(DIGEST_PREFIX.size());
    if (hex.size() != DIGEST_HEX_LEN) return false;
    // OCI digests are lowercase hex
    return std::all_of(hex.begin(), hex.end(),
                       [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

} // namespace

auto ContainerGate::isFloatingTag(const std::string& tag) noexcept -> bool {
    for (const char* floating : FLOATING_TAGS) {
        if (strcasecmp(tag.c_str(), floating) == 0) return true;
    }
    return false;
}

auto ContainerGate::parseFromInstructions(const std::string& dockerfile)
    -> std::vector<FromInstruction> {
    std::vector<FromInstruction> out;

    std::string logical;
    uint32_t logical_start = 0;
    uint32_t line_no = 0;
    size_t pos = 0;

    while (pos <= dockerfile.size()) {
        size_t end = dockerfile.find('\n', pos);
        if (end == std::string::npos) end = dockerfile.size();
        std::string line = dockerfile.substr(pos, end - pos);
        pos = end + 1;
        ++line_no;

        if (!line.empty() && line.back() == '\r') line.pop_back();

        const size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        if (line[first] == '#') continue;

        if (logical.empty()) logical_start = line_no;

        const size_t last = line.find_last_not_of(" \t");
        if (line[last] == '\\') {
            logical += line.substr(0, last);
            logical += ' ';
            continue;
        }
        logical += line;

        const auto words = splitWords(logical);
        logical.clear();

        if (words.empty() || strcasecmp(words[0].c_str(), "FROM") != 0) continue;

        size_t i = 1;
        while (i < words.size() && words[i].compare(0, 2, "--") == 0) ++i;
        if (i >= words.size()) {
            LOG_WARN("DOCKER: FROM without image at line %u", logical_start);
            continue;
        }

        FromInstruction from;
        from.image = words[i];
        from.line = logical_start;
        if (i + 2 < words.size() && strcasecmp(words[i + 1].c_str(), "AS") == 0) {
            from.stage_name = words[i + 2];
        }
        out.push_back(std::move(from));
    }

    return out;
}

auto ContainerGate::classify(const std::string& image, const std::vector<std::string>& stages)
    -> ImagePin {
    const std::string lowered = toLower(image);
    if (lowered == "scratch") return ImagePin::SKIPPED;
    if (std::find(stages.begin(), stages.end(), lowered) != stages.end()) return ImagePin::SKIPPED;

    if (image.find('$') != std::string::npos) {
        LOG_DEBUG("DOCKER: build argument in image reference %s, not evaluated", image.c_str());
        return ImagePin::SKIPPED;
    }

    const size_t at = image.find('@');
    if (at != std::string::npos) {
        return isValidDigest(std::string_view(image).substr(at + 1)) ? ImagePin::STRONG
                                                                      : ImagePin::WEAK;
    }

    // A ':' before the last '/' belongs to a registry port, not a tag
    const size_t slash = image.find_last_of('/');
    const size_t colon = image.find(':', slash == std::string::npos ? 0 : slash + 1);
    if (colon == std::string::npos) return ImagePin::WEAK;

    const std::string tag = image.substr(colon + 1);
    if (tag.empty() || isFloatingTag(tag)) return ImagePin::WEAK;
    return ImagePin::STRONG;
}

auto ContainerGate::evaluate(const GateInput& input) const -> Finding {
    if (!input.reader.exists(DOCKERFILE)) {
        return makeFinding(GateId::DOCKER, GateStatus::WARN, "No Dockerfile found at project root.");
    }

    const auto content = input.reader.read(DOCKERFILE);
    if (!content) {
        return makeFinding(GateId::DOCKER, GateStatus::WARN, "Dockerfile could not be read.");
    }

    const auto instructions = parseFromInstructions(*content);
    if (instructions.empty()) {
        return makeFinding(GateId::DOCKER, GateStatus::PASS, "Dockerfile has no FROM instruction.");
    }

    std::vector<std::string> stages;
    std::vector<std::string> weak;

    for (const auto& from : instructions) {
        const ImagePin pin = classify(from.image, stages);
        if (pin == ImagePin::WEAK) {
            LOG_WARN("DOCKER: unpinned image %s at line %u", from.image.c_str(), from.line);
            weak.push_back(from.image);
        }
        if (!from.stage_name.empty()) {
            stages.push_back(toLower(from.stage_name));
        }
    }

    Finding finding;
    finding.gate = GateId::DOCKER;
    finding.count = static_cast<uint32_t>(weak.size());

    if (weak.empty()) {
        finding.status = GateStatus::PASS;
        finding.message = "Docker base images are pinned.";
        return finding;
    }

    finding.status = GateStatus::FAIL;
    finding.message = "Unpinned base image(s): ";
    for (size_t i = 0; i < weak.size(); ++i) {
        if (i > 0) finding.message += ", ";
        finding.message += weak[i];
    }
    return finding;
}

} // namespace StrictKit::Audit
