#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "auditor/gates/gate.h"

namespace StrictKit::Audit {

/// How firmly a FROM image reference is pinned
enum class ImagePin : uint8_t {
    STRONG = 0,   // explicit non-floating tag, or a sha256 digest
    WEAK = 1,     // no tag, :latest or a floating alias
    SKIPPED = 2   // scratch, earlier build stage, or unresolved ${ARG}
};

struct FromInstruction {
    std::string image;
    std::string stage_name;  // from "AS <name>", may be empty
    uint32_t line{0};
};

/// DOCKER: base images in the root Dockerfile must be pinned.
///
/// FAIL if any FROM reference is weak, WARN if there is no Dockerfile,
/// PASS otherwise.
class ContainerGate : public IGate {
public:
    static constexpr const char* DOCKERFILE = "Dockerfile";

    auto id() const noexcept -> GateId override { return GateId::DOCKER; }
    auto evaluate(const GateInput& input) const -> Finding override;

    // FROM instructions in file order; continuation lines are joined,
    // comments ignored and the keyword matched case-insensitively.
    static auto parseFromInstructions(const std::string& dockerfile)
        -> std::vector<FromInstruction>;

    // Classify one image reference. `stages` holds earlier stage names,
    // lower-cased.
    static auto classify(const std::string& image, const std::vector<std::string>& stages)
        -> ImagePin;

    static auto isFloatingTag(const std::string& tag) noexcept -> bool;
};

} // namespace StrictKit::Audit
