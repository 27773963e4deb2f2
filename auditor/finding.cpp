#include "auditor/finding.h"

#include <strings.h>

namespace StrictKit::Audit {

namespace {

constexpr GateDoctrine DOCTRINES[GATE_COUNT] = {
    {
        GateId::NO_ANY, "NO_ANY", "INTEGRITY", "SK-INT-001",
        "The \"any\" type is a silent virus. It disables the compiler and hides technical debt.",
        "Use unknown, interfaces, or generics to maintain type safety."
    },
    {
        GateId::SECRETS, "SECRETS", "SECURITY", "SK-SEC-001",
        "Hardcoded secrets are a liability. Environment variables are the only standard.",
        "Move secrets to .env and ensure .env is in .gitignore."
    },
    {
        GateId::DOCKER, "DOCKER", "INFRA", "SK-INF-001",
        "Unpinned Docker images create non-deterministic builds.",
        "Use specific tags (e.g., node:20-alpine) or a sha256 digest instead of :latest."
    },
    {
        GateId::CONSOLE, "CONSOLE", "CONSOLE", "SK-DBG-001",
        "Debug output left in production code leaks internals and drowns real logs.",
        "Remove console.log() calls or route them through a proper logger."
    },
    {
        GateId::LOCKFILE, "LOCKFILE", "LOCKFILE", "SK-DEP-001",
        "Without a lockfile every install resolves a different dependency tree.",
        "Commit package-lock.json, yarn.lock, pnpm-lock.yaml or bun.lockb."
    }
};

} // namespace

const char* statusToString(GateStatus status) noexcept {
    switch (status) {
        case GateStatus::PASS: return "PASS";
        case GateStatus::FAIL: return "FAIL";
        case GateStatus::WARN: return "WARN";
        default: return "UNKNOWN";
    }
}

const char* gateName(GateId gate) noexcept {
    return doctrineFor(gate).name;
}

const GateDoctrine& doctrineFor(GateId gate) noexcept {
    return DOCTRINES[static_cast<size_t>(gate)];
}

const GateDoctrine* findDoctrine(const char* name) noexcept {
    if (!name) return nullptr;
    for (const auto& d : DOCTRINES) {
        if (strcasecmp(name, d.rule) == 0 || strcasecmp(name, d.name) == 0) {
            return &d;
        }
    }
    return nullptr;
}

} // namespace StrictKit::Audit
