#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace StrictKit::Audit {

/// Counts escape-hatch type markers in one source unit.
class IMarkerCounter {
public:
    virtual ~IMarkerCounter() = default;

    // nullopt when the unit could not be parsed at all
    virtual auto countEscapeMarkers(const std::string& path, std::string_view content) const
        -> std::optional<uint32_t> = 0;
};

/// Syntax-tree based counter for the TypeScript `any` keyword type.
///
/// Parses with the TypeScript grammar, or the TSX grammar for *.tsx, and
/// counts every `predefined_type` node spelled `any`. Union members,
/// mapped-type values, return types, type arguments, array element types
/// and `as any` assertions are all reached by the same traversal, while
/// `any` inside comments, strings and identifiers never is.
///
/// Trees with recoverable syntax errors are still counted. A unit is a
/// parse failure only when the parser produces no tree.
class AnyTypeMatcher : public IMarkerCounter {
public:
    auto countEscapeMarkers(const std::string& path, std::string_view content) const
        -> std::optional<uint32_t> override;

    static auto isTsxPath(const std::string& path) noexcept -> bool;
};

} // namespace StrictKit::Audit
