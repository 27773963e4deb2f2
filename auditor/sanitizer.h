#pragma once

#include <string>
#include <string_view>

namespace StrictKit::Audit {

/// Comment and string-literal masking for the regex-driven gates.
///
/// Both functions are total and pure. When both are needed, run
/// stripComments first: its "://" heuristic cannot tell a URL inside a
/// string from one in code, so stripping strings first is not equivalent.

// Removes /* ... */ spans (shortest match, may cross lines), then every
// "//" to end of line unless the "//" directly follows a ':'.
std::string stripComments(std::string_view code);

// Collapses `...` to "", "..." to "" and '...' to '' in that order.
// Backslash escapes are honored inside double and single quotes only.
std::string stripStrings(std::string_view code);

} // namespace StrictKit::Audit
