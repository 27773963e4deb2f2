#include "auditor/sanitizer.h"

namespace StrictKit::Audit {

namespace {

inline bool isLineTerminator(char c) noexcept {
    return c == '\n' || c == '\r';
}

std::string stripBlockComments(std::string_view code) {
    std::string out;
    out.reserve(code.size());

    size_t i = 0;
    while (i < code.size()) {
        if (code[i] == '/' && i + 1 < code.size() && code[i + 1] == '*') {
            const size_t close = code.find("*/", i + 2);
            if (close == std::string_view::npos) {
                // Unterminated: nothing after this point can close either
                out.append(code.substr(i));
                break;
            }
            i = close + 2;
            continue;
        }
        out.push_back(code[i]);
        ++i;
    }
    return out;
}

std::string stripLineComments(std::string_view code) {
    std::string out;
    out.reserve(code.size());

    size_t i = 0;
    while (i < code.size()) {
        if (code[i] == '/' && i + 1 < code.size() && code[i + 1] == '/' &&
            (i == 0 || code[i - 1] != ':')) {
            while (i < code.size() && !isLineTerminator(code[i])) ++i;
            continue;
        }
        out.push_back(code[i]);
        ++i;
    }
    return out;
}

std::string collapseBackticks(std::string_view code) {
    std::string out;
    out.reserve(code.size());

    size_t i = 0;
    while (i < code.size()) {
        if (code[i] == '`') {
            const size_t close = code.find('`', i + 1);
            if (close == std::string_view::npos) {
                out.append(code.substr(i));
                break;
            }
            out.append("\"\"");
            i = close + 1;
            continue;
        }
        out.push_back(code[i]);
        ++i;
    }
    return out;
}

// Returns the index of the closing quote of a literal opened at `start`,
// or npos when no well-formed literal starts there. An escape is a
// backslash followed by any character except a line terminator.
size_t findClosingQuote(std::string_view code, size_t start, char quote) noexcept {
    size_t i = start + 1;
    while (i < code.size()) {
        const char c = code[i];
        if (c == quote) return i;
        if (c == '\\') {
            if (i + 1 >= code.size() || isLineTerminator(code[i + 1])) {
                return std::string_view::npos;
            }
            i += 2;
            continue;
        }
        ++i;
    }
    return std::string_view::npos;
}

std::string collapseQuoted(std::string_view code, char quote) {
    std::string out;
    out.reserve(code.size());

    size_t i = 0;
    while (i < code.size()) {
        if (code[i] == quote) {
            const size_t close = findClosingQuote(code, i, quote);
            if (close != std::string_view::npos) {
                out.push_back(quote);
                out.push_back(quote);
                i = close + 1;
                continue;
            }
        }
        out.push_back(code[i]);
        ++i;
    }
    return out;
}

} // namespace

std::string stripComments(std::string_view code) {
    if (code.empty()) return std::string();
    const std::string without_blocks = stripBlockComments(code);
    return stripLineComments(without_blocks);
}

std::string stripStrings(std::string_view code) {
    if (code.empty()) return std::string();
    std::string out = collapseBackticks(code);
    out = collapseQuoted(out, '"');
    return collapseQuoted(out, '\'');
}

} // namespace StrictKit::Audit
