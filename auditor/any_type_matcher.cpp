#include "auditor/any_type_matcher.h"

#include <cstring>
#include <limits>
#include <memory>

#include <tree_sitter/api.h>

#include "common/logging.h"

// Grammars from tree-sitter-typescript
extern "C" {
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
}

namespace StrictKit::Audit {

namespace {

struct ParserDeleter {
    void operator()(TSParser* p) const noexcept { ts_parser_delete(p); }
};

struct TreeDeleter {
    void operator()(TSTree* t) const noexcept { ts_tree_delete(t); }
};

using ParserPtr = std::unique_ptr<TSParser, ParserDeleter>;
using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

constexpr const char* ANY_TYPE_NODE = "predefined_type";
constexpr std::string_view ANY_KEYWORD = "any";

bool isAnyKeywordType(TSNode node, std::string_view content) noexcept {
    if (std::strcmp(ts_node_type(node), ANY_TYPE_NODE) != 0) return false;
    const uint32_t start = ts_node_start_byte(node);
    const uint32_t end = ts_node_end_byte(node);
    if (end <= start || end > content.size()) return false;
    return content.substr(start, end - start) == ANY_KEYWORD;
}

// Pre-order walk with a cursor; no recursion, so deep trees are safe
uint32_t countAnyNodes(TSNode root, std::string_view content) noexcept {
    uint32_t count = 0;
    TSTreeCursor cursor = ts_tree_cursor_new(root);

    for (;;) {
        const TSNode node = ts_tree_cursor_current_node(&cursor);
        if (isAnyKeywordType(node, content)) {
            ++count;
        }

        if (ts_tree_cursor_goto_first_child(&cursor)) continue;
        if (ts_tree_cursor_goto_next_sibling(&cursor)) continue;

        bool advanced = false;
        while (ts_tree_cursor_goto_parent(&cursor)) {
            if (ts_tree_cursor_goto_next_sibling(&cursor)) {
                advanced = true;
                break;
            }
        }
        if (!advanced) break;
    }

    ts_tree_cursor_delete(&cursor);
    return count;
}

} // namespace

auto AnyTypeMatcher::isTsxPath(const std::string& path) noexcept -> bool {
    constexpr std::string_view suffix = ".tsx";
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto AnyTypeMatcher::countEscapeMarkers(const std::string& path, std::string_view content) const
    -> std::optional<uint32_t> {
    if (content.size() > std::numeric_limits<uint32_t>::max()) {
        LOG_WARN("Source too large to parse: %s", path.c_str());
        return std::nullopt;
    }

    ParserPtr parser(ts_parser_new());
    if (!parser) {
        LOG_ERROR("tree-sitter parser allocation failed for %s", path.c_str());
        return std::nullopt;
    }

    const TSLanguage* language = isTsxPath(path) ? tree_sitter_tsx() : tree_sitter_typescript();
    if (!ts_parser_set_language(parser.get(), language)) {
        LOG_ERROR("tree-sitter grammar version mismatch while parsing %s", path.c_str());
        return std::nullopt;
    }

    TreePtr tree(ts_parser_parse_string(parser.get(), nullptr, content.data(),
                                        static_cast<uint32_t>(content.size())));
    if (!tree) {
        LOG_WARN("Parse failed: %s", path.c_str());
        return std::nullopt;
    }

    const TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        LOG_DEBUG("Syntax errors recovered while parsing %s", path.c_str());
    }

    return countAnyNodes(root, content);
}

} // namespace StrictKit::Audit
