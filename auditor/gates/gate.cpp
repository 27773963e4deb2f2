#include "auditor/gates/gate.h"

namespace StrictKit::Audit {

namespace Extensions {

const std::vector<std::string>& typescript() {
    static const std::vector<std::string> exts = {".ts", ".tsx"};
    return exts;
}

const std::vector<std::string>& scripts() {
    static const std::vector<std::string> exts = {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs"};
    return exts;
}

const std::vector<std::string>& secretScan() {
    static const std::vector<std::string> exts = {
        ".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs", ".json", ".yml", ".yaml"
    };
    return exts;
}

} // namespace Extensions

namespace {

constexpr const char* TEST_DIR_NAMES[] = {"__tests__", "__mocks__", "test", "tests", "spec"};
constexpr const char* TEST_NAME_MARKERS[] = {".test.", ".spec."};

} // namespace

bool isTestDesignatedPath(const std::string& rel_path) {
    size_t seg_start = 0;
    for (;;) {
        const size_t slash = rel_path.find('/', seg_start);
        if (slash == std::string::npos) break;

        const std::string segment = rel_path.substr(seg_start, slash - seg_start);
        for (const char* dir : TEST_DIR_NAMES) {
            if (segment == dir) return true;
        }
        seg_start = slash + 1;
    }

    const std::string file_name = rel_path.substr(seg_start);
    for (const char* marker : TEST_NAME_MARKERS) {
        if (file_name.find(marker) != std::string::npos) return true;
    }
    return false;
}

} // namespace StrictKit::Audit
