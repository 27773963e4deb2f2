#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace StrictKit::Audit {

/// One candidate file: path relative to the project root plus its text.
struct SourceUnit {
    std::string path;
    std::string content;
};

/// Lists candidate files below the project root.
class IFileEnumerator {
public:
    virtual ~IFileEnumerator() = default;

    // Sorted relative paths whose name ends with one of `extensions`
    // (".ts", ".json", ...). Ignored directories are never entered.
    virtual auto listFiles(const std::vector<std::string>& extensions) const
        -> std::vector<std::string> = 0;
};

/// Reads project files by relative path.
class IContentReader {
public:
    virtual ~IContentReader() = default;

    // nullopt when the file is missing or cannot be read
    virtual auto read(const std::string& rel_path) const -> std::optional<std::string> = 0;

    virtual auto exists(const std::string& rel_path) const -> bool = 0;
};

/// Recursive directory walk with the standard ignore set.
///
/// Skipped: hidden entries, node_modules, dist, build, out, coverage and
/// any extra directory names from configuration. Minified *.min.js files
/// are never listed. Symlinked directories are not followed.
class FsFileEnumerator : public IFileEnumerator {
public:
    explicit FsFileEnumerator(std::string root, std::vector<std::string> extra_ignore_dirs = {});

    auto listFiles(const std::vector<std::string>& extensions) const
        -> std::vector<std::string> override;

    [[nodiscard]] auto isIgnoredDirectory(const char* name) const noexcept -> bool;

    // Splits "a, b,c" into {"a","b","c"}
    static auto splitIgnoreList(const char* csv) -> std::vector<std::string>;

private:
    void walk(const std::string& abs_dir, const std::string& rel_dir,
              const std::vector<std::string>& extensions,
              std::vector<std::string>& out) const;

    std::string root_;
    std::vector<std::string> extra_ignore_dirs_;
};

/// Reads whole files with mmap. Files larger than MAX_FILE_BYTES are
/// treated as unreadable.
class FsContentReader : public IContentReader {
public:
    static constexpr size_t MAX_FILE_BYTES = 8 * 1024 * 1024;

    explicit FsContentReader(std::string root);

    auto read(const std::string& rel_path) const -> std::optional<std::string> override;
    auto exists(const std::string& rel_path) const -> bool override;

private:
    std::string root_;
};

// True if `name` ends with one of the extensions
bool hasExtension(const std::string& name, const std::vector<std::string>& extensions) noexcept;

// Last path segment of a relative path
std::string baseName(const std::string& rel_path);

} // namespace StrictKit::Audit
