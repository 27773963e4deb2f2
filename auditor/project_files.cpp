#include "auditor/project_files.h"

#include <algorithm>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#include "common/logging.h"

namespace StrictKit::Audit {

namespace {

// Dependency, build output and coverage directories
constexpr const char* IGNORED_DIRS[] = {
    "node_modules", "dist", "build", "out", "coverage"
};

inline bool endsWith(const std::string& s, const char* suffix) noexcept {
    const size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    return dir + "/" + name;
}

} // namespace

bool hasExtension(const std::string& name, const std::vector<std::string>& extensions) noexcept {
    for (const auto& ext : extensions) {
        if (endsWith(name, ext.c_str())) return true;
    }
    return false;
}

std::string baseName(const std::string& rel_path) {
    const size_t slash = rel_path.find_last_of('/');
    return slash == std::string::npos ? rel_path : rel_path.substr(slash + 1);
}

// ========== FsFileEnumerator ==========

FsFileEnumerator::FsFileEnumerator(std::string root, std::vector<std::string> extra_ignore_dirs)
    : root_(std::move(root)),
      extra_ignore_dirs_(std::move(extra_ignore_dirs)) {
}

auto FsFileEnumerator::listFiles(const std::vector<std::string>& extensions) const
    -> std::vector<std::string> {
    std::vector<std::string> out;
    walk(root_, "", extensions, out);
    std::sort(out.begin(), out.end());
    LOG_DEBUG("Enumerated %zu candidate file(s) under %s", out.size(), root_.c_str());
    return out;
}

auto FsFileEnumerator::isIgnoredDirectory(const char* name) const noexcept -> bool {
    if (name[0] == '.') return true;
    for (const char* ignored : IGNORED_DIRS) {
        if (std::strcmp(name, ignored) == 0) return true;
    }
    for (const auto& extra : extra_ignore_dirs_) {
        if (extra == name) return true;
    }
    return false;
}

auto FsFileEnumerator::splitIgnoreList(const char* csv) -> std::vector<std::string> {
    std::vector<std::string> out;
    if (!csv) return out;

    std::string current;
    for (const char* p = csv; ; ++p) {
        if (*p == ',' || *p == '\0') {
            const size_t first = current.find_first_not_of(" \t");
            const size_t last = current.find_last_not_of(" \t");
            if (first != std::string::npos) {
                out.push_back(current.substr(first, last - first + 1));
            }
            current.clear();
            if (*p == '\0') break;
        } else {
            current.push_back(*p);
        }
    }
    return out;
}

void FsFileEnumerator::walk(const std::string& abs_dir, const std::string& rel_dir,
                            const std::vector<std::string>& extensions,
                            std::vector<std::string>& out) const {
    DIR* dir = opendir(abs_dir.c_str());
    if (!dir) {
        LOG_WARN("Cannot open directory: %s", abs_dir.c_str());
        return;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        const char* name = entry->d_name;
        // Hidden entries, including . and ..
        if (name[0] == '.') continue;

        const std::string abs_path = joinPath(abs_dir, name);

        struct stat st;
        if (lstat(abs_path.c_str(), &st) != 0) {
            LOG_WARN("Cannot stat %s", abs_path.c_str());
            continue;
        }

        if (S_ISLNK(st.st_mode)) {
            // Follow links to files, never to directories
            if (stat(abs_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
        }

        if (S_ISDIR(st.st_mode)) {
            if (isIgnoredDirectory(name)) {
                LOG_DEBUG("Skipping directory: %s", abs_path.c_str());
                continue;
            }
            walk(abs_path, joinPath(rel_dir, name), extensions, out);
        } else if (S_ISREG(st.st_mode)) {
            const std::string file_name(name);
            if (endsWith(file_name, ".min.js")) continue;
            if (hasExtension(file_name, extensions)) {
                out.push_back(joinPath(rel_dir, file_name));
            }
        }
    }

    closedir(dir);
}

// ========== FsContentReader ==========

FsContentReader::FsContentReader(std::string root)
    : root_(std::move(root)) {
}

auto FsContentReader::read(const std::string& rel_path) const -> std::optional<std::string> {
    const std::string abs_path = joinPath(root_, rel_path);

    int fd = open(abs_path.c_str(), O_RDONLY);
    if (fd < 0) {
        LOG_WARN("Failed to open file: %s", abs_path.c_str());
        return std::nullopt;
    }

    struct stat sb;
    if (fstat(fd, &sb) < 0 || !S_ISREG(sb.st_mode)) {
        close(fd);
        return std::nullopt;
    }

    const size_t size = static_cast<size_t>(sb.st_size);
    if (size == 0) {
        close(fd);
        return std::string();
    }
    if (size > MAX_FILE_BYTES) {
        LOG_WARN("Skipping oversized file (%zu bytes): %s", size, abs_path.c_str());
        close(fd);
        return std::nullopt;
    }

    void* mapped = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    close(fd);
    if (mapped == MAP_FAILED) {
        LOG_WARN("mmap failed for %s", abs_path.c_str());
        return std::nullopt;
    }

    std::string content(static_cast<const char*>(mapped), size);
    munmap(mapped, size);
    return content;
}

auto FsContentReader::exists(const std::string& rel_path) const -> bool {
    struct stat st;
    return stat(joinPath(root_, rel_path).c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace StrictKit::Audit
