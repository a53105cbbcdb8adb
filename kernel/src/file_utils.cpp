#include "exec_kernel/file_utils.h"

#include <dirent.h>
#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

namespace exec_kernel {

namespace {

void search_recursive(
    const std::string& dir,
    const std::string& pattern,
    int depth,
    int max_depth,
    int max_results,
    std::vector<FileSearchResult>& results
) {
    if (depth > max_depth || static_cast<int>(results.size()) >= max_results) return;

    DIR* d = opendir(dir.c_str());
    if (!d) return;

    struct dirent* entry;
    while ((entry = readdir(d)) != nullptr) {
        if (static_cast<int>(results.size()) >= max_results) break;

        const char* name = entry->d_name;
        if (name[0] == '.' && (name[1] == '\0' || (name[1] == '.' && name[2] == '\0')))
            continue;

        std::string full_path = dir + "/" + name;

        struct stat st;
        if (lstat(full_path.c_str(), &st) != 0) continue;

        bool is_dir = S_ISDIR(st.st_mode);

        if (fnmatch(pattern.c_str(), name, 0) == 0) {
            FileSearchResult r;
            r.path = full_path;
            r.size = is_dir ? 0 : static_cast<uint64_t>(st.st_size);
            r.is_dir = is_dir;
            results.push_back(std::move(r));
        }

        // Recurse into directories (skip symlinks to avoid loops)
        if (is_dir && !S_ISLNK(st.st_mode)) {
            search_recursive(full_path, pattern, depth + 1, max_depth, max_results, results);
        }
    }
    closedir(d);
}

void write_all(int fd, const char* data, size_t size, const std::string& path) {
    size_t off = 0;
    while (off < size) {
        ssize_t n = write(fd, data + off, size - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        throw std::runtime_error("write failed for " + path + ": " + strerror(errno));
    }
}

} // anonymous namespace

TempDir::TempDir(const std::string& prefix) {
    const char* base = std::getenv("TMPDIR");
    std::string tmpl = std::string(base && *base ? base : "/tmp") + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed for " + tmpl + ": " + strerror(errno));
    }
    path_ = buf.data();
}

TempDir::~TempDir() {
    if (path_.empty()) return;
    if (!FileUtils::remove_tree(path_)) {
        spdlog::warn("Could not fully remove temporary directory {}", path_);
    }
}

TempDir::TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
    if (this != &other) {
        if (!path_.empty()) FileUtils::remove_tree(path_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::string TempDir::file(const std::string& name) const {
    return path_ + "/" + name;
}

std::vector<FileSearchResult> FileUtils::search(
    const std::string& root,
    const std::string& pattern,
    int max_depth,
    int max_results
) {
    std::vector<FileSearchResult> results;
    results.reserve(std::min(max_results, 256));
    search_recursive(root, pattern, 0, max_depth, max_results, results);
    return results;
}

void FileUtils::write_file(const std::string& path, const std::string& content) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw std::runtime_error("open failed for " + path + ": " + strerror(errno));
    }
    try {
        write_all(fd, content.data(), content.size(), path);
    } catch (...) {
        close(fd);
        throw;
    }
    if (close(fd) != 0) {
        throw std::runtime_error("close failed for " + path + ": " + strerror(errno));
    }
}

void FileUtils::copy_file(const std::string& src, const std::string& dest) {
    int in = open(src.c_str(), O_RDONLY | O_CLOEXEC);
    if (in < 0) {
        throw std::runtime_error("open failed for " + src + ": " + strerror(errno));
    }
    int out = open(dest.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (out < 0) {
        int err = errno;
        close(in);
        throw std::runtime_error("open failed for " + dest + ": " + strerror(err));
    }

    char buf[65536];
    try {
        for (;;) {
            ssize_t n = read(in, buf, sizeof(buf));
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error("read failed for " + src + ": " + strerror(errno));
            }
            write_all(out, buf, static_cast<size_t>(n), dest);
        }
    } catch (...) {
        close(in);
        close(out);
        throw;
    }
    close(in);
    if (close(out) != 0) {
        throw std::runtime_error("close failed for " + dest + ": " + strerror(errno));
    }
}

bool FileUtils::remove_tree(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) return errno == ENOENT;

    if (!S_ISDIR(st.st_mode)) {
        return unlink(path.c_str()) == 0;
    }

    bool ok = true;
    DIR* d = opendir(path.c_str());
    if (d) {
        struct dirent* entry;
        while ((entry = readdir(d)) != nullptr) {
            const char* name = entry->d_name;
            if (name[0] == '.' && (name[1] == '\0' || (name[1] == '.' && name[2] == '\0')))
                continue;
            ok = remove_tree(path + "/" + name) && ok;
        }
        closedir(d);
    }
    return rmdir(path.c_str()) == 0 && ok;
}

} // namespace exec_kernel
