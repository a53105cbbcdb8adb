#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace exec_kernel {

struct FileSearchResult {
    std::string path;
    uint64_t size;
    bool is_dir;
};

/// Private scratch directory, removed with everything in it on destruction.
class TempDir {
public:
    /// Create a fresh directory under $TMPDIR (or /tmp) named <prefix>XXXXXX.
    explicit TempDir(const std::string& prefix = "exec_kernel-");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;

    const std::string& path() const noexcept { return path_; }

    /// path() + "/" + name
    std::string file(const std::string& name) const;

private:
    std::string path_;
};

class FileUtils {
public:
    /// Recursive glob search. Returns matching paths up to max_results.
    static std::vector<FileSearchResult> search(
        const std::string& root,
        const std::string& pattern,
        int max_depth = 10,
        int max_results = 200
    );

    /// Create or truncate path and write content. Throws on failure.
    static void write_file(const std::string& path, const std::string& content);

    /// Copy a regular file, replacing dest if it exists. Throws on failure.
    static void copy_file(const std::string& src, const std::string& dest);

    /// Remove a file or directory tree. Returns false if anything was left behind.
    static bool remove_tree(const std::string& path);
};

} // namespace exec_kernel
