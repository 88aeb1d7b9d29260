#pragma once
#include "zip_archive.h"

#include <cstdio>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stagehand {

// Update-mode view of an existing zip archive.
//
// Writes to names that are not in the archive yet are appended directly.
// Writes to existing names and removals are staged (one temporary file per
// name) and only take effect on commit(), which rebuilds the archive into
// <archive>.rebuild.tmp and moves it over the original. Until that move the
// original archive is never modified in place.
class UpdatableArchive {
public:
    explicit UpdatableArchive(const std::filesystem::path& path);
    ~UpdatableArchive();

    UpdatableArchive(const UpdatableArchive&) = delete;
    UpdatableArchive& operator=(const UpdatableArchive&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Repeated writes to the same staged name append to its buffer.
    void write(const std::string& name, const std::string& data);
    void write_file(const std::string& name, const std::filesystem::path& src);

    // Throws ArchiveError if name is not in the archive.
    void remove(const std::string& name);

    // Archive as opened plus direct appends; staged changes are not visible.
    std::string read(const std::string& name);
    std::vector<std::string> names() const;
    bool contains(const std::string& name) const;

    bool has_staged_changes() const { return !staged_.empty(); }

    // Finalizes appends and applies staged changes. Staging buffers are
    // released whether or not the rebuild succeeds. The object is closed
    // afterwards.
    void commit();
    bool is_open() const { return archive_ != nullptr; }

    static std::filesystem::path rebuild_path(const std::filesystem::path& archive);

private:
    struct FileCloser {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };
    using TempFile = std::unique_ptr<std::FILE, FileCloser>;

    struct Staged {
        TempFile buf;        // nullptr for a deletion marker
        bool remove{false};
    };

    ZipArchive& open_archive() const;
    void rebuild();
    static std::string slurp(std::FILE* f, const std::string& name);

    std::filesystem::path path_;
    std::unique_ptr<ZipArchive> archive_;
    std::map<std::string, Staged> staged_;
};

} // namespace stagehand
