#pragma once
#include "backup.h"
#include "log.h"

#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

struct PatchFailure {
    std::string patch;  // relative path of the patch file
    std::string reason;
};

// Applies a tree of patch files onto a tree of targets with the same
// relative paths. The batch is all-or-nothing: on any failure every target
// touched by the batch is rolled back to its backup and PatchError is
// thrown naming each failed patch.
class PatchApplier {
public:
    explicit PatchApplier(Logger& log) : log_(log), backups_(log) {}

    // Returns the relative paths of the patched targets.
    std::vector<std::string> apply_tree(const std::filesystem::path& patch_root,
                                        const std::filesystem::path& target_root);

private:
    bool apply_one(const std::filesystem::path& patch_file,
                   const std::filesystem::path& target,
                   std::string* err);

    Logger& log_;
    BackupStore backups_;
};

// Regular files under root, recursive, as sorted relative generic paths.
std::vector<std::string> list_files_sorted(const std::filesystem::path& root);

} // namespace stagehand
