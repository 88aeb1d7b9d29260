#pragma once
#include "log.h"

#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

enum class BackupResult {
    CREATED,        // <path>.original written from <path>
    ALREADY_PRESENT,// a backup existed; nothing written
    SOURCE_MISSING, // <path> does not exist; tolerated
};

// Pristine-copy protocol for files under shared, externally owned storage.
// The backup of <path> lives next to it as <path>.original and, once
// created, is never overwritten: it always holds the content from before
// the first mutation.
class BackupStore {
public:
    explicit BackupStore(Logger& log) : log_(log) {}

    static std::filesystem::path backup_path(const std::filesystem::path& p);
    static bool has_backup(const std::filesystem::path& p);

    // Copy p to its backup unless one exists. Missing p is a warning.
    BackupResult ensure_backup(const std::filesystem::path& p);

    // Overwrite p with its backup. Returns false when there is no backup.
    bool restore_from_backup(const std::filesystem::path& p);

    // Remove the (mutated) p and move the backup back into its place.
    // Consumes the backup. Returns false when there is no backup.
    bool rollback(const std::filesystem::path& p);

    // Run-start policy for declared affected files (relative to root):
    // restore when a backup exists so reruns start from pristine content,
    // otherwise take the backup. Files that do not exist are skipped with a
    // warning.
    void prepare_affected_files(const std::filesystem::path& root,
                                const std::vector<std::string>& files);

private:
    Logger& log_;
};

} // namespace stagehand
