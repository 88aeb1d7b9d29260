#include "stagehand/backup.h"

#include <stdexcept>
#include <system_error>

namespace stagehand {

namespace fs = std::filesystem;

static void copy_over(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw std::runtime_error("cannot copy '" + from.string() + "' to '" + to.string() +
                                 "': " + ec.message());
    }
}

fs::path BackupStore::backup_path(const fs::path& p) {
    fs::path b = p;
    b += ".original";
    return b;
}

bool BackupStore::has_backup(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(backup_path(p), ec);
}

BackupResult BackupStore::ensure_backup(const fs::path& p) {
    if (has_backup(p)) return BackupResult::ALREADY_PRESENT;

    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        log_.warn("'" + p.string() + "' could not be found, no backup taken");
        return BackupResult::SOURCE_MISSING;
    }

    // A backup only ever appears complete.
    fs::path tmp = backup_path(p);
    tmp += ".tmp";
    copy_over(p, tmp);
    fs::rename(tmp, backup_path(p), ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("cannot create backup for '" + p.string() + "'");
    }
    log_.debug("Backed up '" + p.string() + "'");
    return BackupResult::CREATED;
}

bool BackupStore::restore_from_backup(const fs::path& p) {
    if (!has_backup(p)) return false;
    copy_over(backup_path(p), p);
    log_.debug("Restored '" + p.string() + "' from its backup");
    return true;
}

bool BackupStore::rollback(const fs::path& p) {
    if (!has_backup(p)) return false;
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) throw std::runtime_error("cannot remove '" + p.string() + "': " + ec.message());
    fs::rename(backup_path(p), p, ec);
    if (ec) {
        throw std::runtime_error("cannot move backup of '" + p.string() + "' into place: " +
                                 ec.message());
    }
    return true;
}

void BackupStore::prepare_affected_files(const fs::path& root,
                                         const std::vector<std::string>& files) {
    if (files.empty()) return;
    log_.info("Found " + std::to_string(files.size()) + " affected file" +
              (files.size() == 1 ? "" : "s") + " requiring backup...");

    for (const auto& rel : files) {
        fs::path full = root / rel;
        std::error_code ec;
        if (!fs::is_regular_file(full, ec)) {
            log_.warn("'" + rel + "' could not be found");
            continue;
        }
        if (has_backup(full)) {
            log_.info("File '" + rel + "' already has a backup, restoring...");
            restore_from_backup(full);
            continue;
        }
        log_.info("Backing up '" + rel + "'...");
        ensure_backup(full);
    }
}

} // namespace stagehand
