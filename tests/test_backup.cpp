#include "test_common.h"

#include "stagehand/backup.h"

#include <sstream>

using namespace stagehand;

int main() {
    TempDir dir("backup");
    std::ostringstream out;
    Logger log(out, LogLevel::DEBUG);
    BackupStore store(log);

    const auto file = dir / "rapt/android.keystore";
    write_file(file, "pristine");

    // first backup is taken, the second call never overwrites it
    expect_true(store.ensure_backup(file) == BackupResult::CREATED, "first backup created");
    expect_eq_str(read_file(BackupStore::backup_path(file)), "pristine", "backup content");
    write_file(file, "mutated");
    expect_true(store.ensure_backup(file) == BackupResult::ALREADY_PRESENT, "backup kept");
    expect_eq_str(read_file(BackupStore::backup_path(file)), "pristine", "backup still pristine");

    // restore copies back and keeps the backup
    expect_true(store.restore_from_backup(file), "restore");
    expect_eq_str(read_file(file), "pristine", "restored content");
    expect_true(BackupStore::has_backup(file), "backup still there after restore");

    // rollback consumes the backup
    write_file(file, "mutated again");
    expect_true(store.rollback(file), "rollback");
    expect_eq_str(read_file(file), "pristine", "rolled back content");
    expect_true(!BackupStore::has_backup(file), "backup consumed");
    expect_true(!store.rollback(file), "nothing left to roll back");
    expect_true(!store.restore_from_backup(file), "nothing left to restore");

    // missing source is tolerated
    out.str("");
    expect_true(store.ensure_backup(dir / "nope.bin") == BackupResult::SOURCE_MISSING, "missing source");
    expect_true(contains(out.str(), "[WARN]"), "missing source warns");
    expect_true(!BackupStore::has_backup(dir / "nope.bin"), "no backup for missing source");

    // run-start policy: back up on the first run, restore on reruns
    {
        write_file(dir / "a.txt", "A0");
        write_file(dir / "b.txt", "B0");
        store.prepare_affected_files(dir.path, {"a.txt", "b.txt", "missing.txt"});
        expect_true(BackupStore::has_backup(dir / "a.txt"), "a backed up");
        expect_true(BackupStore::has_backup(dir / "b.txt"), "b backed up");
        expect_true(contains(out.str(), "'missing.txt' could not be found"), "missing file warned");

        write_file(dir / "a.txt", "A1 from a previous run");
        store.prepare_affected_files(dir.path, {"a.txt", "b.txt"});
        expect_eq_str(read_file(dir / "a.txt"), "A0", "rerun starts from pristine content");
        expect_eq_str(read_file(BackupStore::backup_path(dir / "a.txt")), "A0", "backup unchanged");
    }

    std::cerr << "test_backup: ALL PASSED" << std::endl;
    return 0;
}
