#include "test_common.h"

#include "stagehand/errors.h"
#include "stagehand/patch_applier.h"

#include <sstream>

using namespace stagehand;

int main() {
    std::ostringstream out;
    Logger log(out, LogLevel::DEBUG);

    // all patches apply: targets patched, backups kept, reruns start pristine
    {
        TempDir patches("patches_ok");
        TempDir sdk("sdk_ok");
        write_file(sdk / "renpy/a.rpy", "alpha one\n");
        write_file(sdk / "renpy/sub/b.rpy", "beta one\n");
        write_file(patches / "renpy/a.rpy", "@@ -7,3 +7,3 @@\n-one\n+two\n");
        write_file(patches / "renpy/sub/b.rpy", "--- a/b\n+++ b/b\n@@ -1 +1 @@\n-beta one\n+beta two\n");

        PatchApplier applier(log);
        auto done = applier.apply_tree(patches.path, sdk.path);
        expect_eq_ll((long long)done.size(), 2, "two patched files");
        expect_eq_str(done[0], "renpy/a.rpy", "sorted relative paths");
        expect_eq_str(read_file(sdk / "renpy/a.rpy"), "alpha two\n", "character patch applied");
        expect_eq_str(read_file(sdk / "renpy/sub/b.rpy"), "beta two\n", "unified patch applied");
        expect_true(BackupStore::has_backup(sdk / "renpy/a.rpy"), "backup kept");

        // second run restores the pristine copy before patching again
        applier.apply_tree(patches.path, sdk.path);
        expect_eq_str(read_file(sdk / "renpy/a.rpy"), "alpha two\n", "rerun is idempotent");
        expect_eq_str(read_file(BackupStore::backup_path(sdk / "renpy/a.rpy")), "alpha one\n",
                      "backup still pristine");
    }

    // second of three patches cannot be parsed: every target is restored
    {
        TempDir patches("patches_bad");
        TempDir sdk("sdk_bad");
        write_file(sdk / "1.txt", "one\n");
        write_file(sdk / "2.txt", "two\n");
        write_file(sdk / "3.txt", "three\n");
        write_file(patches / "1.txt", "--- a\n+++ b\n@@ -1 +1 @@\n-one\n+ONE\n");
        write_file(patches / "2.txt", "this is not a patch at all\n");
        write_file(patches / "3.txt", "--- a\n+++ b\n@@ -1 +1 @@\n-three\n+THREE\n");

        PatchApplier applier(log);
        std::string msg = expect_throws<PatchError>([&] { applier.apply_tree(patches.path, sdk.path); },
                                                    "batch must fail");
        expect_true(contains(msg, "'2.txt'"), "error names the bad patch: " + msg);
        expect_true(!contains(msg, "'1.txt'") && !contains(msg, "'3.txt'"), "only the bad patch named: " + msg);
        expect_eq_str(read_file(sdk / "1.txt"), "one\n", "1 rolled back");
        expect_eq_str(read_file(sdk / "2.txt"), "two\n", "2 rolled back");
        expect_eq_str(read_file(sdk / "3.txt"), "three\n", "3 rolled back");
        expect_true(!BackupStore::has_backup(sdk / "1.txt"), "rollback consumes the backup");
    }

    // a hunk that does not match and a patch without target both fail the batch
    {
        TempDir patches("patches_nomatch");
        TempDir sdk("sdk_nomatch");
        write_file(sdk / "a.txt", "aaa\n");
        write_file(patches / "a.txt", "--- a\n+++ b\n@@ -1 +1 @@\n-zzz\n+yyy\n");
        write_file(patches / "ghost.txt", "--- a\n+++ b\n@@ -1 +1 @@\n-x\n+y\n");

        PatchApplier applier(log);
        std::string msg = expect_throws<PatchError>([&] { applier.apply_tree(patches.path, sdk.path); },
                                                    "non-matching hunk");
        expect_true(contains(msg, "2 patch(es)"), msg);
        expect_true(contains(msg, "'a.txt'") && contains(msg, "'ghost.txt'"), msg);
        expect_eq_str(read_file(sdk / "a.txt"), "aaa\n", "target untouched");
        expect_true(!std::filesystem::exists(sdk / "ghost.txt"), "no file created for a missing target");
    }

    expect_throws<std::runtime_error>([] { list_files_sorted("/nonexistent/stagehand/patches"); },
                                      "missing patch root");

    std::cerr << "test_patch_applier: ALL PASSED" << std::endl;
    return 0;
}
