#include "test_common.h"

#include "stagehand/archive_rewriter.h"
#include "stagehand/errors.h"

using namespace stagehand;

static void make_archive(const std::filesystem::path& p) {
    ZipArchive za(p, ZipMode::CREATE);
    za.add("a/app.exe", std::string(4096, 'A'));
    za.add("a/lib/pythonw.exe", std::string(4096, 'P'));
    za.add("a/lib/app.exe", std::string(2048, 'S'), ZIP_STORED);
    za.set_comment("release");
    za.close();
}

static ZipRawData raw_of(const std::filesystem::path& p, const std::string& name, ZipEntry* entry) {
    ZipArchive za(p, ZipMode::READ);
    const ZipEntry* e = za.find(name);
    if (!e) die("missing entry " + name);
    *entry = *e;
    return za.read_raw(*e);
}

int main() {
    TempDir dir("rewrite");

    // commit without changes keeps the archive byte-identical
    {
        const auto p = dir / "noop.zip";
        make_archive(p);
        const std::string before = read_file(p);
        UpdatableArchive ar(p);
        expect_true(!ar.has_staged_changes(), "nothing staged");
        ar.commit();
        expect_true(!ar.is_open(), "closed after commit");
        expect_true(read_file(p) == before, "no-op commit keeps bytes");
        expect_throws<ArchiveError>([&] { ar.write("x", "y"); }, "write after commit");
    }

    // replacing one entry leaves the others byte-identical
    {
        const auto p = dir / "replace.zip";
        make_archive(p);
        ZipEntry lib_before, app_before;
        ZipRawData lib_raw = raw_of(p, "a/lib/pythonw.exe", &lib_before);
        raw_of(p, "a/app.exe", &app_before);

        UpdatableArchive ar(p);
        ar.write("a/app.exe", "patched ");
        ar.write("a/app.exe", "executable");
        expect_true(ar.has_staged_changes(), "replacement staged");
        expect_eq_str(ar.read("a/app.exe"), std::string(4096, 'A'), "staged write not visible before commit");
        ar.commit();
        expect_true(!std::filesystem::exists(UpdatableArchive::rebuild_path(p)), "temporary removed");

        ZipArchive za(p, ZipMode::READ);
        expect_eq_ll((long long)za.entries().size(), 3, "same entry count");
        expect_eq_str(za.entries()[0].name, "a/app.exe", "order kept");
        expect_eq_str(za.read("a/app.exe"), "patched executable", "repeated writes append");
        const ZipEntry* app = za.find("a/app.exe");
        expect_eq_ll(app->method, app_before.method, "method kept");
        expect_eq_ll(app->mod_date, app_before.mod_date, "date kept");
        expect_eq_ll(app->mod_time, app_before.mod_time, "time kept");

        ZipEntry lib_after;
        ZipRawData lib_raw_after = raw_of(p, "a/lib/pythonw.exe", &lib_after);
        expect_true(lib_raw_after.data == lib_raw.data, "untouched entry bytes identical");
        expect_eq_ll(lib_after.crc32, lib_before.crc32, "untouched entry crc");
        expect_eq_str(za.read("a/lib/app.exe"), std::string(2048, 'S'), "stored entry survives");
        expect_eq_str(za.comment(), "release", "comment kept");
    }

    // removal, and direct append of new names
    {
        const auto p = dir / "remove.zip";
        make_archive(p);
        UpdatableArchive ar(p);
        ar.remove("a/lib/app.exe");
        ar.write("a/extra.txt", "fresh");
        expect_true(ar.contains("a/extra.txt"), "new name visible right away");
        expect_eq_str(ar.read("a/extra.txt"), "fresh", "new name readable");
        expect_throws<ArchiveError>([&] { ar.remove("a/none.txt"); }, "remove of unknown name");
        ar.commit();

        ZipArchive za(p, ZipMode::READ);
        expect_true(za.find("a/lib/app.exe") == nullptr, "entry removed");
        expect_eq_str(za.read("a/extra.txt"), "fresh", "appended entry kept through rebuild");
        expect_eq_ll((long long)za.entries().size(), 3, "3 - 1 + 1 entries");
    }

    // writing after remove cancels the removal
    {
        const auto p = dir / "rewrite.zip";
        make_archive(p);
        UpdatableArchive ar(p);
        ar.remove("a/app.exe");
        ar.write("a/app.exe", "back");
        ar.commit();
        ZipArchive za(p, ZipMode::READ);
        expect_eq_str(za.read("a/app.exe"), "back", "rewritten after remove");
    }

    // a rebuild that cannot create its temporary leaves the original untouched
    {
        const auto p = dir / "atomic.zip";
        make_archive(p);
        const std::string before = read_file(p);
        std::filesystem::create_directories(UpdatableArchive::rebuild_path(p));

        UpdatableArchive ar(p);
        ar.write("a/app.exe", "will not land");
        expect_throws<ArchiveError>([&] { ar.commit(); }, "rebuild must fail");
        expect_true(read_file(p) == before, "original unchanged");
        expect_true(!ar.has_staged_changes(), "staging released after failure");
        expect_true(std::filesystem::is_directory(UpdatableArchive::rebuild_path(p)),
                    "foreign path left alone");
    }

    // dropping the object without commit discards staged replacements
    {
        const auto p = dir / "drop.zip";
        make_archive(p);
        const std::string before = read_file(p);
        {
            UpdatableArchive ar(p);
            ar.write("a/app.exe", "never");
        }
        expect_true(read_file(p) == before, "uncommitted changes dropped");
    }

    std::cerr << "test_archive_rewriter: ALL PASSED" << std::endl;
    return 0;
}
