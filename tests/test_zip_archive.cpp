#include "test_common.h"

#include "stagehand/errors.h"
#include "stagehand/zip_archive.h"

using namespace stagehand;

int main() {
    TempDir dir("zip");
    const auto path = dir / "game-1.0-pc.zip";
    const std::string big(20000, 'x');

    {
        ZipArchive za(path, ZipMode::CREATE);
        za.add("game/readme.txt", "hello", ZIP_STORED);
        za.add("game/lib/big.bin", big);
        za.add("game/\xc3\xa9t\xc3\xa9.txt", "utf8 name");
        za.set_comment("built by stagehand");
        za.close();
        za.close(); // idempotent
    }

    std::string original_bytes = read_file(path);
    {
        ZipArchive za(path, ZipMode::READ);
        expect_eq_ll((long long)za.entries().size(), 3, "three entries");
        expect_eq_str(za.entries()[0].name, "game/readme.txt", "directory order kept");
        expect_eq_str(za.read("game/readme.txt"), "hello", "stored entry");
        expect_true(za.read("game/lib/big.bin") == big, "deflated entry");
        const ZipEntry* e = za.find("game/lib/big.bin");
        expect_true(e && e->method == ZIP_DEFLATED, "deflated method");
        expect_true(e->compressed_size < e->uncompressed_size, "deflate actually compresses");
        expect_eq_str(za.comment(), "built by stagehand", "archive comment");
        expect_true(za.find("missing") == nullptr, "find missing");
        expect_throws<ArchiveError>([&] { za.read("missing"); }, "read missing entry");
        expect_throws<ArchiveError>([&] { za.add("x", "y"); }, "read-only archive");
    }

    // opening for append and closing without writes leaves the file alone
    {
        ZipArchive za(path, ZipMode::APPEND);
        za.close();
        expect_true(read_file(path) == original_bytes, "untouched append");
    }

    // appended entries go after the existing data, which stays byte-identical
    {
        ZipArchive before(path, ZipMode::READ);
        const uint32_t last_entry = before.entries().back().local_header_offset;
        before.close();

        ZipArchive za(path, ZipMode::APPEND);
        za.add("game/new.txt", "appended");
        za.close();

        std::string now = read_file(path);
        expect_true(now.compare(0, last_entry, original_bytes, 0, last_entry) == 0, "existing entry bytes kept");

        ZipArchive check(path, ZipMode::READ);
        expect_eq_ll((long long)check.entries().size(), 4, "four entries after append");
        expect_eq_str(check.read("game/new.txt"), "appended", "appended content");
        expect_eq_str(check.read("game/readme.txt"), "hello", "old content");
        expect_eq_str(check.comment(), "built by stagehand", "comment survives append");
    }

    // raw copy into another archive needs no recompression
    {
        const auto copy = dir / "copy.zip";
        ZipArchive src(path, ZipMode::READ);
        ZipArchive dst(copy, ZipMode::CREATE);
        for (const auto& e : src.entries()) dst.add_raw(e, src.read_raw(e));
        dst.close();
        ZipArchive check(copy, ZipMode::READ);
        expect_true(check.read("game/lib/big.bin") == big, "raw copy readable");
        expect_eq_ll(check.find("game/lib/big.bin")->crc32, src.find("game/lib/big.bin")->crc32, "crc kept");
    }

    // damaged content is detected
    {
        const auto bad = dir / "bad.zip";
        {
            ZipArchive za(bad, ZipMode::CREATE);
            za.add("a.txt", "abcdef", ZIP_STORED);
            za.close();
        }
        std::string bytes = read_file(bad);
        size_t at = bytes.find("abcdef");
        expect_true(at != std::string::npos, "stored payload visible");
        bytes[at] = 'X';
        write_file(bad, bytes);
        ZipArchive za(bad, ZipMode::READ);
        std::string msg = expect_throws<ArchiveError>([&] { za.read("a.txt"); }, "CRC mismatch");
        expect_true(contains(msg, "CRC"), msg);
    }

    // not an archive
    write_file(dir / "plain.txt", "this is not a zip file at all, just some text");
    expect_throws<ArchiveError>([&] { ZipArchive za(dir / "plain.txt", ZipMode::READ); }, "plain file");
    expect_throws<ArchiveError>([&] { ZipArchive za(dir / "absent.zip", ZipMode::READ); }, "missing file");

    // helpers
    expect_eq_ll(zip_crc32("123456789"), 0xCBF43926LL, "crc32 check value");
    expect_true(zip_inflate(zip_deflate(big), big.size()) == big, "deflate/inflate");
    expect_throws<ArchiveError>([&] { zip_inflate(zip_deflate(big), big.size() - 1); }, "size mismatch");

    std::cerr << "test_zip_archive: ALL PASSED" << std::endl;
    return 0;
}
