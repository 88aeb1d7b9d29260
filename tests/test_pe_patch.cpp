#include "test_common.h"

#include "stagehand/errors.h"
#include "stagehand/pe_patch.h"

using namespace stagehand;

// Minimal PE image: DOS stub pointing at a COFF header at 0x80.
static std::string fake_exe(uint16_t characteristics) {
    std::string img(0x200, '\0');
    img[0] = 'M';
    img[1] = 'Z';
    img[PE_POINTER_OFFSET] = static_cast<char>(0x80);
    img[0x80] = 'P';
    img[0x81] = 'E';
    img[0x80 + PE_CHARACTERISTICS_DELTA] = static_cast<char>(characteristics & 0xff);
    img[0x80 + PE_CHARACTERISTICS_DELTA + 1] = static_cast<char>(characteristics >> 8);
    return img;
}

int main() {
    TempDir dir("pe");
    const size_t field = 0x80 + PE_CHARACTERISTICS_DELTA;

    // on disk: the bit is set once, the second run writes nothing
    {
        const auto exe = dir / "game.exe";
        write_file(exe, fake_exe(0x0102));
        expect_true(set_large_address_aware(exe) == LaaResult::NOW_SET, "first call sets the bit");
        std::string after = read_file(exe);
        expect_eq_ll((unsigned char)after[field], 0x22, "low byte gains 0x20");
        expect_eq_ll((unsigned char)after[field + 1], 0x01, "high byte unchanged");

        std::string expected = fake_exe(0x0122);
        expect_true(after == expected, "only the characteristics field changed");

        auto mtime = std::filesystem::last_write_time(exe);
        expect_true(set_large_address_aware(exe) == LaaResult::ALREADY_SET, "second call is a no-op");
        expect_true(read_file(exe) == expected, "bytes unchanged");
        expect_true(std::filesystem::last_write_time(exe) == mtime, "file not rewritten");
    }

    // in memory
    {
        std::string img = fake_exe(0x0102);
        expect_true(!is_large_address_aware(img, "img"), "initially clear");
        expect_true(set_large_address_aware(img, "img") == LaaResult::NOW_SET, "set in memory");
        expect_true(is_large_address_aware(img, "img"), "now set");
        expect_true(set_large_address_aware(img, "img") == LaaResult::ALREADY_SET, "idempotent in memory");
    }

    // malformed images
    {
        std::string no_mz = fake_exe(0x0102);
        no_mz[0] = 'X';
        std::string msg = expect_throws<BinaryFormatError>([&] { set_large_address_aware(no_mz, "no_mz.exe"); },
                                                           "missing MZ");
        expect_true(contains(msg, "no_mz.exe"), "message names the file: " + msg);

        std::string no_pe = fake_exe(0x0102);
        no_pe[0x81] = 'X';
        expect_throws<BinaryFormatError>([&] { set_large_address_aware(no_pe, "no_pe.exe"); }, "missing PE");

        std::string far = fake_exe(0x0102);
        far[PE_POINTER_OFFSET + 1] = static_cast<char>(0x7f); // e_lfanew past the end
        expect_throws<BinaryFormatError>([&] { set_large_address_aware(far, "far.exe"); }, "pointer past end");

        std::string cut = fake_exe(0x0102).substr(0, 0x80 + 8);
        expect_throws<BinaryFormatError>([&] { set_large_address_aware(cut, "cut.exe"); }, "truncated COFF");

        std::string tiny = "MZ";
        expect_throws<BinaryFormatError>([&] { set_large_address_aware(tiny, "tiny.exe"); },
                                         "truncated DOS header");

        const auto bad = dir / "bad.exe";
        write_file(bad, no_mz);
        expect_throws<BinaryFormatError>([&] { set_large_address_aware(bad); }, "missing MZ on disk");
        expect_true(read_file(bad) == no_mz, "bad file untouched");
    }

    std::cerr << "test_pe_patch: ALL PASSED" << std::endl;
    return 0;
}
