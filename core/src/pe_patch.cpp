#include "stagehand/pe_patch.h"
#include "stagehand/errors.h"

#include <fstream>

namespace stagehand {

namespace {

uint32_t le32(const char* p) {
    return static_cast<uint32_t>(static_cast<uint8_t>(p[0])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[3])) << 24);
}

uint16_t le16(const char* p) {
    return static_cast<uint16_t>(static_cast<uint8_t>(p[0]) | (static_cast<uint8_t>(p[1]) << 8));
}

// Abstracts "read n bytes at offset" over a file or a buffer.
template <typename ReadAt>
size_t characteristics_offset(ReadAt read_at, const std::string& label) {
    char dos[PE_POINTER_OFFSET + 4];
    if (!read_at(0, dos, 2) || dos[0] != 'M' || dos[1] != 'Z') {
        throw BinaryFormatError("'" + label + "' is not a DOS/PE executable (missing MZ signature)");
    }
    if (!read_at(0, dos, sizeof(dos))) {
        throw BinaryFormatError("'" + label + "' is truncated inside the DOS header");
    }
    const size_t pe = le32(dos + PE_POINTER_OFFSET);

    char sig[4];
    if (!read_at(pe, sig, sizeof(sig)) || sig[0] != 'P' || sig[1] != 'E' || sig[2] != 0 || sig[3] != 0) {
        throw BinaryFormatError("'" + label + "' has no PE signature at offset " + std::to_string(pe));
    }
    return pe + PE_CHARACTERISTICS_DELTA;
}

void write_le16(char* p, uint16_t v) {
    p[0] = static_cast<char>(v & 0xff);
    p[1] = static_cast<char>((v >> 8) & 0xff);
}

} // namespace

LaaResult set_large_address_aware(const std::filesystem::path& exe) {
    const std::string label = exe.string();
    std::fstream f(exe, std::ios::in | std::ios::out | std::ios::binary);
    if (!f) throw BinaryFormatError("cannot open '" + label + "' for patching");

    auto read_at = [&f](size_t off, char* out, size_t n) {
        f.clear();
        f.seekg(static_cast<std::streamoff>(off));
        f.read(out, static_cast<std::streamsize>(n));
        return static_cast<size_t>(f.gcount()) == n;
    };

    const size_t off = characteristics_offset(read_at, label);
    char field[2];
    if (!read_at(off, field, sizeof(field))) {
        throw BinaryFormatError("'" + label + "' is truncated inside the COFF header");
    }
    const uint16_t flags = le16(field);
    if (flags & IMAGE_FILE_LARGE_ADDRESS_AWARE) return LaaResult::ALREADY_SET;

    write_le16(field, static_cast<uint16_t>(flags | IMAGE_FILE_LARGE_ADDRESS_AWARE));
    f.clear();
    f.seekp(static_cast<std::streamoff>(off));
    f.write(field, sizeof(field));
    f.flush();
    if (!f) throw BinaryFormatError("cannot write COFF characteristics of '" + label + "'");
    return LaaResult::NOW_SET;
}

static size_t image_characteristics(const std::string& image, const std::string& label) {
    auto read_at = [&image](size_t off, char* out, size_t n) {
        if (off > image.size() || image.size() - off < n) return false;
        image.copy(out, n, off);
        return true;
    };
    const size_t off = characteristics_offset(read_at, label);
    if (off > image.size() || image.size() - off < 2) {
        throw BinaryFormatError("'" + label + "' is truncated inside the COFF header");
    }
    return off;
}

LaaResult set_large_address_aware(std::string& image, const std::string& label) {
    const size_t off = image_characteristics(image, label);
    const uint16_t flags = le16(image.data() + off);
    if (flags & IMAGE_FILE_LARGE_ADDRESS_AWARE) return LaaResult::ALREADY_SET;
    write_le16(&image[off], static_cast<uint16_t>(flags | IMAGE_FILE_LARGE_ADDRESS_AWARE));
    return LaaResult::NOW_SET;
}

bool is_large_address_aware(const std::string& image, const std::string& label) {
    const size_t off = image_characteristics(image, label);
    return (le16(image.data() + off) & IMAGE_FILE_LARGE_ADDRESS_AWARE) != 0;
}

} // namespace stagehand
