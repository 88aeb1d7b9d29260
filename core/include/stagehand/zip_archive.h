#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace stagehand {

constexpr uint16_t ZIP_STORED = 0;
constexpr uint16_t ZIP_DEFLATED = 8;

// One central directory record.
struct ZipEntry {
    std::string name;
    uint16_t version_made_by{(3 << 8) | 20}; // unix, 2.0
    uint16_t version_needed{20};
    uint16_t flags{0};
    uint16_t method{ZIP_DEFLATED};
    uint16_t mod_time{0};
    uint16_t mod_date{0};
    uint32_t crc32{0};
    uint32_t compressed_size{0};
    uint32_t uncompressed_size{0};
    uint16_t internal_attr{0};
    uint32_t external_attr{0};
    uint32_t local_header_offset{0};
    std::string extra;   // central directory extra field
    std::string comment;
};

// Compressed payload of an entry plus its local-header extra field, as
// stored on disk. Copying this between archives never recompresses.
struct ZipRawData {
    std::string local_extra;
    std::string data;
};

enum class ZipMode { READ, CREATE, APPEND };

// Minimal zip container: stored and deflated entries, no ZIP64, no
// encryption. APPEND writes new entries over the old central directory and
// rewrites the directory on close, leaving existing entry bytes untouched.
// Structural problems raise ArchiveError.
class ZipArchive {
public:
    ZipArchive(const std::filesystem::path& path, ZipMode mode);
    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    const std::filesystem::path& path() const { return path_; }
    ZipMode mode() const { return mode_; }

    // Entries in directory order (appended entries last).
    const std::vector<ZipEntry>& entries() const { return entries_; }
    std::vector<std::string> names() const;

    // Last entry with that name, nullptr if absent. Invalidated by add*().
    const ZipEntry* find(const std::string& name) const;

    // Decompressed, CRC-checked content.
    std::string read(const std::string& name);
    std::string read(const ZipEntry& e);
    ZipRawData read_raw(const ZipEntry& e);

    // New entry stamped with the current time.
    void add(const std::string& name, const std::string& data, uint16_t method = ZIP_DEFLATED);
    // New content for an entry that keeps like's name, method, timestamps
    // and attributes.
    void add_like(const ZipEntry& like, const std::string& data);
    // Verbatim copy of an entry read from another archive.
    void add_raw(const ZipEntry& src, const ZipRawData& raw);

    const std::string& comment() const { return comment_; }
    void set_comment(const std::string& c);

    // Writes the central directory (writable modes). Idempotent.
    void close();
    bool is_open() const { return open_; }

private:
    void load_directory();
    uint64_t data_offset(const ZipEntry& e, std::string* local_extra);
    void write_entry(ZipEntry e, const std::string& local_extra, const std::string& payload);
    bool finalize();
    void require_writable() const;

    std::filesystem::path path_;
    ZipMode mode_;
    std::fstream io_;
    std::vector<ZipEntry> entries_;
    std::string comment_;
    uint64_t write_pos_{0};
    bool open_{false};
    bool dirty_{false};
};

// Raw deflate (no zlib header) helpers shared by the archive code.
std::string zip_deflate(const std::string& data);
std::string zip_inflate(const std::string& data, size_t expected_size);
uint32_t zip_crc32(const std::string& data);

} // namespace stagehand
