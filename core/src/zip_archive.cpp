#include "stagehand/zip_archive.h"
#include "stagehand/errors.h"

#include <zlib.h>

#include <algorithm>
#include <ctime>
#include <system_error>
#include <vector>

namespace stagehand {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t LOCAL_SIG = 0x04034b50u;
constexpr uint32_t CENTRAL_SIG = 0x02014b50u;
constexpr uint32_t EOCD_SIG = 0x06054b50u;
constexpr uint32_t ZIP64_LOCATOR_SIG = 0x07064b50u;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t EOCD_SIZE = 22;
constexpr size_t MAX_COMMENT = 0xFFFF;

constexpr uint16_t FLAG_ENCRYPTED = 0x0001;
constexpr uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;
constexpr uint16_t FLAG_UTF8 = 0x0800;

uint16_t rd16(const std::string& b, size_t off) {
    return static_cast<uint16_t>(static_cast<uint8_t>(b[off]) |
                                 (static_cast<uint8_t>(b[off + 1]) << 8));
}

uint32_t rd32(const std::string& b, size_t off) {
    return static_cast<uint32_t>(static_cast<uint8_t>(b[off])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 3])) << 24);
}

void put16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; i++) out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

void dos_time_now(uint16_t* dos_time, uint16_t* dos_date) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    int year = std::max(tm.tm_year + 1900, 1980);
    *dos_date = static_cast<uint16_t>(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
    *dos_time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
}

bool is_ascii(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

std::string compress_for(uint16_t method, const std::string& data, const std::string& name) {
    if (method == ZIP_STORED) return data;
    if (method == ZIP_DEFLATED) return zip_deflate(data);
    throw ArchiveError("unsupported compression method " + std::to_string(method) +
                       " for entry '" + name + "'");
}

} // namespace

std::string zip_deflate(const std::string& data) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw ArchiveError("deflateInit2 failed");
    }
    std::string out;
    out.resize(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&zs, Z_FINISH);
    uLong produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw ArchiveError("zlib deflate failed with code " + std::to_string(rc));
    }
    out.resize(produced);
    return out;
}

std::string zip_inflate(const std::string& data, size_t expected_size) {
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw ArchiveError("inflateInit2 failed");
    }
    // one spare byte so an over-long stream is detected instead of truncated
    std::vector<unsigned char> out(expected_size + 1);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = inflate(&zs, Z_FINISH);
    uLong produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END || produced != expected_size) {
        throw ArchiveError("corrupt deflate stream");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), expected_size);
}

uint32_t zip_crc32(const std::string& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

ZipArchive::ZipArchive(const fs::path& path, ZipMode mode) : path_(path), mode_(mode) {
    std::ios::openmode om = std::ios::binary | std::ios::in;
    if (mode == ZipMode::APPEND) om |= std::ios::out;
    if (mode == ZipMode::CREATE) om |= std::ios::out | std::ios::trunc;

    io_.open(path_, om);
    if (!io_) throw ArchiveError("cannot open archive '" + path_.string() + "'");
    open_ = true;

    if (mode == ZipMode::CREATE) {
        dirty_ = true; // an empty archive still needs its end record
        return;
    }
    load_directory();
}

ZipArchive::~ZipArchive() {
    // Errors surface only through close().
    (void)finalize();
}

void ZipArchive::load_directory() {
    io_.seekg(0, std::ios::end);
    const uint64_t size = static_cast<uint64_t>(io_.tellg());
    if (size < EOCD_SIZE) throw ArchiveError("not a zip archive: '" + path_.string() + "'");

    const uint64_t tail_len = std::min<uint64_t>(size, EOCD_SIZE + MAX_COMMENT);
    const uint64_t tail_start = size - tail_len;
    std::string tail(static_cast<size_t>(tail_len), '\0');
    io_.seekg(static_cast<std::streamoff>(tail_start));
    io_.read(&tail[0], static_cast<std::streamsize>(tail_len));
    if (!io_) throw ArchiveError("cannot read '" + path_.string() + "'");

    size_t eocd = std::string::npos;
    for (size_t i = tail.size() - EOCD_SIZE + 1; i-- > 0;) {
        if (rd32(tail, i) == EOCD_SIG && i + EOCD_SIZE + rd16(tail, i + 20) <= tail.size()) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) {
        throw ArchiveError("not a zip archive (no end of central directory): '" + path_.string() + "'");
    }

    const uint16_t disk = rd16(tail, eocd + 4);
    const uint16_t cd_disk = rd16(tail, eocd + 6);
    const uint16_t count = rd16(tail, eocd + 10);
    const uint32_t cd_size = rd32(tail, eocd + 12);
    const uint32_t cd_offset = rd32(tail, eocd + 16);
    comment_ = tail.substr(eocd + EOCD_SIZE, rd16(tail, eocd + 20));

    bool zip64_locator = eocd >= 20 && rd32(tail, eocd - 20) == ZIP64_LOCATOR_SIG;
    if (zip64_locator || count == 0xFFFF || cd_size == 0xFFFFFFFFu || cd_offset == 0xFFFFFFFFu) {
        throw ArchiveError("ZIP64 archives are not supported: '" + path_.string() + "'");
    }
    if (disk != 0 || cd_disk != 0) {
        throw ArchiveError("multi-disk archives are not supported: '" + path_.string() + "'");
    }
    const uint64_t eocd_abs = tail_start + eocd;
    if (static_cast<uint64_t>(cd_offset) + cd_size != eocd_abs) {
        throw ArchiveError("central directory does not precede its end record in '" +
                           path_.string() + "'");
    }

    std::string cd(cd_size, '\0');
    io_.seekg(static_cast<std::streamoff>(cd_offset));
    if (cd_size > 0) io_.read(&cd[0], static_cast<std::streamsize>(cd_size));
    if (!io_) throw ArchiveError("cannot read central directory of '" + path_.string() + "'");

    entries_.clear();
    entries_.reserve(count);
    size_t pos = 0;
    for (uint16_t i = 0; i < count; i++) {
        if (pos + CENTRAL_HEADER_SIZE > cd.size() || rd32(cd, pos) != CENTRAL_SIG) {
            throw ArchiveError("bad central directory record in '" + path_.string() + "'");
        }
        ZipEntry e;
        e.version_made_by = rd16(cd, pos + 4);
        e.version_needed = rd16(cd, pos + 6);
        e.flags = rd16(cd, pos + 8);
        e.method = rd16(cd, pos + 10);
        e.mod_time = rd16(cd, pos + 12);
        e.mod_date = rd16(cd, pos + 14);
        e.crc32 = rd32(cd, pos + 16);
        e.compressed_size = rd32(cd, pos + 20);
        e.uncompressed_size = rd32(cd, pos + 24);
        const uint16_t nlen = rd16(cd, pos + 28);
        const uint16_t elen = rd16(cd, pos + 30);
        const uint16_t clen = rd16(cd, pos + 32);
        e.internal_attr = rd16(cd, pos + 36);
        e.external_attr = rd32(cd, pos + 38);
        e.local_header_offset = rd32(cd, pos + 42);
        pos += CENTRAL_HEADER_SIZE;
        if (pos + nlen + elen + clen > cd.size()) {
            throw ArchiveError("truncated central directory in '" + path_.string() + "'");
        }
        e.name = cd.substr(pos, nlen);
        e.extra = cd.substr(pos + nlen, elen);
        e.comment = cd.substr(pos + nlen + elen, clen);
        pos += static_cast<size_t>(nlen) + elen + clen;

        if (e.compressed_size == 0xFFFFFFFFu || e.uncompressed_size == 0xFFFFFFFFu ||
            e.local_header_offset == 0xFFFFFFFFu) {
            throw ArchiveError("ZIP64 entry '" + e.name + "' is not supported");
        }
        entries_.push_back(std::move(e));
    }

    write_pos_ = cd_offset;
}

std::vector<std::string> ZipArchive::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.name);
    return out;
}

const ZipEntry* ZipArchive::find(const std::string& name) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->name == name) return &*it;
    }
    return nullptr;
}

uint64_t ZipArchive::data_offset(const ZipEntry& e, std::string* local_extra) {
    if (!open_) throw ArchiveError("archive '" + path_.string() + "' is closed");
    std::string hdr(LOCAL_HEADER_SIZE, '\0');
    io_.clear();
    io_.seekg(static_cast<std::streamoff>(e.local_header_offset));
    io_.read(&hdr[0], static_cast<std::streamsize>(hdr.size()));
    if (!io_ || rd32(hdr, 0) != LOCAL_SIG) {
        throw ArchiveError("bad local header for entry '" + e.name + "'");
    }
    const uint16_t nlen = rd16(hdr, 26);
    const uint16_t elen = rd16(hdr, 28);
    std::string rest(static_cast<size_t>(nlen) + elen, '\0');
    if (!rest.empty()) io_.read(&rest[0], static_cast<std::streamsize>(rest.size()));
    if (!io_) throw ArchiveError("truncated local header for entry '" + e.name + "'");
    if (local_extra) *local_extra = rest.substr(nlen);
    return static_cast<uint64_t>(e.local_header_offset) + LOCAL_HEADER_SIZE + nlen + elen;
}

ZipRawData ZipArchive::read_raw(const ZipEntry& e) {
    ZipRawData raw;
    uint64_t off = data_offset(e, &raw.local_extra);
    raw.data.resize(e.compressed_size);
    io_.seekg(static_cast<std::streamoff>(off));
    if (e.compressed_size > 0) io_.read(&raw.data[0], static_cast<std::streamsize>(e.compressed_size));
    if (!io_) throw ArchiveError("truncated data for entry '" + e.name + "'");
    return raw;
}

std::string ZipArchive::read(const ZipEntry& e) {
    if (e.flags & FLAG_ENCRYPTED) throw ArchiveError("entry '" + e.name + "' is encrypted");
    ZipRawData raw = read_raw(e);
    std::string data;
    if (e.method == ZIP_STORED) {
        data = std::move(raw.data);
    } else if (e.method == ZIP_DEFLATED) {
        data = zip_inflate(raw.data, e.uncompressed_size);
    } else {
        throw ArchiveError("unsupported compression method " + std::to_string(e.method) +
                           " for entry '" + e.name + "'");
    }
    if (data.size() != e.uncompressed_size || zip_crc32(data) != e.crc32) {
        throw ArchiveError("CRC mismatch for entry '" + e.name + "'");
    }
    return data;
}

std::string ZipArchive::read(const std::string& name) {
    const ZipEntry* e = find(name);
    if (!e) throw ArchiveError("entry '" + name + "' not found in '" + path_.string() + "'");
    ZipEntry copy = *e;
    return read(copy);
}

void ZipArchive::require_writable() const {
    if (!open_) throw ArchiveError("archive '" + path_.string() + "' is closed");
    if (mode_ == ZipMode::READ) throw ArchiveError("archive '" + path_.string() + "' is read-only");
}

void ZipArchive::write_entry(ZipEntry e, const std::string& local_extra, const std::string& payload) {
    require_writable();
    if (entries_.size() >= 0xFFFF) throw ArchiveError("too many entries for a non-ZIP64 archive");
    if (payload.size() >= 0xFFFFFFFFu || write_pos_ >= 0xFFFFFFFFu) {
        throw ArchiveError("entry '" + e.name + "' needs ZIP64, which is not supported");
    }
    if (e.name.size() > 0xFFFF || local_extra.size() > 0xFFFF) {
        throw ArchiveError("entry name or extra field too long: '" + e.name + "'");
    }

    e.local_header_offset = static_cast<uint32_t>(write_pos_);
    e.compressed_size = static_cast<uint32_t>(payload.size());
    e.flags &= static_cast<uint16_t>(~FLAG_DATA_DESCRIPTOR);

    std::string hdr;
    hdr.reserve(LOCAL_HEADER_SIZE + e.name.size() + local_extra.size());
    put32(hdr, LOCAL_SIG);
    put16(hdr, e.version_needed);
    put16(hdr, e.flags);
    put16(hdr, e.method);
    put16(hdr, e.mod_time);
    put16(hdr, e.mod_date);
    put32(hdr, e.crc32);
    put32(hdr, e.compressed_size);
    put32(hdr, e.uncompressed_size);
    put16(hdr, static_cast<uint16_t>(e.name.size()));
    put16(hdr, static_cast<uint16_t>(local_extra.size()));
    hdr += e.name;
    hdr += local_extra;

    io_.clear();
    io_.seekp(static_cast<std::streamoff>(write_pos_));
    io_.write(hdr.data(), static_cast<std::streamsize>(hdr.size()));
    io_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!io_) throw ArchiveError("write failed for entry '" + e.name + "' in '" + path_.string() + "'");

    write_pos_ += hdr.size() + payload.size();
    entries_.push_back(std::move(e));
    dirty_ = true;
}

void ZipArchive::add(const std::string& name, const std::string& data, uint16_t method) {
    if (data.size() >= 0xFFFFFFFFu) throw ArchiveError("entry '" + name + "' needs ZIP64");
    ZipEntry e;
    e.name = name;
    e.method = method;
    e.version_needed = (method == ZIP_STORED) ? 10 : 20;
    e.external_attr = 0100644u << 16;
    if (!is_ascii(name)) e.flags |= FLAG_UTF8;
    dos_time_now(&e.mod_time, &e.mod_date);
    e.crc32 = zip_crc32(data);
    e.uncompressed_size = static_cast<uint32_t>(data.size());
    write_entry(std::move(e), std::string(), compress_for(method, data, name));
}

void ZipArchive::add_like(const ZipEntry& like, const std::string& data) {
    if (data.size() >= 0xFFFFFFFFu) throw ArchiveError("entry '" + like.name + "' needs ZIP64");
    ZipEntry e = like;
    e.flags &= static_cast<uint16_t>(~FLAG_ENCRYPTED);
    e.crc32 = zip_crc32(data);
    e.uncompressed_size = static_cast<uint32_t>(data.size());
    write_entry(std::move(e), std::string(), compress_for(like.method, data, like.name));
}

void ZipArchive::add_raw(const ZipEntry& src, const ZipRawData& raw) {
    if (raw.data.size() != src.compressed_size) {
        throw ArchiveError("raw data size mismatch for entry '" + src.name + "'");
    }
    write_entry(src, raw.local_extra, raw.data);
}

void ZipArchive::set_comment(const std::string& c) {
    require_writable();
    if (c.size() > MAX_COMMENT) throw ArchiveError("archive comment too long");
    comment_ = c;
    dirty_ = true;
}

bool ZipArchive::finalize() {
    if (!open_) return true;
    open_ = false;
    if (mode_ == ZipMode::READ || !dirty_) {
        io_.close();
        return true;
    }

    std::string cd;
    for (const auto& e : entries_) {
        put32(cd, CENTRAL_SIG);
        put16(cd, e.version_made_by);
        put16(cd, e.version_needed);
        put16(cd, e.flags);
        put16(cd, e.method);
        put16(cd, e.mod_time);
        put16(cd, e.mod_date);
        put32(cd, e.crc32);
        put32(cd, e.compressed_size);
        put32(cd, e.uncompressed_size);
        put16(cd, static_cast<uint16_t>(e.name.size()));
        put16(cd, static_cast<uint16_t>(e.extra.size()));
        put16(cd, static_cast<uint16_t>(e.comment.size()));
        put16(cd, 0); // disk number start
        put16(cd, e.internal_attr);
        put32(cd, e.external_attr);
        put32(cd, e.local_header_offset);
        cd += e.name;
        cd += e.extra;
        cd += e.comment;
    }

    std::string end;
    put32(end, EOCD_SIG);
    put16(end, 0);
    put16(end, 0);
    put16(end, static_cast<uint16_t>(entries_.size()));
    put16(end, static_cast<uint16_t>(entries_.size()));
    put32(end, static_cast<uint32_t>(cd.size()));
    put32(end, static_cast<uint32_t>(write_pos_));
    put16(end, static_cast<uint16_t>(comment_.size()));
    end += comment_;

    io_.clear();
    io_.seekp(static_cast<std::streamoff>(write_pos_));
    io_.write(cd.data(), static_cast<std::streamsize>(cd.size()));
    io_.write(end.data(), static_cast<std::streamsize>(end.size()));
    io_.flush();
    bool ok = static_cast<bool>(io_);
    io_.close();

    // APPEND may leave bytes of the old, longer directory behind.
    const uint64_t final_size = write_pos_ + cd.size() + end.size();
    std::error_code ec;
    uint64_t on_disk = fs::file_size(path_, ec);
    if (!ec && on_disk > final_size) fs::resize_file(path_, final_size, ec);
    return ok && !ec;
}

void ZipArchive::close() {
    if (!finalize()) {
        throw ArchiveError("failed to write central directory of '" + path_.string() + "'");
    }
}

} // namespace stagehand
