#include "stagehand/archive_rewriter.h"
#include "stagehand/errors.h"

#include <fstream>
#include <iterator>
#include <system_error>

namespace stagehand {

namespace fs = std::filesystem;

UpdatableArchive::UpdatableArchive(const fs::path& path)
    : path_(path), archive_(std::make_unique<ZipArchive>(path, ZipMode::APPEND)) {}

// Uncommitted staged changes are dropped; direct appends are finalized by
// ~ZipArchive.
UpdatableArchive::~UpdatableArchive() = default;

fs::path UpdatableArchive::rebuild_path(const fs::path& archive) {
    fs::path p = archive;
    p += ".rebuild.tmp";
    return p;
}

ZipArchive& UpdatableArchive::open_archive() const {
    if (!archive_) throw ArchiveError("archive '" + path_.string() + "' is already committed");
    return *archive_;
}

void UpdatableArchive::write(const std::string& name, const std::string& data) {
    ZipArchive& za = open_archive();
    if (!za.find(name)) {
        za.add(name, data);
        return;
    }

    Staged& st = staged_[name];
    if (!st.buf) {
        st.buf.reset(std::tmpfile());
        if (!st.buf) {
            staged_.erase(name);
            throw ArchiveError("cannot create staging file for '" + name + "'");
        }
    }
    st.remove = false;
    if (!data.empty() && std::fwrite(data.data(), 1, data.size(), st.buf.get()) != data.size()) {
        throw ArchiveError("cannot stage new content for '" + name + "'");
    }
}

void UpdatableArchive::write_file(const std::string& name, const fs::path& src) {
    std::ifstream in(src, std::ios::binary);
    if (!in) throw ArchiveError("cannot read '" + src.string() + "'");
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw ArchiveError("cannot read '" + src.string() + "'");
    write(name, data);
}

void UpdatableArchive::remove(const std::string& name) {
    if (!open_archive().find(name)) {
        throw ArchiveError("cannot remove '" + name + "': no such entry in '" + path_.string() + "'");
    }
    Staged& st = staged_[name];
    st.buf.reset();
    st.remove = true;
}

std::string UpdatableArchive::read(const std::string& name) {
    return open_archive().read(name);
}

std::vector<std::string> UpdatableArchive::names() const {
    return open_archive().names();
}

bool UpdatableArchive::contains(const std::string& name) const {
    return open_archive().find(name) != nullptr;
}

std::string UpdatableArchive::slurp(std::FILE* f, const std::string& name) {
    std::string out;
    std::rewind(f);
    char buf[65536];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    if (std::ferror(f)) throw ArchiveError("cannot read staged content for '" + name + "'");
    return out;
}

void UpdatableArchive::commit() {
    ZipArchive& za = open_archive();

    struct ReleaseStaging {
        std::map<std::string, Staged>& staged;
        ~ReleaseStaging() { staged.clear(); }
    } release{staged_};

    za.close();
    archive_.reset();
    if (staged_.empty()) return;
    rebuild();
}

void UpdatableArchive::rebuild() {
    ZipArchive src(path_, ZipMode::READ);
    for (const auto& kv : staged_) {
        if (!src.find(kv.first)) {
            throw ArchiveError("staged entry '" + kv.first + "' vanished from '" + path_.string() + "'");
        }
    }

    const fs::path tmp = rebuild_path(path_);
    // Nothing to clean up if the temporary cannot even be created.
    auto out = std::make_unique<ZipArchive>(tmp, ZipMode::CREATE);
    try {
        for (const auto& e : src.entries()) {
            auto it = staged_.find(e.name);
            if (it == staged_.end()) {
                out->add_raw(e, src.read_raw(e));
            } else if (!it->second.remove) {
                out->add_like(e, slurp(it->second.buf.get(), e.name));
            }
        }
        out->set_comment(src.comment());
        out->close();
    } catch (...) {
        out.reset();
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
    out.reset();
    src.close();

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ArchiveError("cannot replace '" + path_.string() + "' with its rebuilt copy: " +
                           ec.message());
    }
}

} // namespace stagehand
