#include "tasks/builtin_tasks.h"
#include "stagehand/proc.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace stagehand {

namespace fs = std::filesystem;

static const char* b64_table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int b64_index(char c) {
    const char* p = std::strchr(b64_table, c);
    if (!p || c == '\0') return -1;
    return static_cast<int>(p - b64_table);
}

bool b64_decode(const std::string& in, std::string* out) {
    std::string clean;
    clean.reserve(in.size());
    for (char c : in) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        clean.push_back(c);
    }
    if (clean.size() % 4 != 0) return false;

    out->clear();
    out->reserve(clean.size() / 4 * 3);
    for (size_t i = 0; i < clean.size(); i += 4) {
        const bool last = (i + 4 == clean.size());
        int pad = 0;
        uint32_t triple = 0;
        for (size_t j = 0; j < 4; j++) {
            char c = clean[i + j];
            if (c == '=') {
                // padding only in the last two positions of the final group
                if (!last || j < 2) return false;
                pad++;
                triple <<= 6;
                continue;
            }
            if (pad > 0) return false;
            int v = b64_index(c);
            if (v < 0) return false;
            triple = (triple << 6) | static_cast<uint32_t>(v);
        }
        out->push_back(static_cast<char>((triple >> 16) & 0xFF));
        if (pad < 2) out->push_back(static_cast<char>((triple >> 8) & 0xFF));
        if (pad < 1) out->push_back(static_cast<char>(triple & 0xFF));
    }
    return true;
}

std::string common_prefix(const std::vector<std::string>& items) {
    if (items.empty()) return "";
    auto mm = std::minmax_element(items.begin(), items.end());
    const std::string& a = *mm.first;
    const std::string& b = *mm.second;
    size_t n = 0;
    while (n < a.size() && n < b.size() && a[n] == b[n]) n++;
    return a.substr(0, n);
}

std::vector<fs::path> files_with_suffix(const fs::path& dir, const std::string& suffix) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string name = it->path().filename().string();
        if (name.size() >= suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            out.push_back(it->path());
        }
    }
    if (ec) throw std::runtime_error("cannot list '" + dir.string() + "': " + ec.message());
    std::sort(out.begin(), out.end());
    return out;
}

fs::path single_artifact(const fs::path& dir, const std::string& suffix, Logger& log) {
    auto found = files_with_suffix(dir, suffix);
    if (found.empty()) {
        throw std::runtime_error("no '*" + suffix + "' file in '" + dir.string() + "'");
    }
    if (found.size() > 1) {
        log.warn("Found " + std::to_string(found.size()) + " '*" + suffix + "' files in '" +
                 dir.string() + "', using '" + found.front().filename().string() + "'");
    }
    return found.front();
}

std::vector<std::string> command_argv(const std::string& command) {
    std::vector<std::string> argv = split_argv_quoted(command);
    if (argv.empty()) throw std::runtime_error("invalid command line: '" + command + "'");
    return argv;
}

} // namespace stagehand
