#include "runner_utils.h"

#include "stagehand/proc.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <sstream>

namespace stagehand {

std::string gen_run_id() {
    const char* det = std::getenv("STAGEHAND_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception&) {
            r = 0x9e3779b97f4a7c15ULL; // no entropy source; time alone still varies
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << a << b;
    return oss.str();
}

std::vector<std::string> match_command(const std::string& typed, const std::vector<std::string>& commands) {
    std::vector<std::string> matches;
    if (typed.empty()) return matches;
    for (const auto& c : commands) {
        if (c == typed) return {c};
        if (c.compare(0, typed.size(), typed) == 0) matches.push_back(c);
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

std::vector<std::string> nonempty_lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim_ws(line);
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace stagehand
