#include "stagehand/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace stagehand {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Serialize with sorted object keys so event lines diff cleanly between runs.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string(ks);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(std::ostream& out, LogLevel min_level, LogFormat format)
    : out_(out), level_(min_level), format_(format) {}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(level_)) return;

    if (format_ == LogFormat::GITHUB_ACTIONS) {
        switch (lvl) {
            case LogLevel::DEBUG: out_ << "::debug::" << msg << "\n"; break;
            case LogLevel::INFO:  out_ << msg << "\n"; break;
            case LogLevel::WARN:  out_ << "::warning::" << msg << "\n"; break;
            case LogLevel::ERROR: out_ << "::error::" << msg << "\n"; break;
        }
    } else {
        out_ << "[" << level_name(lvl) << "] " << msg << "\n";
    }
    out_.flush();
}

bool Logger::open_event_log(const std::string& path, const std::string& run_id) {
    auto f = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
    if (!*f) return false;
    events_ = std::move(f);
    run_id_ = run_id;
    seq_ = 0;
    return true;
}

void Logger::event(const std::string& name, json_object* payload) {
    if (!events_) {
        if (payload) json_object_put(payload);
        return;
    }

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object_object_add(rec, "payload", payload ? payload : json_object_new_object());
    json_object_object_add(rec, "run_id", json_object_new_string(run_id_.c_str()));
    json_object_object_add(rec, "seq", json_object_new_int64(seq_++));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    *events_ << line.str() << "\n";
    events_->flush();
}

Logger::Group::Group(Logger& log, const std::string& title)
    : log_(log), active_(log.format() == LogFormat::GITHUB_ACTIONS) {
    if (active_) {
        log_.out_ << "::group::" << title << "\n";
        log_.out_.flush();
    }
}

Logger::Group::~Group() {
    if (active_) {
        log_.out_ << "::endgroup::\n";
        log_.out_.flush();
    }
}

} // namespace stagehand
