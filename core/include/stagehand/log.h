#pragma once
#include <fstream>
#include <iosfwd>
#include <memory>
#include <string>

struct json_object;

namespace stagehand {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

// PLAIN: "[INFO] message". GITHUB_ACTIONS: workflow commands understood by
// the Actions log viewer (::warning::, ::group::, ...).
enum class LogFormat { PLAIN, GITHUB_ACTIONS };

// Console logger passed explicitly to the registry, the scheduler and every
// task. Optionally mirrors structured events to a JSONL trail.
class Logger {
public:
    explicit Logger(std::ostream& out, LogLevel min_level = LogLevel::INFO,
                    LogFormat format = LogFormat::PLAIN);

    void set_level(LogLevel lvl) { level_ = lvl; }
    LogLevel level() const { return level_; }
    LogFormat format() const { return format_; }

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg) { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }
    void log(LogLevel lvl, const std::string& msg);

    // Opens (truncates) a JSONL event trail. Returns false if the file
    // cannot be created.
    bool open_event_log(const std::string& path, const std::string& run_id);
    bool has_event_log() const { return events_ != nullptr; }

    // Appends one record {"event","payload","run_id","seq","ts"} with sorted
    // keys. Takes ownership of payload (may be nullptr). No-op without a trail.
    void event(const std::string& name, json_object* payload);

    // Collapsible output section under GitHub Actions, no-op otherwise.
    class Group {
    public:
        Group(Logger& log, const std::string& title);
        ~Group();
        Group(const Group&) = delete;
        Group& operator=(const Group&) = delete;

    private:
        Logger& log_;
        bool active_;
    };

private:
    std::ostream& out_;
    LogLevel level_;
    LogFormat format_;
    std::unique_ptr<std::ofstream> events_;
    std::string run_id_;
    long long seq_{0};
};

const char* level_name(LogLevel lvl);

} // namespace stagehand
