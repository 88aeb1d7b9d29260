#include "stagehand/config.h"
#include "stagehand/errors.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace stagehand {

Config::Config() : doc_(json_object_new_object()) {}

Config::Config(json_mini::Doc doc) : doc_(std::move(doc)) {
    if (!json_mini::is_object(doc_.root)) {
        throw ConfigError("config root must be a JSON object");
    }
}

Config Config::load_file(const std::filesystem::path& path) {
    try {
        return Config(json_mini::parse_file(path));
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigError(e.what());
    }
}

Config Config::from_json(const std::string& json) {
    std::string err;
    json_mini::Doc d = json_mini::parse(json, &err);
    if (!d) throw ConfigError("invalid config JSON: " + err);
    return Config(std::move(d));
}

json_object* Config::section(const std::string& name) const {
    return json_mini::member(doc_.root, name);
}

static json_object* reserved_object(json_object* root, const char* key) {
    json_object* o = json_mini::ensure_object(root, key);
    if (!o) throw ConfigError(std::string("'") + key + "' must be a mapping");
    return o;
}

// Present and non-null values of a reserved field must have the given type.
static bool check_field(json_object* section, const char* section_name, const char* key, json_type type,
                        const char* type_desc) {
    json_object* v = json_mini::member(section, key);
    if (!v) return false;
    if (!json_object_is_type(v, type)) {
        throw ConfigError(std::string("'") + section_name + "." + key + "' must be " + type_desc + ", got " +
                          json_mini::to_string(v));
    }
    return true;
}

void Config::apply_defaults() {
    json_object* root = doc_.root;

    json_object* build = reserved_object(root, "build");
    for (const char* platform : {"pc", "mac", "android"}) {
        if (!check_field(build, "build", platform, json_type_boolean, "a boolean")) {
            json_mini::set_bool(build, platform, true);
        }
    }

    json_object* tc = reserved_object(root, "toolchain");
    if (!check_field(tc, "toolchain", "command", json_type_string, "a string")) {
        json_mini::set_string(tc, "command", "renutil");
    }
    if (!check_field(tc, "toolchain", "version", json_type_string, "a string")) {
        json_mini::set_string(tc, "version", "latest");
    }
    if (!check_field(tc, "toolchain", "registry", json_type_string, "a string")) {
        json_mini::set_null(tc, "registry");
    }

    json_object* tasks = reserved_object(root, "tasks");
    (void)check_field(tasks, "tasks", "path", json_type_string, "a string");
    auto tasks_path = json_mini::get_string(tasks, "path");
    if (tasks_path) {
        json_mini::set_string(tasks, "path", expand_user(*tasks_path));
    } else {
        json_mini::set_null(tasks, "path");
    }
}

bool Config::build_enabled(const std::string& platform) const {
    return json_mini::get_bool(section("build"), platform).value_or(false);
}

std::filesystem::path Config::toolchain_path() const {
    auto p = json_mini::get_string(section("toolchain"), "path");
    if (!p || p->empty()) throw ConfigError("toolchain.path has not been resolved");
    return *p;
}

std::filesystem::path Config::output_dir() const {
    auto p = json_mini::get_string(doc_.root, "output");
    if (!p || p->empty()) throw ConfigError("'output' is not set");
    return *p;
}

std::string Config::toolchain_command() const {
    return json_mini::get_string(section("toolchain"), "command").value_or("renutil");
}

std::string Config::toolchain_version() const {
    return json_mini::get_string(section("toolchain"), "version").value_or("latest");
}

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

LogLevel detect_log_level() {
    const char* env = std::getenv("STAGEHAND_LOG_LEVEL");
    if (!env) return LogLevel::INFO;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "debug") return LogLevel::DEBUG;
    if (val == "warn" || val == "warning") return LogLevel::WARN;
    if (val == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

LogFormat detect_log_format() {
    const char* env = std::getenv("GITHUB_ACTIONS");
    if (env && std::string(env) == "true") return LogFormat::GITHUB_ACTIONS;
    return LogFormat::PLAIN;
}

} // namespace stagehand
