#pragma once
#include "json_mini.h"
#include "log.h"

#include <filesystem>
#include <string>

namespace stagehand {

// Pipeline configuration: one json-c tree. Reserved top-level keys are
// "tasks", "build", "toolchain", "project", "output" and "debug"; every other
// key is the config subtree of the task with that name.
class Config {
public:
    Config();
    explicit Config(json_mini::Doc doc);

    static Config load_file(const std::filesystem::path& path);
    static Config from_json(const std::string& json);

    json_object* root() const { return doc_.root; }

    // Borrowed subtree, nullptr when absent.
    json_object* section(const std::string& name) const;

    // Fills the defaults the driver relies on:
    //   build.{pc,mac,android} = true, toolchain.command = "renutil",
    //   toolchain.version = "latest", toolchain.registry = null,
    //   tasks.path = null (with "~" expanded when set).
    // Throws ConfigError when a reserved key has the wrong type.
    void apply_defaults();

    bool build_enabled(const std::string& platform) const;

    // Throw ConfigError when the value was never set.
    std::filesystem::path toolchain_path() const;
    std::filesystem::path output_dir() const;
    std::string toolchain_command() const;
    std::string toolchain_version() const;

private:
    json_mini::Doc doc_;
};

// "~" and "~/..." expand to $HOME; anything else is returned unchanged.
std::string expand_user(const std::string& path);

// STAGEHAND_LOG_LEVEL=debug|info|warn|error, default INFO.
LogLevel detect_log_level();

// GITHUB_ACTIONS=true selects workflow-command output, PLAIN otherwise.
LogFormat detect_log_format();

} // namespace stagehand
