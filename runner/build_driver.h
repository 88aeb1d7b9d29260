#pragma once

#include "stagehand/config.h"
#include "stagehand/log.h"
#include "stagehand/proc.h"
#include "stagehand/registry.h"

#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

struct BuildOptions {
    std::filesystem::path project;
    std::filesystem::path output;
    bool debug{false};
};

// The SDK manager CLI (renutil-compatible): `<command> [-r <registry>] <verb> ...`.
class Toolchain {
public:
    Toolchain(const Config& config, Logger& log, ProcessRunner& runner);

    // `<command> --help` exits 0 and prints a usage line.
    bool available();

    std::vector<std::string> installed_versions();
    std::string latest_version();
    void install(const std::string& version);

    // Second line of `show <version>`, "Install Location:" stripped.
    std::filesystem::path install_location(const std::string& version);

    void build_android(const std::string& version, const BuildOptions& opts);
    void distribute(const std::string& version, const BuildOptions& opts,
                    const std::vector<std::string>& packages);

private:
    std::vector<std::string> argv_for(const std::vector<std::string>& args) const;
    // Captures output; stream=true also forwards each line to the debug log.
    ProcResult run(const std::vector<std::string>& args, bool stream);
    void run_checked(const std::vector<std::string>& args, const std::string& what);

    std::vector<std::string> command_; // as configured
    std::vector<std::string> base_;    // command_ plus registry selection
    Logger& log_;
    ProcessRunner& runner_;
};

// The whole pipeline: defaults, task resolution, toolchain setup, backups,
// pre-build tasks, Android and desktop builds, post-build tasks.
// Throws on the first fatal error.
void run_build(const BuildOptions& opts, Config& config, const TaskRegistry& registry,
               Logger& log, ProcessRunner& runner);

} // namespace stagehand
