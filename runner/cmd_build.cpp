#include "cmd_build.h"
#include "build_driver.h"
#include "runner_utils.h"
#include "tasks/builtin_tasks.h"

#include "stagehand/config.h"
#include "stagehand/log.h"
#include "stagehand/proc.h"
#include "stagehand/registry.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace stagehand;

static void usage(std::ostream& out) {
    out << "usage: stagehand_cli build -i <project_dir> -o <output_dir> -c <config.json> [-d]\n"
        << "  -i, --input   the project to build\n"
        << "  -o, --output  directory receiving the build artifacts (created if missing)\n"
        << "  -c, --config  pipeline configuration for this run\n"
        << "  -d, --debug   show debug output\n"
        << "env: STAGEHAND_LOG_LEVEL, STAGEHAND_EVENT_LOG, GITHUB_ACTIONS, STAGEHAND_KEYSTORE\n";
}

// Accepts "-x value", "--long value" and "--long=value".
static bool take_value(const std::string& arg, const char* shortf, const char* longf,
                       int& i, int argc, char** argv, std::string* out) {
    const std::string long_eq = std::string(longf) + "=";
    if (arg.rfind(long_eq, 0) == 0) {
        *out = arg.substr(long_eq.size());
        return true;
    }
    if (arg != shortf && arg != longf) return false;
    if (i + 1 >= argc) throw std::runtime_error("option " + arg + " requires a value");
    *out = argv[++i];
    return true;
}

int cmd_build(int argc, char** argv) {
    std::string project, output, config_path;
    bool debug = false;
    try {
        for (int i = 2; i < argc; i++) {
            const std::string a = argv[i];
            if (take_value(a, "-i", "--input", i, argc, argv, &project)) continue;
            if (take_value(a, "-o", "--output", i, argc, argv, &output)) continue;
            if (take_value(a, "-c", "--config", i, argc, argv, &config_path)) continue;
            if (a == "-d" || a == "--debug") { debug = true; continue; }
            if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
            std::cerr << "unknown option: " << a << "\n";
            usage(std::cerr);
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        usage(std::cerr);
        return 2;
    }
    if (project.empty() || output.empty() || config_path.empty()) {
        usage(std::cerr);
        return 2;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(project, ec)) {
        std::cerr << "project directory '" << project << "' does not exist\n";
        return 2;
    }
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        std::cerr << "config file '" << config_path << "' does not exist\n";
        return 2;
    }

    Logger log(std::cout, debug ? LogLevel::DEBUG : detect_log_level(), detect_log_format());
    if (const char* ev = std::getenv("STAGEHAND_EVENT_LOG")) {
        if (!log.open_event_log(ev, gen_run_id())) {
            log.warn(std::string("cannot open event log '") + ev + "', continuing without it");
        }
    }

    try {
        Config config = Config::load_file(config_path);
        TaskRegistry registry;
        register_builtin_tasks(registry);
        PosixProcessRunner runner;

        BuildOptions opts;
        opts.project = project;
        opts.output = output;
        opts.debug = debug;
        run_build(opts, config, registry, log, runner);
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    log.info("Build finished");
    return 0;
}
