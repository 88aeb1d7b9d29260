#include "build_driver.h"
#include "runner_utils.h"

#include "stagehand/backup.h"
#include "stagehand/errors.h"
#include "stagehand/json_mini.h"
#include "stagehand/scheduler.h"

#include <json-c/json.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace stagehand {

namespace fs = std::filesystem;

static const char* const kInstallLocation = "Install Location:";

static bool answers_help(ProcessRunner& runner, std::vector<std::string> argv) {
    argv.push_back("--help");
    ProcResult res;
    if (!runner.run(argv, "", LineFn(), &res)) return false;
    return res.exit_code == 0 && res.output.find("Usage") != std::string::npos;
}

Toolchain::Toolchain(const Config& config, Logger& log, ProcessRunner& runner)
    : log_(log), runner_(runner) {
    command_ = split_argv_quoted(config.toolchain_command());
    base_ = command_;
    if (command_.empty()) throw ConfigError("invalid toolchain.command: '" + config.toolchain_command() + "'");
    auto registry = json_mini::get_string(config.section("toolchain"), "registry");
    if (registry && !registry->empty()) {
        base_.push_back("-r");
        base_.push_back(*registry);
    }
}

std::vector<std::string> Toolchain::argv_for(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = base_;
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

ProcResult Toolchain::run(const std::vector<std::string>& args, bool stream) {
    const std::vector<std::string> argv = argv_for(args);
    log_.debug("$ " + join(argv, " "));
    ProcResult res;
    LineFn on_line;
    if (stream) {
        on_line = [this](const std::string& line) {
            std::string t = trim_ws(line);
            if (!t.empty()) log_.debug(t);
        };
    }
    if (!runner_.run(argv, "", on_line, &res)) throw std::runtime_error(res.error);
    return res;
}

void Toolchain::run_checked(const std::vector<std::string>& args, const std::string& what) {
    ProcResult res = run(args, true);
    if (res.exit_code != 0) {
        throw std::runtime_error(what + " failed: '" + join(argv_for(args), " ") + "' exited with status " +
                                 std::to_string(res.exit_code));
    }
}

bool Toolchain::available() {
    return answers_help(runner_, command_);
}

std::vector<std::string> Toolchain::installed_versions() {
    ProcResult res = run({"list"}, false);
    if (res.exit_code != 0) throw std::runtime_error("cannot list installed toolchain versions");
    return nonempty_lines(res.output);
}

std::string Toolchain::latest_version() {
    ProcResult res = run({"list", "--all"}, false);
    std::vector<std::string> lines = nonempty_lines(res.output);
    if (res.exit_code != 0 || lines.empty()) {
        throw std::runtime_error("cannot determine the latest toolchain version");
    }
    return lines.front();
}

void Toolchain::install(const std::string& version) {
    run_checked({"install", version}, "installing version " + version);
}

fs::path Toolchain::install_location(const std::string& version) {
    ProcResult res = run({"show", version}, false);
    std::vector<std::string> lines;
    std::istringstream in(res.output);
    std::string line;
    while (std::getline(in, line)) lines.push_back(trim_ws(line));
    if (res.exit_code != 0 || lines.size() < 2) {
        throw std::runtime_error("cannot read the install location of version " + version);
    }
    std::string loc = lines[1];
    if (loc.rfind(kInstallLocation, 0) == 0) loc = trim_ws(loc.substr(std::string(kInstallLocation).size()));
    if (loc.empty()) throw std::runtime_error("empty install location for version " + version);
    return loc;
}

void Toolchain::build_android(const std::string& version, const BuildOptions& opts) {
    run_checked({"launch", version, "-h", "android_build", opts.project.string(), "assembleRelease",
                 "--destination", opts.output.string()},
                "Android build");
}

void Toolchain::distribute(const std::string& version, const BuildOptions& opts,
                           const std::vector<std::string>& packages) {
    std::vector<std::string> args = {"launch", version, "-h", "distribute", opts.project.string(),
                                     "--destination", opts.output.string()};
    for (const auto& p : packages) {
        args.push_back("--package");
        args.push_back(p);
    }
    run_checked(args, "Distribution build");
}

static void check_notarizer(const ResolvedPlan& plan, Config& config, ProcessRunner& runner) {
    bool enabled = std::any_of(plan.tasks.begin(), plan.tasks.end(),
                               [](const ResolvedTask& t) { return t.name == "notarize"; });
    if (!enabled || !config.build_enabled("mac")) return;
    const std::string cmd =
        json_mini::get_string(config.section("notarize"), "command").value_or("renotize");
    std::vector<std::string> argv = split_argv_quoted(cmd);
    if (argv.empty() || !answers_help(runner, argv)) {
        throw std::runtime_error("Please install '" + cmd + "' before continuing!");
    }
}

void run_build(const BuildOptions& opts, Config& config, const TaskRegistry& registry,
               Logger& log, ProcessRunner& runner) {
    BuildOptions abs;
    abs.project = fs::absolute(opts.project).lexically_normal();
    abs.output = fs::absolute(opts.output).lexically_normal();
    abs.debug = opts.debug;

    if (!fs::exists(abs.output)) {
        log.warn("The output directory does not exist, creating it...");
        fs::create_directories(abs.output);
    }

    json_object* root = config.root();
    json_mini::set_string(root, "project", abs.project.string());
    json_mini::set_string(root, "output", abs.output.string());
    json_mini::set_bool(root, "debug", abs.debug);
    config.apply_defaults();

    log.info("Loaded tasks:");
    const ResolvedPlan plan = registry.resolve(config, log);

    Toolchain tc(config, log, runner);
    if (!tc.available()) {
        throw std::runtime_error("Please install '" + config.toolchain_command() + "' before continuing!");
    }
    check_notarizer(plan, config, runner);

    log.info("Checking available toolchain versions");
    const std::vector<std::string> installed = tc.installed_versions();
    std::string version = config.toolchain_version();
    if (version == "latest") version = tc.latest_version();
    json_object* toolchain = config.section("toolchain");
    json_mini::set_string(toolchain, "version", version);

    if (std::find(installed.begin(), installed.end(), version) == installed.end()) {
        log.warn("Version " + version + " is not installed, installing now...");
        tc.install(version);
    }
    const fs::path tc_path = tc.install_location(version);
    json_mini::set_string(toolchain, "path", tc_path.string());

    json_object* payload = json_object_new_object();
    json_object_object_add(payload, "version", json_object_new_string(version.c_str()));
    json_object_object_add(payload, "path", json_object_new_string(tc_path.string().c_str()));
    log.event("toolchain_resolved", payload);

    BackupStore(log).prepare_affected_files(tc_path, plan.affected_files);

    TaskScheduler scheduler(plan, config, log, runner);
    if (!plan.tasks.empty()) {
        Logger::Group g(log, "Pre-Build Tasks");
        scheduler.runStage(Stage::PRE_BUILD);
    }

    if (config.build_enabled("android")) {
        Logger::Group g(log, "Build Android");
        log.info("Building Android package");
        tc.build_android(version, abs);
    }

    std::vector<std::string> packages;
    if (config.build_enabled("pc")) packages.push_back("pc");
    if (config.build_enabled("mac")) packages.push_back("mac");
    if (!packages.empty()) {
        Logger::Group g(log, "Build " + join(packages, ", "));
        log.info("Building " + join(packages, ", ") + (packages.size() == 1 ? " package" : " packages"));
        tc.distribute(version, abs, packages);
    }

    if (!plan.tasks.empty()) {
        Logger::Group g(log, "Post-Build Tasks");
        scheduler.runStage(Stage::POST_BUILD);
    }
    log.event("build_finished", nullptr);
}

} // namespace stagehand
