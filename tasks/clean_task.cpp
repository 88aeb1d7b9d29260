#include "tasks/builtin_tasks.h"

#include <stdexcept>
#include <system_error>

namespace stagehand {

namespace fs = std::filesystem;

namespace {

const std::string kKeptApkSuffix = "-universal-release.apk";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Runs last: drops the toolchain's temporary files and every APK except the
// universal release build.
class CleanTask : public Task {
public:
    explicit CleanTask(const TaskContext& ctx) : ctx_(ctx) {}

    void post_build() override {
        std::vector<std::string> argv = command_argv(ctx_.config.toolchain_command());
        argv.push_back("clean");
        argv.push_back(ctx_.config.toolchain_version());

        ProcResult res;
        bool started = ctx_.runner.run(argv, "", [this](const std::string& line) {
            if (!line.empty()) ctx_.log.debug(line);
        }, &res);
        if (!started) throw std::runtime_error(res.error);
        if (res.exit_code != 0) {
            ctx_.log.warn("'" + argv[0] + " clean' exited with status " + std::to_string(res.exit_code));
        }

        for (const auto& apk : files_with_suffix(ctx_.config.output_dir(), ".apk")) {
            const std::string name = apk.filename().string();
            if (ends_with(name, kKeptApkSuffix)) continue;
            ctx_.log.debug("Removing '" + name + "'");
            std::error_code ec;
            fs::remove(apk, ec);
            if (ec) throw std::runtime_error("cannot remove '" + apk.string() + "': " + ec.message());
        }
    }

private:
    TaskContext ctx_;
};

} // namespace

TaskDesc clean_task_desc() {
    TaskDesc d;
    d.type_name = "CleanTask";
    d.priority = -1000;
    d.create = [](const TaskContext& ctx) { return std::make_unique<CleanTask>(ctx); };
    d.hooks = HOOK_POST_BUILD;
    return d;
}

} // namespace stagehand
