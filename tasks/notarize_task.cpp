#include "tasks/builtin_tasks.h"
#include "stagehand/json_mini.h"
#include "stagehand/proc.h"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace stagehand {

namespace fs = std::filesystem;

namespace {

const char* const kDefaultNotarizer = "renotize";

// Hands the *-mac.zip to the external notarization tool, passing the task's
// own config subtree (minus "command") as its config file.
class NotarizeTask : public Task {
public:
    explicit NotarizeTask(const TaskContext& ctx) : ctx_(ctx), active_(ctx.config.build_enabled("mac")) {}

    void post_build() override {
        if (!active_) {
            ctx_.log.debug("Mac build disabled, nothing to notarize");
            return;
        }
        json_object* cfg = ctx_.config.section(ctx_.name);
        const std::string command =
            json_mini::get_string(cfg, "command").value_or(kDefaultNotarizer);
        const fs::path mac_zip = single_artifact(ctx_.config.output_dir(), "-mac.zip", ctx_.log);

        // RAII guard for the hand-off object
        struct JsonGuard { json_object* o; ~JsonGuard() { if (o) json_object_put(o); } };
        JsonGuard handoff{json_object_new_object()};
        if (json_mini::is_object(cfg)) {
            json_object_object_foreach(cfg, k, v) {
                if (std::string(k) == "command") continue;
                json_object_object_add(handoff.o, k, json_object_get(v));
            }
        }
        const std::string body = json_object_to_json_string_ext(handoff.o, JSON_C_TO_STRING_PRETTY);

        std::random_device rd;
        std::ostringstream fname;
        fname << "stagehand_notarize_" << rd() << ".json";
        const fs::path cfg_path = fs::temp_directory_path() / fname.str();
        {
            std::ofstream f(cfg_path, std::ios::binary);
            if (!f) throw std::runtime_error("cannot write '" + cfg_path.string() + "'");
            f.write(body.data(), static_cast<std::streamsize>(body.size()));
        }
        struct RemoveOnExit {
            fs::path p;
            ~RemoveOnExit() { std::error_code ec; fs::remove(p, ec); }
        } cleanup{cfg_path};

        std::vector<std::string> argv = command_argv(command);
        argv.insert(argv.end(), {"-c", cfg_path.string(), mac_zip.string(), "full-run"});

        ctx_.log.info("Notarizing '" + mac_zip.filename().string() + "'...");
        ProcResult res;
        bool started = ctx_.runner.run(argv, "", [this](const std::string& line) {
            std::string t = trim_ws(line);
            if (!t.empty()) ctx_.log.debug(t);
        }, &res);
        if (!started) throw std::runtime_error(res.error);
        if (res.exit_code != 0) {
            throw std::runtime_error(argv[0] + " exited with status " + std::to_string(res.exit_code));
        }
    }

private:
    TaskContext ctx_;
    bool active_;
};

void validate_notarize_config(json_object* cfg) {
    json_object* v = json_mini::member(cfg, "command");
    if (!v) {
        json_mini::set_string(cfg, "command", kDefaultNotarizer);
        return;
    }
    auto cmd = json_mini::get_string(cfg, "command");
    if (!cmd) throw std::runtime_error("'command' must be a string");
    (void)command_argv(*cmd);
}

} // namespace

TaskDesc notarize_task_desc() {
    TaskDesc d;
    d.type_name = "NotarizeTask";
    d.priority = 0;
    d.validate = validate_notarize_config;
    d.create = [](const TaskContext& ctx) { return std::make_unique<NotarizeTask>(ctx); };
    d.hooks = HOOK_POST_BUILD;
    return d;
}

} // namespace stagehand
