#include "tasks/builtin_tasks.h"
#include "stagehand/json_mini.h"
#include "stagehand/patch_applier.h"

#include <stdexcept>
#include <system_error>

namespace stagehand {

namespace fs = std::filesystem;

namespace {

// Applies the patch tree configured under patch.path onto the toolchain.
class PatchTask : public Task {
public:
    explicit PatchTask(const TaskContext& ctx) : ctx_(ctx) {}

    void pre_build() override {
        auto dir = json_mini::get_string(ctx_.config.section(ctx_.name), "path");
        if (!dir) throw std::runtime_error("'path' is not set");
        PatchApplier(ctx_.log).apply_tree(*dir, ctx_.config.toolchain_path());
    }

private:
    TaskContext ctx_;
};

void validate_patch_config(json_object* cfg) {
    json_object* v = json_mini::member(cfg, "path");
    if (!v) throw std::runtime_error("Field 'path' missing");
    auto raw = json_mini::get_string(cfg, "path");
    if (!raw) throw std::runtime_error("Field 'path' must be a string");

    std::error_code ec;
    fs::path p = fs::absolute(expand_user(*raw), ec);
    if (ec) throw std::runtime_error("cannot resolve '" + *raw + "': " + ec.message());
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
    if (!fs::is_directory(p, ec)) {
        throw std::runtime_error("Directory '" + p.string() + "' does not exist");
    }
    json_mini::set_string(cfg, "path", p.string());
}

} // namespace

TaskDesc patch_task_desc() {
    TaskDesc d;
    d.type_name = "PatchTask";
    d.priority = 1000;
    d.validate = validate_patch_config;
    d.create = [](const TaskContext& ctx) { return std::make_unique<PatchTask>(ctx); };
    d.hooks = HOOK_PRE_BUILD;
    return d;
}

} // namespace stagehand
