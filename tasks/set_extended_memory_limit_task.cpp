#include "tasks/builtin_tasks.h"
#include "stagehand/archive_rewriter.h"
#include "stagehand/errors.h"
#include "stagehand/json_mini.h"
#include "stagehand/pe_patch.h"

#include <stdexcept>

namespace stagehand {

namespace fs = std::filesystem;

namespace {

const char* const kDefaultLibDir = "lib/windows-i686";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Sets the large-address-aware flag on the Windows launchers inside the
// *-pc.zip distribution so the 32-bit runtime can use more than 2 GiB.
class SetExtendedMemoryLimitTask : public Task {
public:
    explicit SetExtendedMemoryLimitTask(const TaskContext& ctx)
        : ctx_(ctx), active_(ctx.config.build_enabled("pc")) {}

    void post_build() override {
        if (!active_) {
            ctx_.log.debug("PC build disabled, not touching executables");
            return;
        }
        const std::string lib_dir =
            json_mini::get_string(ctx_.config.section(ctx_.name), "lib_dir").value_or(kDefaultLibDir);
        const fs::path zip = single_artifact(ctx_.config.output_dir(), "-pc.zip", ctx_.log);

        UpdatableArchive ar(zip);
        const std::vector<std::string> names = ar.names();

        // common root directory of all entries, without trailing '/'
        std::string root = common_prefix(names);
        size_t slash = root.rfind('/');
        root = (slash == std::string::npos) ? std::string() : root.substr(0, slash);
        const std::string base = root.empty() ? std::string() : root + "/";

        std::string main_exe;
        for (const auto& n : names) {
            if (n.compare(0, base.size(), base) != 0) continue;
            const std::string rest = n.substr(base.size());
            if (rest.find('/') == std::string::npos && ends_with(rest, ".exe")) main_exe = n;
        }

        const std::string lib = base + lib_dir;
        const std::string main_sub_exe =
            main_exe.empty() ? std::string() : lib + "/" + main_exe.substr(base.size());
        const std::string pythonw_exe = lib + "/pythonw.exe";

        std::string missing;
        if (main_exe.empty()) missing += " main executable under '" + base + "'";
        if (main_sub_exe.empty() || !ar.contains(main_sub_exe)) {
            missing += " '" + (main_sub_exe.empty() ? lib + "/<main>.exe" : main_sub_exe) + "'";
        }
        if (!ar.contains(pythonw_exe)) missing += " '" + pythonw_exe + "'";
        if (!missing.empty()) {
            throw ArchiveError("Could not find executable(s) to patch in '" + zip.string() + "':" + missing);
        }

        for (const std::string& exe : {main_exe, main_sub_exe, pythonw_exe}) {
            std::string image = ar.read(exe);
            if (set_large_address_aware(image, exe) == LaaResult::ALREADY_SET) {
                ctx_.log.info("LAA flag was already set for '" + exe + "', skipping");
                continue;
            }
            ctx_.log.info("Setting LAA flag for '" + exe + "'");
            ar.write(exe, image);
        }
        ar.commit();
    }

private:
    TaskContext ctx_;
    bool active_;
};

void validate_laa_config(json_object* cfg) {
    json_object* v = json_mini::member(cfg, "lib_dir");
    if (!v) {
        json_mini::set_string(cfg, "lib_dir", kDefaultLibDir);
        return;
    }
    auto dir = json_mini::get_string(cfg, "lib_dir");
    if (!dir || dir->empty()) throw std::runtime_error("'lib_dir' must be a non-empty string");
    std::string trimmed = *dir;
    while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
    json_mini::set_string(cfg, "lib_dir", trimmed);
}

} // namespace

TaskDesc set_extended_memory_limit_task_desc() {
    TaskDesc d;
    d.type_name = "SetExtendedMemoryLimitTask";
    d.priority = 0;
    d.validate = validate_laa_config;
    d.create = [](const TaskContext& ctx) { return std::make_unique<SetExtendedMemoryLimitTask>(ctx); };
    d.hooks = HOOK_POST_BUILD;
    return d;
}

} // namespace stagehand
