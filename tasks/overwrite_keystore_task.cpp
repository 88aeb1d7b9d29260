#include "tasks/builtin_tasks.h"
#include "stagehand/json_mini.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace stagehand {

namespace fs = std::filesystem;

namespace {

const char* const kKeystoreFile = "rapt/android.keystore";
const char* const kKeystoreEnv = "STAGEHAND_KEYSTORE";

class OverwriteKeystoreTask : public Task {
public:
    explicit OverwriteKeystoreTask(const TaskContext& ctx) : ctx_(ctx) {}

    void pre_build() override {
        ctx_.log.info("Overwriting default keystore with custom one...");
        auto encoded = json_mini::get_string(ctx_.config.section(ctx_.name), "keystore");
        std::string bytes;
        if (!encoded || !b64_decode(*encoded, &bytes)) {
            throw std::runtime_error("keystore is missing or not valid base64");
        }

        const fs::path target = ctx_.config.toolchain_path() / kKeystoreFile;
        std::ofstream f(target, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("cannot open '" + target.string() + "' for writing");
        f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        f.close();
        if (!f) throw std::runtime_error("cannot write '" + target.string() + "'");
    }

private:
    TaskContext ctx_;
};

// keystore comes from the config or the environment; either way it must
// decode, and the resolved value is stored back into the subtree.
void validate_keystore_config(json_object* cfg) {
    std::optional<std::string> ks = json_mini::get_string(cfg, "keystore");
    if (!ks) {
        if (const char* env = std::getenv(kKeystoreEnv)) ks = std::string(env);
    }
    if (!ks) {
        throw std::runtime_error(
            std::string("The overwrite_keystore task is active, but no keystore was specified. "
                        "Please specify either the 'keystore' config option or the '") +
            kKeystoreEnv + "' environment variable.");
    }
    std::string decoded;
    if (!b64_decode(*ks, &decoded)) throw std::runtime_error("'keystore' is not valid base64");
    json_mini::set_string(cfg, "keystore", *ks);
}

} // namespace

TaskDesc overwrite_keystore_task_desc() {
    TaskDesc d;
    d.type_name = "OverwriteKeystoreTask";
    d.priority = 0;
    d.affected_files = {kKeystoreFile};
    d.validate = validate_keystore_config;
    d.create = [](const TaskContext& ctx) { return std::make_unique<OverwriteKeystoreTask>(ctx); };
    d.hooks = HOOK_PRE_BUILD;
    return d;
}

} // namespace stagehand
