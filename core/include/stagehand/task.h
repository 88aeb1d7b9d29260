#pragma once
#include "config.h"
#include "log.h"
#include "proc.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

struct json_object;

namespace stagehand {

enum class Stage { PRE_BUILD, POST_BUILD };

const char* stage_name(Stage s);

// Capability flags: a task takes part in a stage only if it declares the hook.
constexpr unsigned HOOK_PRE_BUILD = 1u << 0;
constexpr unsigned HOOK_POST_BUILD = 1u << 1;

unsigned hook_flag(Stage s);

// Everything a task instance may touch. Config is the full tree.
struct TaskContext {
    std::string name;
    Config& config;
    Logger& log;
    ProcessRunner& runner;
};

class Task {
public:
    virtual ~Task() = default;
    virtual void pre_build() {}
    virtual void post_build() {}
};

using TaskFactory = std::function<std::unique_ptr<Task>(const TaskContext& ctx)>;

// Checks, normalizes or fills the task's own config subtree in place
// (always a JSON object). Throws with a readable message on bad config.
using ValidateFn = std::function<void(json_object* subtree)>;

struct TaskDesc {
    std::string type_name;                   // e.g. "PatchTask"
    int priority{0};                         // higher runs earlier
    std::vector<std::string> affected_files; // relative to the toolchain root
    ValidateFn validate;                     // optional
    TaskFactory create;
    unsigned hooks{0};
};

} // namespace stagehand
