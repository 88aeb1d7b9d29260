#include "cmd_build.h"
#include "runner_utils.h"
#include "tasks/builtin_tasks.h"

#include "stagehand/registry.h"

#include <iostream>
#include <string>
#include <vector>

// List every registered task with its run order and declared effects.
// Usage: stagehand_cli tasks
static int cmd_tasks(int, char**) {
    using namespace stagehand;
    TaskRegistry reg;
    register_builtin_tasks(reg);
    for (const auto& name : reg.taskNames()) {
        const TaskDesc* d = reg.getTask(name);
        std::cout << name << "  (" << d->type_name << ", priority " << d->priority << ")";
        std::vector<std::string> hooks;
        if (d->hooks & HOOK_PRE_BUILD) hooks.push_back(stage_name(Stage::PRE_BUILD));
        if (d->hooks & HOOK_POST_BUILD) hooks.push_back(stage_name(Stage::POST_BUILD));
        std::cout << " hooks: " << (hooks.empty() ? "none" : join(hooks, ","));
        if (!d->affected_files.empty()) std::cout << " affects: " << join(d->affected_files, ",");
        std::cout << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    const std::vector<std::string> commands = {"build", "tasks"};
    if (argc < 2) {
        std::cerr << "stagehand_cli <build|tasks> ...\n";
        return 2;
    }
    const std::string typed = argv[1];
    auto matches = stagehand::match_command(typed, commands);
    if (matches.size() > 1) {
        std::cerr << "Too many matches: " << stagehand::join(matches, ", ") << "\n";
        return 2;
    }
    if (matches.empty()) {
        std::cerr << "unknown command: " << typed << "\n";
        return 2;
    }
    if (matches[0] == "build") return cmd_build(argc, argv);
    if (matches[0] == "tasks") return cmd_tasks(argc, argv);
    return 2;
}
