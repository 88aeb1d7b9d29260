#pragma once
#include "config.h"
#include "log.h"
#include "task.h"

#include <string>
#include <vector>

namespace stagehand {

struct ResolvedTask {
    std::string name;
    const TaskDesc* desc{nullptr};
    int priority{0};
};

// Enabled tasks in run order plus every file they declare as affected.
struct ResolvedPlan {
    std::vector<ResolvedTask> tasks;
    std::vector<std::string> affected_files;
};

// Registry holds task types in registration (discovery) order
class TaskRegistry {
public:
    // "FooBarTask" -> "foo_bar". Empty if the type name does not end in "Task".
    static std::string deriveTaskName(const std::string& type_name);

    // Returns false (and ignores d) if d.type_name is not a task type name.
    // A second type with the same derived name throws.
    bool registerTask(const TaskDesc& d);

    const TaskDesc* getTask(const std::string& name) const;
    std::vector<std::string> taskNames() const;
    size_t size() const { return entries_.size(); }

    // Enablement, per-task validation, affected-file conflict check, and
    // ordering by descending priority (stable). Validation may rewrite the
    // task subtrees inside config. Throws ConfigError; nothing is
    // instantiated here.
    ResolvedPlan resolve(Config& config, Logger& log) const;

private:
    struct Entry {
        std::string name;
        TaskDesc desc;
    };
    std::vector<Entry> entries_;
};

} // namespace stagehand
