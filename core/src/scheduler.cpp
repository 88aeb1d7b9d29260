#include "stagehand/scheduler.h"
#include "stagehand/errors.h"

#include <json-c/json.h>

namespace stagehand {

const char* stage_name(Stage s) {
    switch (s) {
        case Stage::PRE_BUILD:  return "pre-build";
        case Stage::POST_BUILD: return "post-build";
    }
    return "unknown";
}

unsigned hook_flag(Stage s) {
    return s == Stage::PRE_BUILD ? HOOK_PRE_BUILD : HOOK_POST_BUILD;
}

static json_object* task_payload(const std::string& task, Stage stage) {
    json_object* p = json_object_new_object();
    json_object_object_add(p, "task", json_object_new_string(task.c_str()));
    json_object_object_add(p, "stage", json_object_new_string(stage_name(stage)));
    return p;
}

TaskScheduler::TaskScheduler(const ResolvedPlan& plan, Config& config, Logger& log, ProcessRunner& runner)
    : plan_(plan), config_(config), log_(log), runner_(runner) {}

Task& TaskScheduler::instance(const ResolvedTask& t, Stage stage) {
    auto it = instances_.find(t.name);
    if (it != instances_.end()) return *it->second;

    std::unique_ptr<Task> task;
    try {
        task = t.desc->create(TaskContext{t.name, config_, log_, runner_});
    } catch (const std::exception& e) {
        throw TaskError(t.name, std::string("construction before ") + stage_name(stage), e.what());
    }
    if (!task) {
        throw TaskError(t.name, std::string("construction before ") + stage_name(stage),
                        "factory returned no instance");
    }
    return *instances_.emplace(t.name, std::move(task)).first->second;
}

void TaskScheduler::runStage(Stage stage) {
    log_.info(std::string("Running stage '") + stage_name(stage) + "' for active tasks");
    log_.event("stage_begin", task_payload("", stage));

    for (const auto& t : plan_.tasks) {
        if (!(t.desc->hooks & hook_flag(stage))) continue;

        log_.info("Running " + std::string(stage_name(stage)) + " task '" + t.name + "'...");
        log_.event("task_begin", task_payload(t.name, stage));
        try {
            Task& task = instance(t, stage);
            if (stage == Stage::PRE_BUILD) {
                task.pre_build();
            } else {
                task.post_build();
            }
        } catch (const TaskError& e) {
            log_.error(e.what());
            log_.event("task_failed", task_payload(t.name, stage));
            throw;
        } catch (const std::exception& e) {
            TaskError err(t.name, stage_name(stage), e.what());
            log_.error(err.what());
            log_.event("task_failed", task_payload(t.name, stage));
            throw err;
        }
        log_.event("task_end", task_payload(t.name, stage));
    }

    log_.event("stage_end", task_payload("", stage));
}

} // namespace stagehand
