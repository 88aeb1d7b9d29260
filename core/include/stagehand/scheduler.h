#pragma once
#include "registry.h"
#include "task.h"

#include <map>
#include <memory>
#include <string>

namespace stagehand {

// Runs the resolved tasks stage by stage, strictly in plan order. Owns the
// task instances for one run; each is created right before its first hook.
class TaskScheduler {
public:
    TaskScheduler(const ResolvedPlan& plan, Config& config, Logger& log, ProcessRunner& runner);

    // Calls the stage hook of every task that declares it. The first failure
    // (construction or hook) is logged and rethrown as TaskError; later tasks
    // do not run.
    void runStage(Stage stage);

    bool isInstantiated(const std::string& name) const { return instances_.count(name) > 0; }

private:
    Task& instance(const ResolvedTask& t, Stage stage);

    const ResolvedPlan& plan_;
    Config& config_;
    Logger& log_;
    ProcessRunner& runner_;
    std::map<std::string, std::unique_ptr<Task>> instances_;
};

} // namespace stagehand
