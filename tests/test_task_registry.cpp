#include "test_common.h"

#include "stagehand/errors.h"
#include "stagehand/json_mini.h"
#include "stagehand/registry.h"

#include <sstream>

using namespace stagehand;

struct NoopTask : Task {};

static TaskDesc mk_desc(const std::string& type, int priority,
                        std::vector<std::string> files = {}) {
    TaskDesc d;
    d.type_name = type;
    d.priority = priority;
    d.affected_files = std::move(files);
    d.hooks = HOOK_PRE_BUILD;
    d.create = [](const TaskContext&) { return std::unique_ptr<Task>(new NoopTask()); };
    return d;
}

static std::vector<std::string> order_of(const ResolvedPlan& plan) {
    std::vector<std::string> out;
    for (const auto& t : plan.tasks) out.push_back(t.name);
    return out;
}

int main() {
    // name derivation
    expect_eq_str(TaskRegistry::deriveTaskName("FooBarTask"), "foo_bar", "FooBarTask");
    expect_eq_str(TaskRegistry::deriveTaskName("SetExtendedMemoryLimitTask"), "set_extended_memory_limit",
                  "multi-word name");
    expect_eq_str(TaskRegistry::deriveTaskName("PatchTask"), "patch", "single word");
    expect_eq_str(TaskRegistry::deriveTaskName("Helper"), "", "no Task suffix");
    expect_eq_str(TaskRegistry::deriveTaskName("Task"), "", "bare suffix");

    // registration
    {
        TaskRegistry reg;
        expect_true(reg.registerTask(mk_desc("FooTask", 0)), "FooTask registers");
        expect_true(!reg.registerTask(mk_desc("FooHelper", 0)), "non-task type is ignored");
        expect_eq_ll((long long)reg.size(), 1, "one registered");
        expect_throws<std::runtime_error>([&] { reg.registerTask(mk_desc("FooTask", 3)); },
                                          "duplicate name must throw");
        expect_throws<std::runtime_error>([&] { reg.registerTask(mk_desc("BuildTask", 0)); },
                                          "reserved key must throw");
        TaskDesc no_factory = mk_desc("BarTask", 0);
        no_factory.create = nullptr;
        expect_throws<std::runtime_error>([&] { reg.registerTask(no_factory); }, "missing factory must throw");
        expect_true(reg.getTask("foo") != nullptr, "getTask foo");
        expect_true(reg.getTask("bar") == nullptr, "bar not registered");
    }

    // ordering: descending priority, ties keep registration order
    {
        TaskRegistry reg;
        reg.registerTask(mk_desc("CleanTask", -1000));
        reg.registerTask(mk_desc("AlphaTask", 0));
        reg.registerTask(mk_desc("PatchTask", 1000));
        reg.registerTask(mk_desc("BetaTask", 0));
        reg.registerTask(mk_desc("GammaTask", 0));

        Config cfg = Config::from_json(
            R"({"tasks":{"clean":true,"alpha":true,"patch":true,"beta":true,"gamma":false}})");
        std::ostringstream out;
        Logger log(out);
        ResolvedPlan plan = reg.resolve(cfg, log);
        auto order = order_of(plan);
        expect_eq_ll((long long)order.size(), 4, "gamma disabled");
        expect_eq_str(order[0], "patch", "patch first");
        expect_eq_str(order[1], "alpha", "alpha before beta (registration order)");
        expect_eq_str(order[2], "beta", "beta third");
        expect_eq_str(order[3], "clean", "clean last");
        expect_true(contains(out.str(), "+ patch"), "enabled task listed");
        expect_true(contains(out.str(), "- gamma"), "disabled task listed");
    }

    // unconfigured tasks are disabled with a warning, unknown keys are ignored
    {
        TaskRegistry reg;
        reg.registerTask(mk_desc("FooTask", 0));
        reg.registerTask(mk_desc("BarTask", 0));
        Config cfg = Config::from_json(R"({"tasks":{"foo":true,"mystery":true}})");
        std::ostringstream out;
        Logger log(out);
        ResolvedPlan plan = reg.resolve(cfg, log);
        expect_eq_ll((long long)plan.tasks.size(), 1, "only foo enabled");
        expect_true(contains(out.str(), "'bar' is not configured"), "warning for bar");
        expect_true(contains(out.str(), "Unknown task 'mystery'"), "warning for unknown key");
    }

    // non-boolean enablement value
    {
        TaskRegistry reg;
        reg.registerTask(mk_desc("FooTask", 0));
        Config cfg = Config::from_json(R"({"tasks":{"foo":"yes"}})");
        std::ostringstream out;
        Logger log(out);
        std::string msg = expect_throws<ConfigError>([&] { reg.resolve(cfg, log); }, "string value must throw");
        expect_true(contains(msg, "tasks.foo"), "message names the key: " + msg);
    }

    // two enabled tasks declaring the same affected file
    {
        TaskRegistry reg;
        reg.registerTask(mk_desc("KeyTask", 0, {"rapt/android.keystore"}));
        reg.registerTask(mk_desc("OtherKeyTask", 0, {"rapt/android.keystore", "x.txt"}));
        std::ostringstream out;
        Logger log(out);

        Config both = Config::from_json(R"({"tasks":{"key":true,"other_key":true}})");
        std::string msg = expect_throws<ConfigError>([&] { reg.resolve(both, log); }, "conflict must throw");
        expect_true(contains(msg, "'key'") && contains(msg, "'other_key'"), "names both tasks: " + msg);
        expect_true(contains(msg, "rapt/android.keystore"), "names the file: " + msg);

        Config one = Config::from_json(R"({"tasks":{"key":false,"other_key":true}})");
        ResolvedPlan plan = reg.resolve(one, log);
        expect_eq_ll((long long)plan.affected_files.size(), 2, "affected files of enabled task");
    }

    // validation runs on the task's own subtree and may rewrite it
    {
        TaskRegistry reg;
        TaskDesc d = mk_desc("FooTask", 0);
        d.validate = [](json_object* sub) {
            if (!json_mini::has_key(sub, "mode")) json_mini::set_string(sub, "mode", "fast");
            if (json_mini::get_string(sub, "mode").value_or("") == "broken") {
                throw std::runtime_error("mode 'broken' is not supported");
            }
        };
        reg.registerTask(d);
        std::ostringstream out;
        Logger log(out);

        Config cfg = Config::from_json(R"({"tasks":{"foo":true}})");
        reg.resolve(cfg, log);
        expect_eq_str(json_mini::get_string(cfg.section("foo"), "mode").value_or(""), "fast",
                      "validation filled the default");

        Config bad = Config::from_json(R"({"tasks":{"foo":true},"foo":{"mode":"broken"}})");
        std::string msg = expect_throws<ConfigError>([&] { reg.resolve(bad, log); }, "validation error");
        expect_true(contains(msg, "Invalid config for task 'foo'"), msg);
        expect_true(contains(msg, "not supported"), msg);

        // disabled tasks are not validated
        Config off = Config::from_json(R"({"tasks":{"foo":false},"foo":{"mode":"broken"}})");
        expect_eq_ll((long long)reg.resolve(off, log).tasks.size(), 0, "nothing enabled");
    }

    std::cerr << "test_task_registry: ALL PASSED" << std::endl;
    return 0;
}
