#include "stagehand/registry.h"
#include "stagehand/errors.h"
#include "stagehand/json_mini.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace stagehand {

static const char* const kTaskSuffix = "Task";

static bool is_reserved_key(const std::string& name) {
    static const char* const reserved[] = {"tasks", "build", "toolchain", "project", "output", "debug"};
    for (const char* r : reserved) {
        if (name == r) return true;
    }
    return false;
}

std::string TaskRegistry::deriveTaskName(const std::string& type_name) {
    const std::string suffix = kTaskSuffix;
    if (type_name.size() <= suffix.size() ||
        type_name.compare(type_name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return "";
    }
    const std::string stem = type_name.substr(0, type_name.size() - suffix.size());

    // split before every upper-case letter, drop empty pieces
    std::string out;
    std::string part;
    auto flush = [&]() {
        if (part.empty()) return;
        if (!out.empty()) out += '_';
        out += part;
        part.clear();
    };
    for (char c : stem) {
        if (std::isupper(static_cast<unsigned char>(c))) flush();
        part.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    flush();
    return out;
}

bool TaskRegistry::registerTask(const TaskDesc& d) {
    const std::string name = deriveTaskName(d.type_name);
    if (name.empty()) return false;
    if (is_reserved_key(name)) {
        throw std::runtime_error("task type " + d.type_name + " maps to reserved config key '" + name + "'");
    }
    if (getTask(name)) {
        throw std::runtime_error("duplicate task name in registry: " + name + " (" + d.type_name + ")");
    }
    if (!d.create) {
        throw std::runtime_error("task type " + d.type_name + " has no factory");
    }
    entries_.push_back(Entry{name, d});
    return true;
}

const TaskDesc* TaskRegistry::getTask(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return &e.desc;
    }
    return nullptr;
}

std::vector<std::string> TaskRegistry::taskNames() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.name);
    return out;
}

ResolvedPlan TaskRegistry::resolve(Config& config, Logger& log) const {
    json_object* root = config.root();
    json_object* tasks = config.section("tasks");
    if (tasks && !json_mini::is_object(tasks)) {
        throw ConfigError("'tasks' must be a mapping of task name to boolean");
    }

    // --- enablement
    std::vector<const Entry*> enabled;
    for (const auto& e : entries_) {
        if (!json_mini::has_key(tasks, e.name)) {
            log.warn("Task '" + e.name + "' is not configured and is treated as disabled");
            log.info("- " + e.name);
            continue;
        }
        auto on = json_mini::get_bool(tasks, e.name);
        if (!on) {
            throw ConfigError("The value for 'tasks." + e.name + "' must be a boolean, got " +
                              json_mini::to_string(json_mini::member(tasks, e.name)));
        }
        log.info((*on ? "+ " : "- ") + e.name);
        if (*on) enabled.push_back(&e);
    }

    for (const auto& k : json_mini::keys(tasks)) {
        if (k == "path" || getTask(k)) continue;
        log.warn("Unknown task '" + k + "' in config, ignoring it");
    }

    // --- per-task config validation
    for (const Entry* e : enabled) {
        json_object* sub = json_mini::ensure_object(root, e->name);
        if (!sub) throw ConfigError("Config for task '" + e->name + "' must be a mapping");
        if (!e->desc.validate) continue;
        try {
            e->desc.validate(sub);
        } catch (const std::exception& ex) {
            throw ConfigError("Invalid config for task '" + e->name + "': " + ex.what());
        }
    }

    // --- affected file conflicts
    ResolvedPlan plan;
    std::map<std::string, std::string> owner;
    for (const Entry* e : enabled) {
        for (const auto& f : e->desc.affected_files) {
            auto it = owner.find(f);
            if (it != owner.end()) {
                if (it->second == e->name) continue;
                throw ConfigError("Tasks '" + it->second + "' and '" + e->name +
                                  "' both declare '" + f + "' as an affected file");
            }
            owner.emplace(f, e->name);
            plan.affected_files.push_back(f);
        }
    }

    for (const Entry* e : enabled) {
        plan.tasks.push_back(ResolvedTask{e->name, &e->desc, e->desc.priority});
    }
    std::stable_sort(plan.tasks.begin(), plan.tasks.end(),
                     [](const ResolvedTask& a, const ResolvedTask& b) { return a.priority > b.priority; });

    json_object* order = json_object_new_array();
    for (const auto& t : plan.tasks) {
        json_object_array_add(order, json_object_new_string(t.name.c_str()));
    }
    json_object* payload = json_object_new_object();
    json_object_object_add(payload, "order", order);
    log.event("tasks_resolved", payload);
    return plan;
}

} // namespace stagehand
