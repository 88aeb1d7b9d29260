#pragma once

#include "stagehand/log.h"
#include "stagehand/registry.h"

#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

// Descriptors of the built-in task types.
TaskDesc patch_task_desc();
TaskDesc overwrite_keystore_task_desc();
TaskDesc set_extended_memory_limit_task_desc();
TaskDesc notarize_task_desc();
TaskDesc clean_task_desc();

// Registers every built-in task type, in a fixed order.
void register_builtin_tasks(TaskRegistry& reg);

// --- helpers shared by the tasks (task_util.cpp)

// Regular files directly in dir whose name ends with suffix, sorted.
std::vector<std::filesystem::path> files_with_suffix(const std::filesystem::path& dir,
                                                     const std::string& suffix);

// The build artifact matching *suffix in dir. None is an error; with several
// the first (sorted) one is used and a warning is logged.
std::filesystem::path single_artifact(const std::filesystem::path& dir,
                                      const std::string& suffix,
                                      Logger& log);

// Standard alphabet with '=' padding; ASCII whitespace is ignored.
// Returns false on any other character or bad padding.
bool b64_decode(const std::string& in, std::string* out);

// Longest common leading string, compared byte by byte.
std::string common_prefix(const std::vector<std::string>& items);

// Splits a configured command line (e.g. "renutil" or "python3 -m renutil").
// Throws std::runtime_error if it is empty or badly quoted.
std::vector<std::string> command_argv(const std::string& command);

} // namespace stagehand
