#pragma once
#include <stdexcept>
#include <string>

namespace stagehand {

// Bad or missing task configuration, detected before any task runs.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A task failed to construct or one of its stage hooks threw.
struct TaskError : std::runtime_error {
    TaskError(const std::string& task, const std::string& stage, const std::string& what)
        : std::runtime_error("task '" + task + "' failed in " + stage + ": " + what),
          task_name(task), stage_name(stage) {}

    std::string task_name;
    std::string stage_name;
};

// Structural problem with a zip container or a missing expected entry.
struct ArchiveError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Executable header did not carry the expected signatures.
struct BinaryFormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// One or more patch files failed to parse or apply; the batch was rolled back.
struct PatchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace stagehand
