#pragma once

#include <string>
#include <vector>

namespace stagehand {

// ---- Utility functions shared by the subcommands ----

// Random hex id stamped on every event-trail record of one run.
// STAGEHAND_DETERMINISTIC_RUN_ID=1 makes it fixed (tests, diffs).
std::string gen_run_id();

// Commands that `typed` selects: the exact match if there is one, otherwise
// every command it is a prefix of (sorted).
std::vector<std::string> match_command(const std::string& typed, const std::vector<std::string>& commands);

// Non-empty trimmed lines of a captured output.
std::vector<std::string> nonempty_lines(const std::string& text);

std::string join(const std::vector<std::string>& items, const std::string& sep);

} // namespace stagehand
