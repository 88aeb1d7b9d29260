#include "test_common.h"

#include "runner_utils.h"

#include <cstdlib>

using namespace stagehand;

int main() {
    const std::vector<std::string> cmds = {"build", "bundle", "tasks"};

    auto m = match_command("b", cmds);
    expect_eq_ll((long long)m.size(), 2, "ambiguous prefix");
    expect_eq_str(join(m, ", "), "build, bundle", "sorted matches");

    m = match_command("bu", cmds);
    expect_eq_ll((long long)m.size(), 2, "still ambiguous");
    m = match_command("bui", cmds);
    expect_true(m.size() == 1 && m[0] == "build", "unique prefix");
    m = match_command("tasks", cmds);
    expect_true(m.size() == 1 && m[0] == "tasks", "exact match");
    expect_true(match_command("deploy", cmds).empty(), "no match");
    expect_true(match_command("", cmds).empty(), "empty input");

    // exact match wins over longer names sharing the prefix
    m = match_command("run", {"run", "runall"});
    expect_true(m.size() == 1 && m[0] == "run", "exact beats prefix");

    auto lines = nonempty_lines("8.2.0\n\n  8.1.3  \n");
    expect_eq_ll((long long)lines.size(), 2, "blank lines dropped");
    expect_eq_str(lines[1], "8.1.3", "lines trimmed");

    setenv("STAGEHAND_DETERMINISTIC_RUN_ID", "1", 1);
    expect_eq_str(gen_run_id(), gen_run_id(), "deterministic run id");
    unsetenv("STAGEHAND_DETERMINISTIC_RUN_ID");
    expect_true(!gen_run_id().empty(), "random run id");

    std::cerr << "test_runner_utils: ALL PASSED" << std::endl;
    return 0;
}
