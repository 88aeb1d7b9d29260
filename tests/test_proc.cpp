#include "test_common.h"

#include "stagehand/proc.h"

#include <vector>

using namespace stagehand;

int main() {
    // output is captured and streamed line by line
    {
        PosixProcessRunner runner;
        std::vector<std::string> lines;
        ProcResult res;
        bool started = runner.run({"/bin/sh", "-c", "echo hi; echo there 1>&2; exit 3"}, "",
                                  [&](const std::string& l) { lines.push_back(l); }, &res);
        expect_true(started, "sh started: " + res.error);
        expect_eq_ll(res.exit_code, 3, "exit status");
        expect_true(contains(res.output, "hi\n") && contains(res.output, "there\n"), "stdout and stderr merged");
        expect_eq_ll((long long)lines.size(), 2, "two streamed lines");
    }

    // working directory
    {
        TempDir dir("proc");
        PosixProcessRunner runner;
        ProcResult res;
        expect_true(runner.run({"/bin/sh", "-c", "pwd"}, dir.path.string(), LineFn(), &res), "pwd started");
        expect_true(contains(res.output, dir.path.filename().string()), "ran in cwd: " + res.output);
    }

    // a missing binary never starts
    {
        PosixProcessRunner runner;
        ProcResult res;
        expect_true(!runner.run({"/nonexistent/stagehand-tool", "--help"}, "", LineFn(), &res),
                    "missing binary must not start");
        expect_true(!res.error.empty(), "error explains why");
        expect_true(!runner.run({}, "", LineFn(), &res), "empty argv");
    }

    // deadline
    {
        ProcLimits lim;
        lim.timeout_ms = 200;
        PosixProcessRunner runner(lim);
        ProcResult res;
        expect_true(runner.run({"/bin/sh", "-c", "sleep 5"}, "", LineFn(), &res), "sleep started");
        expect_true(res.timed_out, "timed out");
    }

    // command splitting
    {
        auto v = split_argv_quoted("python3 -m renutil --flag \"two words\" 'single q'");
        expect_eq_ll((long long)v.size(), 6, "token count");
        expect_eq_str(v[4], "two words", "double quotes");
        expect_eq_str(v[5], "single q", "single quotes");
        expect_true(split_argv_quoted("bad \"quote").empty(), "unterminated quote");
        expect_eq_str(trim_ws("  Install Location: /x \r\n"), "Install Location: /x", "trim both ends");
        expect_eq_str(trim_ws("\t\r\n "), "", "only whitespace");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
