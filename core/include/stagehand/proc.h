#pragma once

#include <functional>
#include <string>
#include <vector>

namespace stagehand {

struct ProcLimits {
    int timeout_ms{0};                      // 0 = no deadline
    size_t capture_max_bytes{1024 * 1024};  // cap on ProcResult::output
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// Called once per output line, without the trailing newline.
using LineFn = std::function<void(const std::string& line)>;

// Boundary to external programs (SDK manager, notarization tool).
// Tasks and the driver only see this interface, so tests can substitute it.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Returns true if the process started; res->exit_code holds its status.
    virtual bool run(const std::vector<std::string>& argv,
                     const std::string& cwd,
                     const LineFn& on_line,
                     ProcResult* res) = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
    PosixProcessRunner() = default;
    explicit PosixProcessRunner(const ProcLimits& lim) : lim_(lim) {}

    bool run(const std::vector<std::string>& argv,
             const std::string& cwd,
             const LineFn& on_line,
             ProcResult* res) override;

private:
    ProcLimits lim_;
};

// Run argv[0] (PATH lookup), merge stdout+stderr, deliver complete lines to
// on_line as they arrive. Returns true if the process started.
bool proc_run_streaming(const std::vector<std::string>& argv,
                        const std::string& cwd,
                        const ProcLimits& lim,
                        const LineFn& on_line,
                        ProcResult* res);

// Split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// Strips leading and trailing spaces, tabs, CR and LF.
std::string trim_ws(std::string s);

} // namespace stagehand
