#pragma once

#include <string>
#include <vector>

namespace opsgate {

struct ProcLimits {
    int timeout_ms{60000};
    size_t stdout_max_bytes{4 * 1024 * 1024};
    size_t stderr_max_bytes{1024 * 1024};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string out;
    std::string err;
    std::string error;  // internal runner error, not child stderr
};

// Run argv (argv[0] resolved via PATH), feed stdin_data, capture stdout and
// stderr on separate pipes, enforce the timeout by killing the process group.
// Returns true if the child was started; false fills res->error.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res);

// Split a command string into argv tokens.
// Supports single/double quotes and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// One external command. Either argv (exec'd directly) or shell (passed to /bin/sh -c).
struct Command {
    std::vector<std::string> argv;
    std::string shell;
    std::string cwd;
    std::string stdin_data;
    int timeout_sec{60};

    static Command exec(std::vector<std::string> argv, int timeout_sec = 60, std::string cwd = {});
    static Command sh(std::string script, int timeout_sec = 60, std::string cwd = {});

    // Human-readable rendering for logs and audit records.
    std::string display() const;
};

// Normalized outcome of a Command. success == (exit status 0 and no timeout).
struct ExecutionResult {
    std::string out;
    std::string err;
    int returncode{-1};
    bool success{false};
    bool timed_out{false};
    bool truncated{false};

    // stdout followed by stderr, the way tools report combined output.
    std::string combined() const { return out + err; }
};

// Every side effect of the gateway goes through this interface.
// Implementations never throw for a failing command.
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;
    virtual ExecutionResult run(const Command& cmd) = 0;
};

class SystemProcessRunner final : public IProcessRunner {
public:
    explicit SystemProcessRunner(ProcLimits base = {}) : base_(base) {}
    ExecutionResult run(const Command& cmd) override;

private:
    ProcLimits base_;
};

} // namespace opsgate
