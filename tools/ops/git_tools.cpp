#include "ops_tools.h"

#include "opsgate/sandbox.h"
#include "opsgate/text.h"

#include <set>

namespace opsgate {

namespace {

const std::set<std::string> kSubcommands = {"status", "log", "diff", "pull", "branch", "fetch"};

// Flags that only change what is printed or fetched.
const std::set<std::string> kSafeFlags = {
    "-a", "--all", "-r", "--remotes", "-v", "-vv", "--verbose", "-q", "--quiet",
    "-s", "--short", "-b", "--branch", "--porcelain", "--prune", "--tags",
    "--ff-only", "--rebase", "--no-rebase",
};

std::string join_set(const std::set<std::string>& s) {
    return join_names(std::vector<std::string>(s.begin(), s.end()));
}

} // namespace

ToolResult tool_git(const ToolArgs& args, ToolContext& ctx) {
    const GatewayConfig& cfg = ctx.config;
    const std::string repo = args.str("repo");
    auto rp = repo_path(cfg.sandbox, repo);
    if (!rp) {
        std::vector<std::string> names;
        for (const auto& kv : cfg.sandbox.repo_paths) names.push_back(kv.first);
        return ToolResult::failure(ToolStatus::INVALID_ARGUMENT,
            "Unknown repo: " + repo + ". Allowed: " + join_names(names));
    }

    const std::string command = args.str("command");
    std::vector<std::string> parts = split_ws(command);
    if (parts.empty() || !kSubcommands.count(parts[0])) {
        return ToolResult::failure(ToolStatus::INVALID_ARGUMENT,
            "Command not allowed. Allowed: " + join_set(kSubcommands));
    }

    std::vector<std::string> argv = {"git"};
    if (parts[0] == "log") {
        argv.insert(argv.end(), {"log", "--oneline", "-20"});
    } else if (parts[0] == "diff") {
        argv.insert(argv.end(), {"diff", "HEAD~1"});
    } else {
        argv.push_back(parts[0]);
        for (size_t i = 1; i < parts.size(); i++) {
            if (!kSafeFlags.count(parts[i])) {
                return ToolResult::failure(ToolStatus::INVALID_ARGUMENT,
                    "Argument not allowed for git " + parts[0] + ": " + parts[i]);
            }
            argv.push_back(parts[i]);
        }
    }

    ExecutionResult r = ctx.runner.run(Command::exec(argv, 60, *rp));

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "repo", repo);
    json::set_string(out.get(), "command", command);
    json::set_bool(out.get(), "success", r.success);
    json::set_string(out.get(), "output", r.combined());
    return ToolResult::success(std::move(out));
}

} // namespace opsgate
