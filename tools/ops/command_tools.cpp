#include "ops_tools.h"

#include "opsgate/sandbox.h"

namespace opsgate {

// Prefix-gated diagnostics. The command is split into argv and exec'd
// directly, so whatever follows the prefix can only add arguments.
ToolResult tool_run_command(const ToolArgs& args, ToolContext& ctx) {
    const std::string command = args.str("command");
    if (!command_allowed(ctx.config.sandbox, command)) {
        return ToolResult::failure(ToolStatus::INVALID_ARGUMENT,
            "Command not allowed. Must start with one of: " + join_names(ctx.config.sandbox.command_prefixes));
    }
    std::vector<std::string> argv = split_argv_quoted(command);
    if (argv.empty()) {
        return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "Command could not be parsed: unbalanced quotes");
    }

    ExecutionResult r = ctx.runner.run(Command::exec(argv, 30));

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "command", command);
    json::set_bool(out.get(), "success", r.success);
    json::set_string(out.get(), "stdout", r.out);
    json::set_string(out.get(), "stderr", r.err);
    return ToolResult::success(std::move(out));
}

} // namespace opsgate
