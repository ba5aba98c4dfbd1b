#include "ops_tools.h"

#include "opsgate/sandbox.h"
#include "opsgate/text.h"

#include <iostream>

namespace opsgate {

// The query and its parameters reach the runner as one JSON document on
// stdin; neither is ever spliced into a command line or script.
ToolResult tool_query_database(const ToolArgs& args, ToolContext& ctx) {
    const std::string query = args.str("query");
    if (trim_ws(query).empty()) return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "query must not be empty");

    std::string kw = find_mutation_keyword(query);
    if (!kw.empty()) {
        std::cerr << "[dispatch] query_database rejected: contains " << kw << "\n";
        return ToolResult::failure(ToolStatus::INVALID_ARGUMENT,
            "Write queries not allowed via MCP. Use read-only queries.");
    }
    if (ctx.config.query_command.empty()) {
        return ToolResult::failure(ToolStatus::INTERNAL_ERROR, "no query command configured");
    }

    json::Doc req = json::Doc::object();
    json::set_string(req.get(), "query", query);
    json_object* params = args.raw("params");
    json::set(req.get(), "params", params ? json_object_get(params) : json_object_new_object());

    Command cmd = Command::exec(ctx.config.query_command, 30);
    cmd.stdin_data = json::dump(req.get());
    ExecutionResult r = ctx.runner.run(cmd);

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "query", query);
    if (!r.success) {
        json::set_string(out.get(), "error", r.err.empty() ? "query failed with exit code " + std::to_string(r.returncode) : r.err);
        json::set_bool(out.get(), "success", false);
        return ToolResult::success(std::move(out));
    }

    json::Doc parsed = json::parse(trim_ws(r.out));
    if (!parsed) {
        json::set_string(out.get(), "raw_output", r.out);
        json::set(out.get(), "rows", json_object_new_array());
    } else if (json_object_is_type(parsed.get(), json_type_array)) {
        json::set(out.get(), "rows", parsed.release());
    } else {
        json_object* rows = json_object_new_array();
        json_object_array_add(rows, parsed.release());
        json::set(out.get(), "rows", rows);
    }
    json::set_bool(out.get(), "success", true);
    return ToolResult::success(std::move(out));
}

} // namespace opsgate
