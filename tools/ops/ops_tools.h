#pragma once

// Operations tool handlers. Each one validates its arguments through the
// sandbox, then performs its effect through ctx.runner.

#include "opsgate/config.h"
#include "opsgate/json.h"
#include "opsgate/proc.h"
#include "opsgate/registry.h"
#include "opsgate/tools.h"

#include <string>

namespace opsgate {

// logs
ToolResult tool_read_log(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_search_logs(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_tail_logs(const ToolArgs& args, ToolContext& ctx);

// files
ToolResult tool_read_file(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_search_files(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_grep(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_list_directory(const ToolArgs& args, ToolContext& ctx);

// deployment
ToolResult tool_deploy_service(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_restart_service(const ToolArgs& args, ToolContext& ctx);

// git
ToolResult tool_git(const ToolArgs& args, ToolContext& ctx);

// database
ToolResult tool_query_database(const ToolArgs& args, ToolContext& ctx);

// system
ToolResult tool_docker_status(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_system_health(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_daily_stats(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_run_command(const ToolArgs& args, ToolContext& ctx);

// backend record actions
ToolResult tool_trigger_reanalysis(const ToolArgs& args, ToolContext& ctx);
ToolResult tool_hide_record(const ToolArgs& args, ToolContext& ctx);

// Shared by handlers.
ToolResult unknown_service(const GatewayConfig& cfg, const std::string& service);
void record_audit(ToolContext& ctx, const std::string& event, json_object* payload);
// {svc: {status, started_at}} for every allowed service docker knows about.
json::Doc docker_service_states(ToolContext& ctx);

// Build the full catalog. Throws std::runtime_error on a broken definition.
void register_ops_tools(ToolRegistry& reg);

} // namespace opsgate
