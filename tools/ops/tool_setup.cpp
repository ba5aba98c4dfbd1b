#include "ops_tools.h"

namespace opsgate {

namespace {

ParamSpec str_param(const std::string& name, bool required, const std::string& desc,
                    const std::string& default_json = "") {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::STRING;
    p.required = required;
    p.description = desc;
    p.default_json = default_json;
    return p;
}

ParamSpec int_param(const std::string& name, const std::string& desc, const std::string& default_json,
                    std::optional<int64_t> min, std::optional<int64_t> max) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::INTEGER;
    p.description = desc;
    p.default_json = default_json;
    p.min = min;
    p.max = max;
    return p;
}

ParamSpec bool_param(const std::string& name, const std::string& desc, const std::string& default_json) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::BOOLEAN;
    p.description = desc;
    p.default_json = default_json;
    return p;
}

ToolDefinition tool(const std::string& name, const std::string& desc, std::vector<ParamSpec> params,
                    ToolFn fn, bool destructive = false) {
    ToolDefinition d;
    d.name = name;
    d.description = desc;
    d.params = std::move(params);
    d.handler = std::move(fn);
    d.destructive = destructive;
    return d;
}

void register_log_tools(ToolRegistry& reg) {
    reg.add(tool("read_log", "Read recent log lines from a docker service",
        {str_param("service", true, "Service name"),
         int_param("lines", "Number of lines from the end", "100", 1, 10000),
         str_param("since", false, "Only logs newer than this (e.g. 10m, 1h, RFC3339 time)")},
        tool_read_log));

    reg.add(tool("search_logs", "Search service logs with an extended regular expression",
        {str_param("pattern", true, "Extended regular expression"),
         str_param("service", false, "Limit the search to one service"),
         str_param("since", false, "Time window", "\"1h\""),
         int_param("lines", "Maximum matching lines kept per service", "500", 1, 10000)},
        tool_search_logs));

    reg.add(tool("tail_logs", "Last lines of a service log",
        {str_param("service", true, "Service name"),
         int_param("lines", "Number of lines", "50", 1, 10000)},
        tool_tail_logs));
}

void register_file_tools(ToolRegistry& reg) {
    reg.add(tool("read_file", "Read a file under the allowed directories",
        {str_param("path", true, "Absolute file path"),
         int_param("lines", "Maximum number of lines to return", "", 1, std::nullopt),
         int_param("offset", "Lines to skip from the start", "", 0, std::nullopt)},
        tool_read_file));

    reg.add(tool("search_files", "Find files by name pattern",
        {str_param("pattern", true, "Shell glob matched against file names"),
         str_param("path", false, "Directory to search", "\"/opt/saga-graph\""),
         int_param("max_results", "Maximum number of files", "100", 1, 1000)},
        tool_search_files));

    reg.add(tool("grep", "Search file contents with an extended regular expression",
        {str_param("pattern", true, "Extended regular expression"),
         str_param("path", false, "Directory to search", "\"/opt/saga-graph\""),
         str_param("file_pattern", false, "Only files matching this glob"),
         int_param("max_results", "Maximum number of matches", "50", 1, 1000)},
        tool_grep));

    reg.add(tool("list_directory", "List a directory",
        {str_param("path", true, "Absolute directory path"),
         bool_param("recursive", "Walk subdirectories", "false"),
         int_param("max_depth", "Depth limit when recursive", "2", 1, 10)},
        tool_list_directory));
}

void register_deploy_tools(ToolRegistry& reg) {
    reg.add(tool("deploy_service", "Pull, build and start a service",
        {str_param("service", true, "Service name"),
         bool_param("pull", "Run git pull in the service repository first", "true"),
         bool_param("no_cache", "Build without the docker layer cache", "true")},
        tool_deploy_service, true));

    reg.add(tool("restart_service", "Restart a docker compose service",
        {str_param("service", true, "Service name")},
        tool_restart_service, true));
}

void register_system_tools(ToolRegistry& reg) {
    reg.add(tool("git", "Run a read-mostly git command in an allowed repository",
        {str_param("repo", true, "Repository name"),
         str_param("command", true, "One of status, log, diff, pull, branch, fetch")},
        tool_git));

    ParamSpec params;
    params.name = "params";
    params.type = ParamType::OBJECT;
    params.description = "Query parameters";
    params.default_json = "{}";
    reg.add(tool("query_database", "Run a read-only graph query",
        {str_param("query", true, "Cypher query"), params},
        tool_query_database));
    reg.add_alias("query_neo4j", "query_database");

    reg.add(tool("docker_status", "Container list and service states", {}, tool_docker_status));
    reg.add(tool("system_health", "Load, memory, disk and service states", {}, tool_system_health));
    reg.add(tool("daily_stats", "Daily statistics from the backend API", {}, tool_daily_stats));

    reg.add(tool("run_command", "Run an allowlisted diagnostic command",
        {str_param("command", true, "Command line starting with an allowed prefix")},
        tool_run_command));
}

void register_backend_tools(ToolRegistry& reg) {
    reg.add(tool("trigger_reanalysis", "Ask the backend to reanalyze a record",
        {str_param("record_id", true, "Record identifier")},
        tool_trigger_reanalysis, true));

    reg.add(tool("hide_record", "Hide a record in the backend",
        {str_param("record_id", true, "Record identifier"),
         str_param("reason", false, "Why the record is hidden", "\"\"")},
        tool_hide_record, true));
}

} // namespace

void register_ops_tools(ToolRegistry& reg) {
    register_log_tools(reg);
    register_file_tools(reg);
    register_deploy_tools(reg);
    register_system_tools(reg);
    register_backend_tools(reg);
}

} // namespace opsgate
