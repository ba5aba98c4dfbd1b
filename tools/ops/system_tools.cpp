#include "ops_tools.h"

#include "opsgate/sandbox.h"
#include "opsgate/text.h"

namespace opsgate {

namespace {

std::string field(const std::vector<std::string>& parts, size_t i) {
    return i < parts.size() ? parts[i] : std::string("unknown");
}

} // namespace

json::Doc docker_service_states(ToolContext& ctx) {
    json::Doc states = json::Doc::object();
    for (const auto& svc : ctx.config.sandbox.allowed_services) {
        ExecutionResult r = ctx.runner.run(Command::exec(
            {"docker", "inspect", svc, "--format", "{{.State.Status}} {{.State.StartedAt}}"}, 5));
        if (!r.success) continue;
        std::vector<std::string> parts = split_ws(r.out);
        json_object* s = json_object_new_object();
        json::set_string(s, "status", field(parts, 0));
        json::set_string(s, "started_at", field(parts, 1));
        json::set(states.get(), svc, s);
    }
    return states;
}

ToolResult tool_docker_status(const ToolArgs&, ToolContext& ctx) {
    ExecutionResult r = ctx.runner.run(Command::exec({"docker", "ps", "-a", "--format", "{{json .}}"}, 10));

    json_object* containers = json_object_new_array();
    for (const auto& line : split_lines(r.out, true)) {
        json::Doc c = json::parse(line);
        if (json::is_object(c.get())) json_object_array_add(containers, c.release());
    }

    json::Doc out = json::Doc::object();
    json::set(out.get(), "containers", containers);
    json::set(out.get(), "services", docker_service_states(ctx).release());
    return ToolResult::success(std::move(out));
}

ToolResult tool_system_health(const ToolArgs&, ToolContext& ctx) {
    json::Doc out = json::Doc::object();

    ExecutionResult cpu = ctx.runner.run(Command::exec({"cat", "/proc/loadavg"}, 5));
    std::vector<std::string> load = cpu.success ? split_ws(cpu.out) : std::vector<std::string>{};
    if (load.size() > 3) load.resize(3);
    if (load.empty()) load.push_back("unknown");
    json::set(out.get(), "cpu_load", json::string_array(load));

    std::vector<std::string> mem;
    ExecutionResult free_r = ctx.runner.run(Command::exec({"free", "-h"}, 5));
    if (free_r.success) {
        for (const auto& line : split_lines(free_r.out, true)) {
            if (starts_with(line, "Mem")) { mem = split_ws(line); break; }
        }
    }
    json_object* m = json_object_new_object();
    json::set_string(m, "total", field(mem, 1));
    json::set_string(m, "used", field(mem, 2));
    json::set_string(m, "free", field(mem, 3));
    json::set(out.get(), "memory", m);

    std::vector<std::string> disk;
    ExecutionResult df = ctx.runner.run(Command::exec({"df", "-h", "/"}, 5));
    if (df.success) {
        auto lines = split_lines(df.out, true);
        if (lines.size() > 1) disk = split_ws(lines.back());
    }
    json_object* d = json_object_new_object();
    json::set_string(d, "total", field(disk, 1));
    json::set_string(d, "used", field(disk, 2));
    json::set_string(d, "available", field(disk, 3));
    json::set_string(d, "use_percent", field(disk, 4));
    json::set(out.get(), "disk", d);

    json::set(out.get(), "docker_services", docker_service_states(ctx).release());
    json::set_string(out.get(), "timestamp", iso_now());
    return ToolResult::success(std::move(out));
}

ToolResult tool_daily_stats(const ToolArgs&, ToolContext& ctx) {
    ExecutionResult r = ctx.runner.run(
        Command::exec({"curl", "-sS", "--max-time", "8", "--max-redirs", "0", "--", ctx.config.stats_url}, 10));

    if (!r.success) {
        json::Doc out = json::Doc::object();
        json::set_string(out.get(), "error", r.err);
        return ToolResult::success(std::move(out));
    }
    json::Doc parsed = json::parse(trim_ws(r.out));
    if (json::is_object(parsed.get())) return ToolResult::success(std::move(parsed));

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "raw", r.out);
    return ToolResult::success(std::move(out));
}

} // namespace opsgate
