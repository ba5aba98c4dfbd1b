#include "ops_tools.h"

#include "opsgate/audit.h"
#include "opsgate/sandbox.h"
#include "opsgate/text.h"

#include <deque>

namespace opsgate {

ToolResult unknown_service(const GatewayConfig& cfg, const std::string& service) {
    return ToolResult::failure(ToolStatus::INVALID_ARGUMENT,
        "Unknown service: " + service + ". Allowed: " + join_names(cfg.sandbox.allowed_services));
}

void record_audit(ToolContext& ctx, const std::string& event, json_object* payload) {
    if (ctx.audit) ctx.audit->event(event, payload);
}

ToolResult tool_read_log(const ToolArgs& args, ToolContext& ctx) {
    const std::string service = args.str("service");
    if (!service_allowed(ctx.config.sandbox, service)) return unknown_service(ctx.config, service);
    const int64_t lines = args.integer("lines", 100);
    const std::string since = args.str("since");

    std::vector<std::string> argv = {"docker", "logs", "--tail", std::to_string(lines)};
    if (!since.empty()) {
        argv.push_back("--since");
        argv.push_back(since);
    }
    argv.push_back(service);
    ExecutionResult r = ctx.runner.run(Command::exec(argv, 30));

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "service", service);
    json::set_int(out.get(), "lines_requested", lines);
    json::set_string(out.get(), "logs", r.out);
    json::set_string(out.get(), "stderr", r.err);
    json::set_bool(out.get(), "success", r.success);
    return ToolResult::success(std::move(out));
}

// Matching runs in a grep child fed through stdin, so a pathological pattern
// is bounded by the runner timeout and cannot take the server down.
ToolResult tool_search_logs(const ToolArgs& args, ToolContext& ctx) {
    const std::string pattern = args.str("pattern");
    const std::string since = args.str("since", "1h");
    const int64_t max_lines = args.integer("lines", 500);
    const std::string only = args.str("service");

    if (pattern.empty()) return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "pattern must not be empty");

    std::vector<std::string> services;
    if (!only.empty()) {
        if (!service_allowed(ctx.config.sandbox, only)) return unknown_service(ctx.config, only);
        services.push_back(only);
    } else {
        services = ctx.config.sandbox.allowed_services;
    }

    json::Doc matches = json::Doc::object();
    json::Doc errors = json::Doc::object();
    int64_t total = 0;
    for (const auto& svc : services) {
        ExecutionResult logs = ctx.runner.run(Command::exec({"docker", "logs", "--since", since, svc}, 30));

        // docker writes container stderr to its own stderr; search both
        std::string text = logs.out;
        if (!text.empty() && text.back() != '\n') text.push_back('\n');
        text += logs.err;
        if (trim_ws(text).empty()) continue;

        Command grep = Command::exec({"grep", "-E", "-e", pattern}, 30);
        grep.stdin_data = std::move(text);
        ExecutionResult r = ctx.runner.run(grep);
        if (r.timed_out) {
            json::set_string(errors.get(), svc, r.err);
            continue;
        }
        // grep: 0 = matches, 1 = none, anything else = bad pattern or failure
        if (!r.success && r.returncode != 1) {
            return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "Invalid pattern: " + trim_ws(r.err));
        }

        std::deque<std::string> hits;
        for (auto& line : split_lines(r.out, true)) {
            hits.push_back(std::move(line));
            if ((int64_t)hits.size() > max_lines) hits.pop_front();
        }
        if (hits.empty()) continue;
        total += (int64_t)hits.size();
        json::set(matches.get(), svc, json::string_array(std::vector<std::string>(hits.begin(), hits.end())));
    }

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "pattern", pattern);
    json::set_string(out.get(), "since", since);
    json::set(out.get(), "matches", matches.release());
    json::set_int(out.get(), "total_matches", total);
    if (json_object_object_length(errors.get()) > 0) json::set(out.get(), "errors", errors.release());
    return ToolResult::success(std::move(out));
}

ToolResult tool_tail_logs(const ToolArgs& args, ToolContext& ctx) {
    const std::string service = args.str("service");
    if (!service_allowed(ctx.config.sandbox, service)) return unknown_service(ctx.config, service);
    const int64_t lines = args.integer("lines", 50);

    ExecutionResult r = ctx.runner.run(
        Command::exec({"docker", "logs", "--tail", std::to_string(lines), service}, 10));

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "service", service);
    json::set_int(out.get(), "lines", lines);
    json::set_string(out.get(), "logs", r.out);
    json::set_string(out.get(), "timestamp", iso_now());
    return ToolResult::success(std::move(out));
}

} // namespace opsgate
