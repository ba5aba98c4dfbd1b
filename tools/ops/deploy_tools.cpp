#include "ops_tools.h"

#include "opsgate/sandbox.h"
#include "opsgate/text.h"

#include <iostream>

namespace opsgate {

namespace {

constexpr size_t kBuildOutputTail = 2000;

struct Step {
    std::string name;
    std::string repo;
    bool success{false};
    std::string output;
};

json_object* step_json(const Step& s) {
    json_object* o = json_object_new_object();
    json::set_string(o, "step", s.name);
    if (!s.repo.empty()) json::set_string(o, "repo", s.repo);
    json::set_bool(o, "success", s.success);
    json::set_string(o, "output", s.output);
    return o;
}

} // namespace

// git pull (services built from a repo) -> docker compose build -> up -d.
// Each step runs only if every earlier step succeeded.
ToolResult tool_deploy_service(const ToolArgs& args, ToolContext& ctx) {
    const GatewayConfig& cfg = ctx.config;
    const std::string service = args.str("service");
    if (!service_allowed(cfg.sandbox, service)) return unknown_service(cfg, service);
    const bool pull = args.flag("pull", true);
    const bool no_cache = args.flag("no_cache", true);

    std::vector<Step> steps;
    auto failed = [&]() { return !steps.empty() && !steps.back().success; };

    if (pull) {
        auto repo_it = cfg.service_repos.find(service);
        if (repo_it != cfg.service_repos.end()) {
            auto rp = repo_path(cfg.sandbox, repo_it->second);
            if (rp) {
                ExecutionResult r = ctx.runner.run(Command::exec({"git", "pull"}, 60, *rp));
                steps.push_back({"git_pull", repo_it->second, r.success, r.combined()});
            }
        }
    }

    if (!failed()) {
        std::vector<std::string> argv = {"docker", "compose", "build"};
        if (no_cache) argv.push_back("--no-cache");
        argv.push_back(service);
        ExecutionResult r = ctx.runner.run(Command::exec(argv, 600, cfg.compose_dir));
        steps.push_back({"docker_build", "", r.success,
                         tail_bytes(r.out, kBuildOutputTail) + tail_bytes(r.err, kBuildOutputTail)});
    }

    if (!failed()) {
        ExecutionResult r = ctx.runner.run(
            Command::exec({"docker", "compose", "up", "-d", service}, 120, cfg.compose_dir));
        steps.push_back({"docker_up", "", r.success, r.combined()});
    }

    bool overall = !steps.empty();
    for (const auto& s : steps) overall = overall && s.success;

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "service", service);
    json_object* arr = json_object_new_array();
    for (const auto& s : steps) json_object_array_add(arr, step_json(s));
    json::set(out.get(), "steps", arr);
    json::set_bool(out.get(), "overall_success", overall);

    json::Doc audit = json::Doc::object();
    json::set_string(audit.get(), "service", service);
    json::set_bool(audit.get(), "pull", pull);
    json::set_bool(audit.get(), "no_cache", no_cache);
    json_object* summary = json_object_new_array();
    for (const auto& s : steps) {
        json_object* o = json_object_new_object();
        json::set_string(o, "step", s.name);
        json::set_bool(o, "success", s.success);
        json_object_array_add(summary, o);
    }
    json::set(audit.get(), "steps", summary);
    json::set_bool(audit.get(), "overall_success", overall);
    record_audit(ctx, "deploy_service", audit.get());

    std::cerr << "[dispatch] deploy " << service << " overall_success=" << (overall ? "true" : "false") << "\n";
    return ToolResult::success(std::move(out));
}

ToolResult tool_restart_service(const ToolArgs& args, ToolContext& ctx) {
    const GatewayConfig& cfg = ctx.config;
    const std::string service = args.str("service");
    if (!service_allowed(cfg.sandbox, service)) return unknown_service(cfg, service);

    ExecutionResult r = ctx.runner.run(
        Command::exec({"docker", "compose", "restart", service}, 120, cfg.compose_dir));

    json::Doc audit = json::Doc::object();
    json::set_string(audit.get(), "service", service);
    json::set_bool(audit.get(), "success", r.success);
    json::set_int(audit.get(), "returncode", r.returncode);
    record_audit(ctx, "restart_service", audit.get());

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "service", service);
    json::set_bool(out.get(), "success", r.success);
    json::set_string(out.get(), "output", r.combined());
    return ToolResult::success(std::move(out));
}

} // namespace opsgate
