#include "ops_tools.h"

#include "opsgate/text.h"

#include <regex>
#include <stdexcept>

namespace opsgate {

namespace {

bool valid_record_id(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    static const std::regex re("^[A-Za-z0-9_-]+$");
    return std::regex_match(id, re);
}

struct BackendReply {
    bool success{false};
    int status_code{0};
    json::Doc body;          // parsed JSON, or a JSON string with the raw text
    std::string error;
};

// POST a JSON body to the backend API through curl. The body goes on stdin;
// the status code comes back on the last stdout line.
BackendReply backend_post(ToolContext& ctx, const std::string& path, json_object* body) {
    Command cmd = Command::exec({
        "curl", "-sS",
        "--max-time", "25",
        "--max-redirs", "0",
        "-X", "POST",
        "-H", "Content-Type: application/json",
        "--data-binary", "@-",
        "-w", "\n%{http_code}",
        "--", ctx.config.backend_url + path,
    }, 30);
    cmd.stdin_data = json::dump(body);
    ExecutionResult r = ctx.runner.run(cmd);

    BackendReply rep;
    if (!r.success) {
        rep.error = r.err.empty() ? "curl exited with " + std::to_string(r.returncode) : trim_ws(r.err);
        return rep;
    }

    std::string text = r.out;
    size_t nl = text.rfind('\n');
    std::string code = trim_ws(nl == std::string::npos ? text : text.substr(nl + 1));
    if (nl != std::string::npos) text.resize(nl);
    else text.clear();
    try { rep.status_code = std::stoi(code); } catch (const std::exception&) { rep.status_code = 0; }

    rep.body = json::parse(trim_ws(text));
    if (!rep.body) rep.body = json::Doc{json::new_string(text)};
    rep.success = rep.status_code >= 200 && rep.status_code < 300;
    if (!rep.success) rep.error = "backend returned HTTP " + std::to_string(rep.status_code);
    return rep;
}

void put_reply(json_object* out, BackendReply& rep) {
    json::set_bool(out, "success", rep.success);
    json::set_int(out, "status_code", rep.status_code);
    if (rep.body) json::set(out, "response", json_object_get(rep.body.get()));
    if (!rep.error.empty()) json::set_string(out, "error", rep.error);
}

ToolResult bad_record_id(const std::string& id) {
    return ToolResult::failure(ToolStatus::INVALID_ARGUMENT,
        "Invalid record_id: " + id + " (expected 1-128 characters of [A-Za-z0-9_-])");
}

} // namespace

ToolResult tool_trigger_reanalysis(const ToolArgs& args, ToolContext& ctx) {
    const std::string id = args.str("record_id");
    if (!valid_record_id(id)) return bad_record_id(id);

    json::Doc body = json::Doc::object();
    BackendReply rep = backend_post(ctx, "/api/articles/" + id + "/reanalyze", body.get());

    json::Doc audit = json::Doc::object();
    json::set_string(audit.get(), "record_id", id);
    json::set_bool(audit.get(), "success", rep.success);
    json::set_int(audit.get(), "status_code", rep.status_code);
    record_audit(ctx, "trigger_reanalysis", audit.get());

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "record_id", id);
    put_reply(out.get(), rep);
    return ToolResult::success(std::move(out));
}

ToolResult tool_hide_record(const ToolArgs& args, ToolContext& ctx) {
    const std::string id = args.str("record_id");
    if (!valid_record_id(id)) return bad_record_id(id);
    const std::string reason = args.str("reason");

    json::Doc body = json::Doc::object();
    json::set_string(body.get(), "reason", reason);
    BackendReply rep = backend_post(ctx, "/api/articles/" + id + "/hide", body.get());

    json::Doc audit = json::Doc::object();
    json::set_string(audit.get(), "record_id", id);
    json::set_string(audit.get(), "reason", reason);
    json::set_bool(audit.get(), "success", rep.success);
    json::set_int(audit.get(), "status_code", rep.status_code);
    record_audit(ctx, "hide_record", audit.get());

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "record_id", id);
    json::set_string(out.get(), "reason", reason);
    put_reply(out.get(), rep);
    return ToolResult::success(std::move(out));
}

} // namespace opsgate
