#include "opsgate/dispatcher.h"
#include "opsgate/audit.h"
#include "opsgate/config.h"
#include "opsgate/proc.h"

#include <exception>
#include <iostream>

namespace opsgate {

namespace {

ToolResult invalid(const std::string& msg) {
    return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, msg);
}

// Shallow copy of the caller's arguments; JSON nulls count as absent.
json::Doc copy_args(json_object* args) {
    json::Doc out = json::Doc::object();
    if (!args) return out;
    json_object_object_foreach(args, k, v) {
        if (!v) continue;
        json::set(out.get(), k, json_object_get(v));
    }
    return out;
}

} // namespace

ToolResult Dispatcher::dispatch(const std::string& name, json_object* args) const {
    const ToolDefinition* def = registry_.find(name);
    if (!def) {
        std::cerr << "[dispatch] unknown tool: " << name << "\n";
        return ToolResult::failure(ToolStatus::UNKNOWN_TOOL, "Unknown tool: " + name);
    }
    if (args && !json::is_object(args)) {
        return invalid("arguments must be a JSON object");
    }

    if (def->destructive) {
        auto confirm = json::get_bool(args, "confirm");
        if (!confirm || !*confirm) {
            std::cerr << "[dispatch] " << def->name << " refused: confirm not set\n";
            if (audit_) {
                json::Doc p = json::Doc::object();
                json::set_string(p.get(), "tool", def->name);
                audit_->event("confirmation_refused", p.get());
            }
            return ToolResult::failure(ToolStatus::CONFIRMATION_REQUIRED,
                "Must set confirm=true to run " + def->name + " (destructive action)");
        }
    }

    json::Doc work = copy_args(args);
    for (const auto& p : def->params) {
        json_object* v = json::member(work.get(), p.name);
        if (!v) {
            if (p.required) return invalid("missing required argument: " + p.name);
            if (!p.default_json.empty()) {
                json::Doc d = json::parse(p.default_json);
                if (d) json::set(work.get(), p.name, d.release());
            }
            continue;
        }
        if (!matches_type(v, p.type)) {
            return invalid("argument " + p.name + " must be of type " + param_type_name(p.type));
        }
        if (p.type == ParamType::INTEGER && (p.min || p.max)) {
            int64_t n = json_object_get_int64(v);
            if ((p.min && n < *p.min) || (p.max && n > *p.max)) {
                return invalid("argument " + p.name + " must be between " +
                               (p.min ? std::to_string(*p.min) : std::string("-inf")) + " and " +
                               (p.max ? std::to_string(*p.max) : std::string("inf")));
            }
        }
    }

    ToolContext ctx{config_, runner_, audit_};
    ToolArgs targs(work.get());
    ToolResult r;
    try {
        r = def->handler(targs, ctx);
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] " << def->name << " threw: " << e.what() << "\n";
        return ToolResult::failure(ToolStatus::INTERNAL_ERROR, "Internal error while running " + def->name);
    } catch (...) {
        std::cerr << "[dispatch] " << def->name << " threw a non-standard exception\n";
        return ToolResult::failure(ToolStatus::INTERNAL_ERROR, "Internal error while running " + def->name);
    }

    if (!r.payload) r.payload = json::Doc::object();
    if (!r.ok()) {
        std::cerr << "[dispatch] " << def->name << " -> " << tool_status_name(r.status)
                  << ": " << r.error << "\n";
    }
    return r;
}

} // namespace opsgate
