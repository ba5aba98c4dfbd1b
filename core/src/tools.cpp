#include "opsgate/tools.h"

namespace opsgate {

const char* tool_status_name(ToolStatus s) {
    switch (s) {
        case ToolStatus::OK: return "OK";
        case ToolStatus::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ToolStatus::ACCESS_DENIED: return "ACCESS_DENIED";
        case ToolStatus::NOT_FOUND: return "NOT_FOUND";
        case ToolStatus::UNKNOWN_TOOL: return "UNKNOWN_TOOL";
        case ToolStatus::CONFIRMATION_REQUIRED: return "CONFIRMATION_REQUIRED";
        case ToolStatus::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

int http_status_for(ToolStatus s) {
    switch (s) {
        case ToolStatus::OK: return 200;
        case ToolStatus::INVALID_ARGUMENT: return 400;
        case ToolStatus::ACCESS_DENIED: return 403;
        case ToolStatus::NOT_FOUND: return 404;
        case ToolStatus::UNKNOWN_TOOL: return 404;
        // a refused destructive call is a normal, benign answer
        case ToolStatus::CONFIRMATION_REQUIRED: return 200;
        case ToolStatus::INTERNAL_ERROR: return 500;
    }
    return 500;
}

ToolResult ToolResult::success(json::Doc payload) {
    ToolResult r;
    r.status = ToolStatus::OK;
    r.payload = payload ? std::move(payload) : json::Doc::object();
    return r;
}

ToolResult ToolResult::failure(ToolStatus status, const std::string& message) {
    ToolResult r;
    r.status = status;
    r.error = message;
    r.payload = json::Doc::object();
    json::set_string(r.payload.get(), "error", message);
    return r;
}

std::string ToolArgs::str(const std::string& key, const std::string& defv) const {
    return json::get_string(obj_, key).value_or(defv);
}

int64_t ToolArgs::integer(const std::string& key, int64_t defv) const {
    return json::get_int(obj_, key).value_or(defv);
}

bool ToolArgs::flag(const std::string& key, bool defv) const {
    return json::get_bool(obj_, key).value_or(defv);
}

} // namespace opsgate
