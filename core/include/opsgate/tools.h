#pragma once

#include "opsgate/json.h"

#include <cstdint>
#include <functional>
#include <string>

namespace opsgate {

struct GatewayConfig;
class IProcessRunner;
class AuditLog;

enum class ToolStatus {
    OK,
    INVALID_ARGUMENT,
    ACCESS_DENIED,
    NOT_FOUND,
    UNKNOWN_TOOL,
    CONFIRMATION_REQUIRED,
    INTERNAL_ERROR,
};

const char* tool_status_name(ToolStatus s);

// REST status code for a tool outcome.
int http_status_for(ToolStatus s);

struct ToolResult {
    ToolStatus status{ToolStatus::OK};
    json::Doc payload;   // JSON object returned to the caller
    std::string error;   // set for every status except OK

    bool ok() const { return status == ToolStatus::OK; }

    static ToolResult success(json::Doc payload);
    // payload becomes {"error": message}
    static ToolResult failure(ToolStatus status, const std::string& message);
};

// Validated, default-filled argument object. Borrowed; the dispatcher owns it.
class ToolArgs {
public:
    explicit ToolArgs(json_object* obj) : obj_(obj) {}

    bool has(const std::string& key) const { return json::member(obj_, key) != nullptr; }
    std::string str(const std::string& key, const std::string& defv = "") const;
    int64_t integer(const std::string& key, int64_t defv = 0) const;
    bool flag(const std::string& key, bool defv = false) const;
    json_object* raw(const std::string& key) const { return json::member(obj_, key); }
    json_object* object() const { return obj_; }

private:
    json_object* obj_;
};

// What a handler may touch. Nothing here is mutable shared state except the
// audit sink, which serializes its own appends.
struct ToolContext {
    const GatewayConfig& config;
    IProcessRunner& runner;
    AuditLog* audit{nullptr};
};

using ToolFn = std::function<ToolResult(const ToolArgs& args, ToolContext& ctx)>;

} // namespace opsgate
