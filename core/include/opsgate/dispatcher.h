#pragma once

#include "opsgate/registry.h"
#include "opsgate/tools.h"

#include <string>

namespace opsgate {

struct GatewayConfig;
class IProcessRunner;
class AuditLog;

// The single path from either HTTP surface to a tool handler.
//
// dispatch():
//   1. unknown name               -> UNKNOWN_TOOL
//   2. destructive, confirm!=true -> CONFIRMATION_REQUIRED, handler not called
//   3. required / type / range    -> INVALID_ARGUMENT
//   4. fill declared defaults
//   5. call the handler; exceptions become INTERNAL_ERROR
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry,
               const GatewayConfig& config,
               IProcessRunner& runner,
               AuditLog* audit = nullptr)
        : registry_(registry), config_(config), runner_(runner), audit_(audit) {}

    // args is borrowed; nullptr means no arguments.
    ToolResult dispatch(const std::string& name, json_object* args) const;

    const ToolRegistry& registry() const { return registry_; }
    const GatewayConfig& config() const { return config_; }

private:
    const ToolRegistry& registry_;
    const GatewayConfig& config_;
    IProcessRunner& runner_;
    AuditLog* audit_;
};

} // namespace opsgate
