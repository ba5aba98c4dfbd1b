#pragma once

#include "opsgate/json.h"
#include "opsgate/tools.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace opsgate {

enum class ParamType { STRING, INTEGER, BOOLEAN, OBJECT };

// JSON Schema type name ("string", "integer", ...).
const char* param_type_name(ParamType t);

struct ParamSpec {
    std::string name;
    ParamType type{ParamType::STRING};
    bool required{false};
    std::string description;
    std::string default_json;           // JSON literal; empty = no default
    std::optional<int64_t> min;         // integers only
    std::optional<int64_t> max;
};

// One catalog entry: schema plus the bound handler.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;
    bool destructive{false};            // requires confirm=true
    ToolFn handler;

    const ParamSpec* param(const std::string& pname) const;
};

// Static tool catalog. Built once at startup, read-only afterwards.
class ToolRegistry {
public:
    // Throws std::runtime_error on a duplicate or empty name, a missing handler
    // or a default that does not match its declared type. Destructive tools get
    // a declared "confirm" parameter if they do not have one.
    void add(ToolDefinition def);

    // Second name for an existing tool (e.g. a legacy REST path). Not listed.
    void add_alias(const std::string& alias, const std::string& target);

    // Resolves aliases. nullptr if unknown.
    const ToolDefinition* find(const std::string& name) const;

    // Sorted by name; aliases excluded.
    std::vector<const ToolDefinition*> all() const;
    std::vector<std::string> names() const;
    size_t size() const { return tools_.size(); }

    // [{name, description, inputSchema}, ...] in name order.
    json::Doc catalog_json() const;

private:
    std::map<std::string, ToolDefinition> tools_;
    std::map<std::string, std::string> aliases_;
};

// {"type":"object","properties":{...},"required":[...]}
json::Doc input_schema(const ToolDefinition& def);

// True if v has the JSON type expected for t.
bool matches_type(json_object* v, ParamType t);

} // namespace opsgate
