#include "opsgate/registry.h"

#include <stdexcept>

namespace opsgate {

const char* param_type_name(ParamType t) {
    switch (t) {
        case ParamType::STRING: return "string";
        case ParamType::INTEGER: return "integer";
        case ParamType::BOOLEAN: return "boolean";
        case ParamType::OBJECT: return "object";
    }
    return "string";
}

bool matches_type(json_object* v, ParamType t) {
    if (!v) return false;
    switch (t) {
        case ParamType::STRING: return json_object_is_type(v, json_type_string);
        case ParamType::INTEGER: return json_object_is_type(v, json_type_int);
        case ParamType::BOOLEAN: return json_object_is_type(v, json_type_boolean);
        case ParamType::OBJECT: return json_object_is_type(v, json_type_object);
    }
    return false;
}

const ParamSpec* ToolDefinition::param(const std::string& pname) const {
    for (const auto& p : params) {
        if (p.name == pname) return &p;
    }
    return nullptr;
}

void ToolRegistry::add(ToolDefinition def) {
    if (def.name.empty()) throw std::runtime_error("tool with empty name");
    if (!def.handler) throw std::runtime_error("tool has no handler: " + def.name);
    if (tools_.count(def.name) || aliases_.count(def.name)) {
        throw std::runtime_error("duplicate tool in registry: " + def.name);
    }

    for (const auto& p : def.params) {
        if (p.default_json.empty()) continue;
        json::Doc d = json::parse(p.default_json);
        if (!matches_type(d.get(), p.type)) {
            throw std::runtime_error("bad default for " + def.name + "." + p.name + ": " + p.default_json);
        }
    }

    if (def.destructive && !def.param("confirm")) {
        ParamSpec c;
        c.name = "confirm";
        c.type = ParamType::BOOLEAN;
        c.description = "Must be true to perform this action";
        c.default_json = "false";
        def.params.push_back(c);
    }

    std::string key = def.name;
    tools_.emplace(key, std::move(def));
}

void ToolRegistry::add_alias(const std::string& alias, const std::string& target) {
    if (!tools_.count(target)) throw std::runtime_error("alias target not registered: " + target);
    if (tools_.count(alias) || aliases_.count(alias)) {
        throw std::runtime_error("duplicate tool in registry: " + alias);
    }
    aliases_[alias] = target;
}

const ToolDefinition* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    if (it != tools_.end()) return &it->second;
    auto a = aliases_.find(name);
    if (a == aliases_.end()) return nullptr;
    it = tools_.find(a->second);
    return it == tools_.end() ? nullptr : &it->second;
}

std::vector<const ToolDefinition*> ToolRegistry::all() const {
    // std::map iteration is already name order
    std::vector<const ToolDefinition*> res;
    res.reserve(tools_.size());
    for (const auto& kv : tools_) res.push_back(&kv.second);
    return res;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> res;
    res.reserve(tools_.size());
    for (const auto& kv : tools_) res.push_back(kv.first);
    return res;
}

json::Doc input_schema(const ToolDefinition& def) {
    json::Doc schema = json::Doc::object();
    json::set_string(schema.get(), "type", "object");

    json_object* props = json_object_new_object();
    json_object* required = json_object_new_array();
    for (const auto& p : def.params) {
        json_object* prop = json_object_new_object();
        json::set_string(prop, "type", param_type_name(p.type));
        if (!p.description.empty()) json::set_string(prop, "description", p.description);
        if (!p.default_json.empty()) {
            json::Doc d = json::parse(p.default_json);
            if (d) json::set(prop, "default", d.release());
        }
        if (p.min) json::set_int(prop, "minimum", *p.min);
        if (p.max) json::set_int(prop, "maximum", *p.max);
        json::set(props, p.name, prop);
        if (p.required) json_object_array_add(required, json::new_string(p.name));
    }
    json::set(schema.get(), "properties", props);
    json::set(schema.get(), "required", required);
    return schema;
}

json::Doc ToolRegistry::catalog_json() const {
    json::Doc arr = json::Doc::array();
    for (const auto* def : all()) {
        json_object* t = json_object_new_object();
        json::set_string(t, "name", def->name);
        json::set_string(t, "description", def->description);
        json::set(t, "inputSchema", input_schema(*def).release());
        json_object_array_add(arr.get(), t);
    }
    return arr;
}

} // namespace opsgate
