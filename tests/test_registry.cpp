#include "test_common.h"
#include "opsgate/registry.h"
#include "tools/ops/ops_tools.h"

#include <set>
#include <stdexcept>

using namespace opsgate;

static ToolResult noop(const ToolArgs&, ToolContext&) {
    return ToolResult::success(json::Doc::object());
}

static bool throws_on_add(ToolRegistry& reg, ToolDefinition def) {
    try {
        reg.add(std::move(def));
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    // Test 1: full catalog registers and every tool has a handler
    ToolRegistry reg;
    register_ops_tools(reg);
    const std::set<std::string> expected = {
        "read_log", "search_logs", "tail_logs", "read_file", "search_files", "grep",
        "list_directory", "deploy_service", "restart_service", "git", "query_database",
        "docker_status", "system_health", "daily_stats", "run_command",
        "trigger_reanalysis", "hide_record",
    };
    expect_eq_ll((long long)reg.size(), (long long)expected.size(), "catalog size");
    for (const auto& n : expected) {
        const ToolDefinition* d = reg.find(n);
        expect_true(d != nullptr, "registered: " + n);
        expect_true((bool)d->handler, "handler bound: " + n);
    }

    // Test 2: destructive tools carry a confirm parameter
    for (const char* n : {"deploy_service", "restart_service", "trigger_reanalysis", "hide_record"}) {
        const ToolDefinition* d = reg.find(n);
        expect_true(d->destructive, std::string(n) + " is destructive");
        const ParamSpec* c = d->param("confirm");
        expect_true(c && c->type == ParamType::BOOLEAN && !c->required, std::string(n) + " declares confirm");
    }
    expect_true(!reg.find("read_file")->destructive, "read_file is not destructive");
    expect_true(!reg.find("read_file")->param("confirm"), "non-destructive tools have no confirm");

    // Test 3: alias resolves but is not listed
    {
        const ToolDefinition* a = reg.find("query_neo4j");
        expect_true(a && a->name == "query_database", "query_neo4j resolves to query_database");
        for (const auto& n : reg.names()) expect_true(n != "query_neo4j", "alias not listed");
        expect_true(reg.find("no_such_tool") == nullptr, "unknown lookup is null");
    }

    // Test 4: catalog JSON is sorted, complete and stable
    {
        json::Doc cat = reg.catalog_json();
        const size_t n = json_object_array_length(cat.get());
        expect_eq_ll((long long)n, (long long)expected.size(), "catalog entries");
        std::string prev;
        for (size_t i = 0; i < n; i++) {
            json_object* t = json_object_array_get_idx(cat.get(), (int)i);
            auto name = json::get_string(t, "name");
            expect_true(name && *name > prev, "catalog in name order");
            prev = *name;
            expect_true(json::get_string(t, "description").has_value(), "description present");
            json_object* schema = json::member(t, "inputSchema");
            expect_eq_str(json::get_string(schema, "type").value_or(""), "object", "schema type");
            expect_true(json::is_object(json::member(schema, "properties")), "schema properties");
        }
        json::Doc again = reg.catalog_json();
        expect_eq_str(json::dump(cat.get()), json::dump(again.get()), "catalog identical across calls");
    }

    // Test 5: schema details
    {
        json::Doc s = input_schema(*reg.find("read_log"));
        json_object* props = json::member(s.get(), "properties");
        json_object* lines = json::member(props, "lines");
        expect_eq_str(json::get_string(lines, "type").value_or(""), "integer", "lines is integer");
        expect_eq_ll(json::get_int(lines, "default").value_or(-1), 100, "lines default");
        expect_eq_ll(json::get_int(lines, "minimum").value_or(-1), 1, "lines minimum");
        expect_eq_ll(json::get_int(lines, "maximum").value_or(-1), 10000, "lines maximum");
        json_object* req = json::member(s.get(), "required");
        expect_eq_ll((long long)json_object_array_length(req), 1, "one required arg");
        expect_eq_str(json_object_get_string(json_object_array_get_idx(req, 0)), "service", "service required");
    }

    // Test 6: broken definitions are rejected at startup
    {
        ToolRegistry r2;
        ToolDefinition a;
        a.name = "a";
        a.handler = noop;
        r2.add(a);
        expect_true(throws_on_add(r2, a), "duplicate name rejected");

        ToolDefinition unnamed;
        unnamed.handler = noop;
        expect_true(throws_on_add(r2, unnamed), "empty name rejected");

        ToolDefinition nohandler;
        nohandler.name = "b";
        expect_true(throws_on_add(r2, nohandler), "missing handler rejected");

        ToolDefinition baddef;
        baddef.name = "c";
        baddef.handler = noop;
        ParamSpec p;
        p.name = "n";
        p.type = ParamType::INTEGER;
        p.default_json = "\"ten\"";
        baddef.params.push_back(p);
        expect_true(throws_on_add(r2, baddef), "default of wrong type rejected");

        bool alias_threw = false;
        try { r2.add_alias("x", "missing"); } catch (const std::runtime_error&) { alias_threw = true; }
        expect_true(alias_threw, "alias to unknown tool rejected");

        alias_threw = false;
        try { r2.add_alias("a", "a"); } catch (const std::runtime_error&) { alias_threw = true; }
        expect_true(alias_threw, "alias shadowing a tool rejected");
    }

    // Test 7: matches_type
    {
        json::Doc i{json_object_new_int(3)};
        json::Doc s{json_object_new_string("3")};
        json::Doc b{json_object_new_boolean(1)};
        expect_true(matches_type(i.get(), ParamType::INTEGER), "int matches integer");
        expect_true(!matches_type(s.get(), ParamType::INTEGER), "string is not integer");
        expect_true(!matches_type(i.get(), ParamType::BOOLEAN), "int is not boolean");
        expect_true(matches_type(b.get(), ParamType::BOOLEAN), "bool matches boolean");
        expect_true(!matches_type(nullptr, ParamType::STRING), "null matches nothing");
    }

    std::cerr << "test_registry: ALL PASSED" << std::endl;
    return 0;
}
