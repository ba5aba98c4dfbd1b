#include "test_common.h"
#include "opsgate/sandbox.h"

#include <unistd.h>

using namespace opsgate;

int main() {
    std::string root = make_temp_dir("sandbox");
    std::string outside = make_temp_dir("sandbox_out");
    write_text(root + "/app.log", "line\n");
    write_text(root + "/.env", "SECRET=1\n");
    write_text(outside + "/passwd", "root:x:0:0\n");

    SandboxPolicy pol;
    pol.allowed_roots = {root + "/"};
    pol.blocked_patterns = {R"(\.env$)", "secrets", R"(\.pem$)", R"(\.ssh)"};
    pol.allowed_services = {"apis", "nginx"};
    pol.repo_paths = {{"saga-be", "/opt/saga-graph/saga-be"}};
    pol.command_prefixes = {"docker ps", "ls ", "cat /proc/"};
    expect_true(compile_policy(pol).empty(), "policy compiles");
    expect_eq_str(pol.allowed_roots[0], root, "root canonicalized without trailing slash");

    // Test 1: inside the root
    {
        auto v = validate_path(pol, root + "/app.log");
        expect_true(v.allowed, "file under root allowed");
        expect_eq_str(v.canonical, root + "/app.log", "canonical form");
        expect_true(path_allowed(pol, root), "root itself allowed");
        expect_true(path_allowed(pol, root + "/"), "root with trailing slash allowed");
        expect_true(path_allowed(pol, root + "/not/yet/created.txt"), "nonexistent tail allowed");
    }

    // Test 2: outside the root
    {
        auto v = validate_path(pol, "/etc/passwd");
        expect_true(!v.allowed, "/etc/passwd rejected");
        expect_eq_str(v.reason, "Access denied: /etc/passwd is outside allowed directories", "outside reason");
        expect_true(!path_allowed(pol, outside + "/passwd"), "sibling temp dir rejected");
        expect_true(!path_allowed(pol, ""), "empty path rejected");
        expect_true(!path_allowed(pol, "relative/app.log"), "relative path resolved against cwd is outside");
    }

    // Test 3: component boundary (root "/x/a" must not admit "/x/ab")
    {
        expect_true(path_under("/app/x", "/app"), "child on boundary");
        expect_true(path_under("/app", "/app"), "equal path");
        expect_true(!path_under("/application", "/app"), "prefix without boundary");
        expect_true(!path_allowed(pol, root + "extra/file"), "name-prefix sibling rejected");
    }

    // Test 4: traversal is resolved before the check
    {
        expect_true(!path_allowed(pol, root + "/../../etc/passwd"), "dot-dot escape rejected");
        expect_true(path_allowed(pol, root + "/sub/../app.log"), "dot-dot inside root allowed");
    }

    // Test 5: symlink escape
    {
        std::string link = root + "/escape";
        expect_true(::symlink(outside.c_str(), link.c_str()) == 0, "create symlink");
        auto v = validate_path(pol, link + "/passwd");
        expect_true(!v.allowed, "symlink pointing outside rejected");
        expect_true(contains(v.reason, "outside allowed directories"), "symlink escape reason");
    }

    // Test 6: blocklist, case-insensitive
    {
        auto v = validate_path(pol, root + "/.env");
        expect_true(!v.allowed, ".env blocked");
        expect_eq_str(v.reason, "Access denied: " + root + "/.env matches blocked pattern", "blocked reason");
        expect_true(!path_allowed(pol, root + "/SECRETS/db.txt"), "blocked pattern ignores case");
        expect_true(!path_allowed(pol, root + "/certs/server.PEM"), "suffix pattern ignores case");
        expect_true(path_allowed(pol, root + "/env.txt"), "pattern is anchored");
    }

    // Test 7: command prefixes are literal
    {
        expect_true(command_allowed(pol, "docker ps -a"), "docker ps allowed");
        expect_true(command_allowed(pol, "ls -la /tmp"), "ls allowed");
        expect_true(!command_allowed(pol, "lsblk"), "ls prefix includes the space");
        expect_true(!command_allowed(pol, "docker rm apis"), "docker rm rejected");
        expect_true(!command_allowed(pol, "Docker ps"), "prefix match is case-sensitive");
        expect_true(!command_allowed(pol, " docker ps"), "leading space rejected");
        expect_true(!command_allowed(pol, "cat /etc/shadow"), "cat outside /proc rejected");
    }

    // Test 8: names
    {
        expect_true(service_allowed(pol, "apis"), "apis allowed");
        expect_true(!service_allowed(pol, "APIS"), "service match is exact");
        expect_true(!service_allowed(pol, "postgres"), "unknown service rejected");
        auto rp = repo_path(pol, "saga-be");
        expect_true(rp && *rp == "/opt/saga-graph/saga-be", "repo resolves");
        expect_true(!repo_path(pol, "saga-be/../etc"), "repo lookup is by exact name");
    }

    // Test 9: mutation keywords
    {
        expect_true(!query_is_mutation("MATCH (t:Topic) RETURN t LIMIT 5"), "read query passes");
        expect_eq_str(find_mutation_keyword("match (n) detach delete n"), "DELETE", "lowercase delete caught");
        expect_true(query_is_mutation("MATCH (n) SeT n.x = 1"), "mixed case set caught");
        expect_true(query_is_mutation("CREATE (n)"), "create caught");
        expect_true(query_is_mutation("MERGE (n:X)"), "merge caught");
        expect_true(query_is_mutation("MATCH (n) REMOVE n.x"), "remove caught");
        expect_true(query_is_mutation("DROP INDEX foo"), "drop caught");
        // substring scan: keyword inside an identifier also trips the check
        expect_true(query_is_mutation("MATCH (n:Dataset) RETURN n"), "substring match is conservative");
    }

    // Test 10: bad policies
    {
        SandboxPolicy bad;
        bad.allowed_roots = {"relative/dir"};
        expect_true(!compile_policy(bad).empty(), "relative root rejected");
        SandboxPolicy bad_re;
        bad_re.allowed_roots = {"/tmp"};
        bad_re.blocked_patterns = {"(unclosed"};
        expect_true(!compile_policy(bad_re).empty(), "invalid regex rejected");
    }

    expect_eq_str(join_names({"a", "b", "c"}), "a, b, c", "join_names");

    remove_tree(root);
    remove_tree(outside);
    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
