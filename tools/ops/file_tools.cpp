#include "ops_tools.h"

#include "opsgate/sandbox.h"
#include "opsgate/text.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace opsgate {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxReadChars = 100000;
constexpr size_t kMaxListing = 500;

ToolResult denied(const PathVerdict& v) {
    return ToolResult::failure(ToolStatus::ACCESS_DENIED, v.reason);
}

// Line-window reader: skip `offset` lines, then keep `limit` lines (0 = all),
// stopping once `cap` characters are held.
struct LineWindow {
    int64_t offset;
    int64_t limit;
    size_t cap;

    std::string content;
    bool truncated{false};
    bool done{false};
    int64_t line_no{0};
    int64_t kept{0};

    void feed(const char* p, size_t n) {
        for (size_t i = 0; i < n && !done; i++) {
            const char c = p[i];
            if (line_no >= offset) {
                if (content.size() >= cap) {
                    truncated = true;
                    done = true;
                    break;
                }
                content.push_back(c);
            }
            if (c == '\n') {
                if (line_no >= offset) {
                    kept++;
                    if (limit > 0 && kept >= limit) done = true;
                }
                line_no++;
            }
        }
    }
};

} // namespace

ToolResult tool_read_file(const ToolArgs& args, ToolContext& ctx) {
    PathVerdict v = validate_path(ctx.config.sandbox, args.str("path"));
    if (!v.allowed) return denied(v);
    const std::string& path = v.canonical;

    std::error_code ec;
    if (!fs::exists(path, ec)) return ToolResult::failure(ToolStatus::NOT_FOUND, "File not found: " + path);
    if (!fs::is_regular_file(path, ec)) return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "Not a file: " + path);

    // The canonical path has no symlinks left; refuse one swapped in since.
    int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return ToolResult::failure(ToolStatus::INTERNAL_ERROR,
                                   "Error reading file: " + path + ": " + std::strerror(errno));
    }
    struct stat st;
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "Not a file: " + path);
    }

    LineWindow w{args.integer("offset", 0), args.integer("lines", 0), kMaxReadChars};
    char buf[16384];
    while (!w.done) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) { w.feed(buf, (size_t)n); continue; }
        if (n == 0) break;
        if (errno == EINTR) continue;
        int e = errno;
        ::close(fd);
        return ToolResult::failure(ToolStatus::INTERNAL_ERROR,
                                   "Error reading file: " + path + ": " + std::strerror(e));
    }
    ::close(fd);

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "path", path);
    json::set_string(out.get(), "content", w.content);
    json::set_bool(out.get(), "truncated", w.truncated);
    json::set_int(out.get(), "size", (int64_t)st.st_size);
    return ToolResult::success(std::move(out));
}

ToolResult tool_search_files(const ToolArgs& args, ToolContext& ctx) {
    const std::string pattern = args.str("pattern");
    if (pattern.empty()) return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "pattern must not be empty");
    PathVerdict v = validate_path(ctx.config.sandbox, args.str("path", "/opt/saga-graph"));
    if (!v.allowed) return denied(v);
    const size_t max_results = (size_t)args.integer("max_results", 100);

    ExecutionResult r = ctx.runner.run(
        Command::exec({"find", v.canonical, "-name", pattern, "-type", "f"}, 30));

    std::vector<std::string> files;
    for (auto& f : split_lines(r.out, true)) {
        if (path_blocked(ctx.config.sandbox, f)) continue;
        files.push_back(std::move(f));
        if (files.size() >= max_results) break;
    }

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "pattern", pattern);
    json::set_string(out.get(), "path", v.canonical);
    json::set_int(out.get(), "count", (int64_t)files.size());
    json::set(out.get(), "files", json::string_array(files));
    return ToolResult::success(std::move(out));
}

ToolResult tool_grep(const ToolArgs& args, ToolContext& ctx) {
    const std::string pattern = args.str("pattern");
    if (pattern.empty()) return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "pattern must not be empty");
    PathVerdict v = validate_path(ctx.config.sandbox, args.str("path", "/opt/saga-graph"));
    if (!v.allowed) return denied(v);
    const std::string file_pattern = args.str("file_pattern");
    const size_t max_results = (size_t)args.integer("max_results", 50);

    ExecutionResult r = ctx.runner.run(Command::exec({
        "grep", "-rn", "--include=" + (file_pattern.empty() ? std::string("*") : file_pattern),
        "-E", "-e", pattern, "--", v.canonical}, 60));

    json_object* matches = json_object_new_array();
    size_t count = 0;
    for (const auto& line : split_lines(r.out, true)) {
        if (count >= max_results) break;
        // file:line:content
        size_t a = line.find(':');
        if (a == std::string::npos) continue;
        size_t b = line.find(':', a + 1);
        if (b == std::string::npos) continue;
        // the root was validated, the files found below it were not
        std::string file = line.substr(0, a);
        if (path_blocked(ctx.config.sandbox, file)) continue;
        std::string num = line.substr(a + 1, b - a - 1);
        int64_t line_no = 0;
        if (!num.empty() && std::all_of(num.begin(), num.end(), [](char c){ return c >= '0' && c <= '9'; })) {
            try { line_no = std::stoll(num); } catch (const std::exception&) { line_no = 0; }
        }
        json_object* m = json_object_new_object();
        json::set_string(m, "file", file);
        json::set_int(m, "line", line_no);
        json::set_string(m, "content", line.substr(b + 1));
        json_object_array_add(matches, m);
        count++;
    }

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "pattern", pattern);
    json::set_string(out.get(), "path", v.canonical);
    json::set(out.get(), "file_pattern", file_pattern.empty() ? nullptr : json::new_string(file_pattern));
    json::set(out.get(), "matches", matches);
    json::set_int(out.get(), "count", (int64_t)count);
    return ToolResult::success(std::move(out));
}

ToolResult tool_list_directory(const ToolArgs& args, ToolContext& ctx) {
    PathVerdict v = validate_path(ctx.config.sandbox, args.str("path"));
    if (!v.allowed) return denied(v);
    const std::string& path = v.canonical;

    std::error_code ec;
    if (!fs::exists(path, ec)) return ToolResult::failure(ToolStatus::NOT_FOUND, "Directory not found: " + path);
    if (!fs::is_directory(path, ec)) return ToolResult::failure(ToolStatus::INVALID_ARGUMENT, "Not a directory: " + path);

    json_object* items = json_object_new_array();
    size_t count = 0;

    if (args.flag("recursive", false)) {
        const int max_depth = (int)args.integer("max_depth", 2);
        std::vector<std::string> paths{path};
        fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
        fs::recursive_directory_iterator end;
        while (!ec && it != end && paths.size() < kMaxListing) {
            if (it.depth() + 1 > max_depth) {
                it.pop(ec);
                continue;
            }
            std::string p = it->path().generic_string();
            if (path_blocked(ctx.config.sandbox, p)) {
                it.disable_recursion_pending();
                it.increment(ec);
                continue;
            }
            std::error_code sec;
            auto st = it->symlink_status(sec);
            if (!sec && (fs::is_regular_file(st) || fs::is_directory(st))) paths.push_back(p);
            if (it.depth() + 1 >= max_depth) it.disable_recursion_pending();
            it.increment(ec);
        }
        for (const auto& p : paths) json_object_array_add(items, json::new_string(p));
        count = paths.size();
    } else {
        struct Entry { std::string name; bool dir; int64_t size; std::string full; };
        std::vector<Entry> entries;
        for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code sec;
            Entry e;
            e.name = it->path().filename().string();
            e.full = it->path().generic_string();
            if (path_blocked(ctx.config.sandbox, e.full)) continue;
            e.dir = it->is_directory(sec);
            e.size = (!e.dir && it->is_regular_file(sec)) ? (int64_t)it->file_size(sec) : 0;
            if (sec) e.size = 0;
            entries.push_back(std::move(e));
        }
        std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.name < b.name; });
        for (const auto& e : entries) {
            json_object* o = json_object_new_object();
            json::set_string(o, "name", e.name);
            json::set_string(o, "type", e.dir ? "dir" : "file");
            json::set_int(o, "size", e.size);
            json::set_string(o, "path", e.full);
            json_object_array_add(items, o);
        }
        count = entries.size();
    }
    if (ec) {
        json_object_put(items);
        return ToolResult::failure(ToolStatus::INTERNAL_ERROR, "Error listing directory: " + path + ": " + ec.message());
    }

    json::Doc out = json::Doc::object();
    json::set_string(out.get(), "path", path);
    json::set(out.get(), "items", items);
    json::set_int(out.get(), "count", (int64_t)count);
    return ToolResult::success(std::move(out));
}

} // namespace opsgate
