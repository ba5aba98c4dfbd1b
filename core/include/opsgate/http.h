#pragma once

// Transport-neutral HTTP request/response used by the gateway routes.
// The socket layer fills HttpRequest; tests build it directly.

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace opsgate {

struct HttpRequest {
    std::string method;
    std::string path;                                // decoded, without query string
    std::map<std::string, std::string> query;        // decoded; last value wins
    std::map<std::string, std::string> headers;      // keys lowercased
    std::string body;

    // Case-insensitive header lookup; empty if absent.
    std::string header(const std::string& name) const;
    // Query parameter; empty if absent.
    std::string query_param(const std::string& name) const;
    bool has_query(const std::string& name) const { return query.count(name) > 0; }
};

struct HttpResponse {
    int status{200};
    std::string content_type{"application/json"};
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

// Decode %XX escapes; '+' becomes a space when form is set. Malformed
// escapes are kept literally.
std::string percent_decode(const std::string& s, bool form);

// Split "/a/b?x=1&y=2" into the decoded path and query map.
void split_target(const std::string& target, std::string* path, std::map<std::string, std::string>* query);

const char* status_reason(int code);

} // namespace opsgate
