#pragma once

// json.h
//
// Thin helpers over json-c. Doc owns one reference to a json_object;
// accessor functions borrow and never take ownership.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace opsgate::json {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }
    json_object* get() const { return root; }

    // Hand the reference to the caller (e.g. json_object_object_add, which steals it).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    static Doc object() { return Doc{json_object_new_object()}; }
    static Doc array() { return Doc{json_object_new_array()}; }
};

inline Doc parse(const std::string& text) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(),
        static_cast<int>(std::min(text.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

// Compact serialization; '/' is left unescaped so paths stay readable.
inline std::string dump(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
}

inline bool is_object(json_object* obj) { return obj && json_object_is_type(obj, json_type_object); }

// Borrowed member lookup. JSON null and absent keys both yield nullptr.
inline json_object* member(json_object* obj, const std::string& key) {
    if (!is_object(obj)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key.c_str(), &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* obj, const std::string& key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* obj, const std::string& key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(json_object* obj, const std::string& key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_array_strings(json_object* obj, const std::string& key) {
    std::vector<std::string> out;
    json_object* arr = member(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, static_cast<int>(i));
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.data(), static_cast<int>(s.size()));
}

inline void set(json_object* obj, const std::string& key, json_object* owned_value) {
    json_object_object_add(obj, key.c_str(), owned_value);
}
inline void set_string(json_object* obj, const std::string& key, const std::string& v) {
    set(obj, key, new_string(v));
}
inline void set_int(json_object* obj, const std::string& key, int64_t v) {
    set(obj, key, json_object_new_int64(v));
}
inline void set_bool(json_object* obj, const std::string& key, bool v) {
    set(obj, key, json_object_new_boolean(v ? 1 : 0));
}

inline json_object* string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) json_object_array_add(arr, new_string(s));
    return arr;
}

} // namespace opsgate::json
