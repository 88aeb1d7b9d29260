#pragma once

// json_mini.h
//
// Small helpers over json-c object trees. The pipeline config is one
// json-c tree shared by the registry, the scheduler and every task, so the
// helpers work on borrowed json_object* nodes rather than on strings.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace stagehand::json_mini {

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
};

// Strict parse: trailing garbage or a tokenizer error yields an empty Doc.
inline Doc parse(const std::string& json, std::string* err = nullptr) {
    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (err) *err = "json_tokener_new failed";
        return Doc{};
    }
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = static_cast<size_t>(json_tokener_get_parse_end(tok));
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (err) *err = json_tokener_error_desc(jerr);
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            if (err) *err = "unexpected data after JSON document";
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline Doc parse_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path.string());
    std::stringstream ss;
    ss << f.rdbuf();
    std::string err;
    Doc d = parse(ss.str(), &err);
    if (!d) throw std::runtime_error("invalid JSON in " + path.string() + ": " + err);
    return d;
}

inline bool is_object(json_object* o) {
    return o && json_object_is_type(o, json_type_object);
}

// Borrowed reference to obj[key], nullptr when absent or obj is not an object.
inline json_object* member(json_object* obj, const std::string& key) {
    if (!is_object(obj)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key.c_str(), &v)) return nullptr;
    return v;
}

inline bool has_key(json_object* obj, const std::string& key) {
    if (!is_object(obj)) return false;
    return json_object_object_get_ex(obj, key.c_str(), nullptr) != 0;
}

inline std::optional<std::string> get_string(json_object* obj, const std::string& key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
}

inline std::optional<bool> get_bool(json_object* obj, const std::string& key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::optional<int64_t> get_int(json_object* obj, const std::string& key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

// obj[key] as an object, created empty when absent. Returns nullptr when the
// existing value is not an object.
inline json_object* ensure_object(json_object* obj, const std::string& key) {
    if (!is_object(obj)) return nullptr;
    json_object* v = member(obj, key);
    if (!v || json_object_is_type(v, json_type_null)) {
        v = json_object_new_object();
        json_object_object_add(obj, key.c_str(), v);
        return v;
    }
    return json_object_is_type(v, json_type_object) ? v : nullptr;
}

inline void set_string(json_object* obj, const std::string& key, const std::string& value) {
    json_object_object_add(obj, key.c_str(),
        json_object_new_string_len(value.c_str(), static_cast<int>(value.size())));
}

inline void set_bool(json_object* obj, const std::string& key, bool value) {
    json_object_object_add(obj, key.c_str(), json_object_new_boolean(value ? 1 : 0));
}

inline void set_null(json_object* obj, const std::string& key) {
    json_object_object_add(obj, key.c_str(), nullptr);
}

inline std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

inline std::vector<std::string> keys(json_object* obj) {
    std::vector<std::string> out;
    if (!is_object(obj)) return out;
    json_object_object_foreach(obj, k, v) {
        (void)v;
        out.emplace_back(k);
    }
    return out;
}

} // namespace stagehand::json_mini
