#pragma once
// Small JSON reader for config files and library snapshot payloads.
// Handles objects, arrays, strings (with \uXXXX escapes, BMP only), numbers,
// booleans and null. Numbers keep both an integer and a floating view; the
// integer view is only valid when `integral` is set.

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

namespace mini {

struct Value;
using Object = std::unordered_map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
    enum class Type { String, Number, Bool, Null, Object, Array } type{Type::Null};
    std::string str;
    int64_t number{0};
    double real{0.0};
    bool integral{false};
    bool boolean{false};
    Object object;
    Array array;
};

// Deeper documents are rejected instead of recursing further.
constexpr int kMaxDepth = 64;

inline void skip_ws(const std::string& s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
}

inline void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline bool parse_string(const std::string& s, size_t& i, std::string& out) {
    if (i >= s.size() || s[i] != '"') return false;
    i++; out.clear();
    while (i < s.size()) {
        char c = s[i++];
        if (c == '\\') {
            if (i >= s.size()) return false;
            char esc = s[i++];
            switch (esc) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    if (i + 4 > s.size()) return false;
                    unsigned cp = 0;
                    for (int k = 0; k < 4; ++k) {
                        char h = s[i++];
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
                        else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
                        else return false;
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: out.push_back(esc); break; // \" \\ \/
            }
        } else if (c == '"') {
            return true;
        } else {
            out.push_back(c);
        }
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out, int depth); // fwd
inline bool parse_array(const std::string& s, size_t& i, Array& out, int depth);

inline bool parse_number(const std::string& s, size_t& i, Value& out) {
    size_t start = i;
    bool fractional = false;
    while (i < s.size()) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+') {
            i++;
        } else if (c == '.' || c == 'e' || c == 'E') {
            fractional = true;
            i++;
        } else break;
    }
    const std::string text = s.substr(start, i - start);
    const char* first = text.c_str();
    const char* last = first + text.size();
    char* end = nullptr;
    out.real = std::strtod(first, &end);
    if (end != last) return false;
    out.type = Value::Type::Number;
    out.integral = false;
    out.number = 0;
    if (!fractional) {
        errno = 0;
        long long n = std::strtoll(first, &end, 10);
        if (end == last && errno != ERANGE) {
            out.number = static_cast<int64_t>(n);
            out.integral = true;
        }
    }
    return true;
}

inline bool parse_value(const std::string& s, size_t& i, Value& out, int depth = 0) {
    skip_ws(s, i);
    if (i >= s.size()) return false;
    if (s[i] == '"') {
        out.type = Value::Type::String;
        return parse_string(s, i, out.str);
    }
    if (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '-') {
        return parse_number(s, i, out);
    }
    if (s.compare(i, 4, "true") == 0) {
        out.type = Value::Type::Bool; out.boolean = true; i += 4; return true;
    }
    if (s.compare(i, 5, "false") == 0) {
        out.type = Value::Type::Bool; out.boolean = false; i += 5; return true;
    }
    if (s.compare(i, 4, "null") == 0) {
        out.type = Value::Type::Null; i += 4; return true;
    }
    if (s[i] == '{') {
        out.type = Value::Type::Object;
        return parse_object(s, i, out.object, depth + 1);
    }
    if (s[i] == '[') {
        out.type = Value::Type::Array;
        return parse_array(s, i, out.array, depth + 1);
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out, int depth) {
    if (depth > kMaxDepth) return false;
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '{') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != '}') {
        std::string key;
        if (!parse_string(s, i, key)) return false;
        skip_ws(s, i);
        if (i >= s.size() || s[i] != ':') return false;
        i++;
        Value v;
        if (!parse_value(s, i, v, depth)) return false;
        out[key] = std::move(v);
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') { i++; skip_ws(s, i); }
        else if (i < s.size() && s[i] != '}') return false;
    }
    if (i < s.size() && s[i] == '}') { i++; return true; }
    return false;
}

inline bool parse_array(const std::string& s, size_t& i, Array& out, int depth) {
    if (depth > kMaxDepth) return false;
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '[') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != ']') {
        Value v;
        if (!parse_value(s, i, v, depth)) return false;
        out.push_back(std::move(v));
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') { i++; skip_ws(s, i); }
        else if (i < s.size() && s[i] != ']') return false;
    }
    if (i < s.size() && s[i] == ']') { i++; return true; }
    return false;
}

// Whole-document parse: trailing non-whitespace is rejected.
inline bool parse(const std::string& s, Value& out) {
    size_t i = 0;
    if (!parse_value(s, i, out)) return false;
    skip_ws(s, i);
    return i == s.size();
}

inline bool parse(const std::string& s, Object& out) {
    Value v;
    if (!parse(s, v) || v.type != Value::Type::Object) return false;
    out = std::move(v.object);
    return true;
}

inline bool parse(const std::string& s, Array& out) {
    Value v;
    if (!parse(s, v) || v.type != Value::Type::Array) return false;
    out = std::move(v.array);
    return true;
}

// Field accessors; return false when the key is absent, has another type, or
// (for numbers) is not an integer that fits the target.
inline bool get_string(const Object& o, const char* key, std::string& out) {
    auto it = o.find(key);
    if (it == o.end() || it->second.type != Value::Type::String) return false;
    out = it->second.str;
    return true;
}

inline bool get_int(const Object& o, const char* key, int& out) {
    auto it = o.find(key);
    if (it == o.end() || it->second.type != Value::Type::Number || !it->second.integral) return false;
    const int64_t n = it->second.number;
    if (n < INT_MIN || n > INT_MAX) return false;
    out = static_cast<int>(n);
    return true;
}

inline bool get_bool(const Object& o, const char* key, bool& out) {
    auto it = o.find(key);
    if (it == o.end() || it->second.type != Value::Type::Bool) return false;
    out = it->second.boolean;
    return true;
}

// Identifiers arrive as strings or bare numbers depending on the publisher.
inline bool get_id(const Object& o, const char* key, std::string& out) {
    auto it = o.find(key);
    if (it == o.end()) return false;
    if (it->second.type == Value::Type::String) {
        out = it->second.str;
        return !out.empty();
    }
    if (it->second.type == Value::Type::Number && it->second.integral) {
        out = std::to_string(it->second.number);
        return true;
    }
    return false;
}

} // namespace mini
