#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace util {

std::string trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) start++;

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) end--;

    return std::string(start, end);
}

std::vector<std::string> split(const std::string& str, char delim, size_t max_parts) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        if (max_parts != 0 && tokens.size() + 1 == max_parts) {
            tokens.push_back(str.substr(start));
            break;
        }
        size_t pos = str.find(delim, start);
        if (pos == std::string::npos) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string last_path_segment(const std::string& name) {
    size_t pos = name.rfind('/');
    if (pos == std::string::npos) return name;
    return name.substr(pos + 1);
}

std::string query_escape(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> query_unescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= value.size()) return std::nullopt;
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

QueryValues parse_query(const std::string& raw_query) {
    QueryValues values;
    for (const auto& pair : split(raw_query, '&')) {
        if (pair.empty()) continue;

        std::string key = pair;
        std::string value;
        size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            key = pair.substr(0, eq);
            value = pair.substr(eq + 1);
        }

        auto decoded_key = query_unescape(key);
        auto decoded_value = query_unescape(value);
        if (!decoded_key || !decoded_value) continue;

        values[*decoded_key].push_back(*decoded_value);
    }
    return values;
}

std::string encode_query(const QueryValues& values) {
    std::string out;
    for (const auto& [key, vals] : values) {
        std::string escaped_key = query_escape(key);
        for (const auto& v : vals) {
            if (!out.empty()) out += '&';
            out += escaped_key + "=" + query_escape(v);
        }
    }
    return out;
}

} // namespace util
