#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace util {
    using QueryValues = std::map<std::string, std::vector<std::string>>;

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim, size_t max_parts = 0);
    std::string to_lower(const std::string& str);
    bool iequals(const std::string& a, const std::string& b);

    // Text after the last '/', or the whole string when there is none
    std::string last_path_segment(const std::string& name);

    std::string query_escape(const std::string& value);
    std::optional<std::string> query_unescape(const std::string& value);

    // Pairs with malformed escapes are dropped
    QueryValues parse_query(const std::string& raw_query);
    // Keys sorted, values in insertion order
    std::string encode_query(const QueryValues& values);
}
