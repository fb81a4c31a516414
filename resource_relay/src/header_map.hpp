#pragma once

#include <string>
#include <vector>

// Ordered HTTP header multimap. Names compare case-insensitively; every value
// of a repeated header is kept in arrival order under the name first seen.
class HeaderMap {
public:
    struct Entry {
        std::string name;
        std::vector<std::string> values;
    };

    void add(const std::string& name, const std::string& value);
    void set(const std::string& name, const std::string& value);
    void erase(const std::string& name);

    // First value, or an empty string when absent
    std::string get(const std::string& name) const;
    std::vector<std::string> values(const std::string& name) const;
    bool contains(const std::string& name) const;

    const std::vector<Entry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

private:
    std::vector<Entry> entries_;

    Entry* find(const std::string& name);
    const Entry* find(const std::string& name) const;
};
