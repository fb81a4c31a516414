#include "header_map.hpp"
#include "util.hpp"
#include <algorithm>

HeaderMap::Entry* HeaderMap::find(const std::string& name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&name](const Entry& e) { return util::iequals(e.name, name); });
    return it == entries_.end() ? nullptr : &*it;
}

const HeaderMap::Entry* HeaderMap::find(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&name](const Entry& e) { return util::iequals(e.name, name); });
    return it == entries_.end() ? nullptr : &*it;
}

void HeaderMap::add(const std::string& name, const std::string& value) {
    if (Entry* entry = find(name)) {
        entry->values.push_back(value);
        return;
    }
    entries_.push_back(Entry{name, {value}});
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    if (Entry* entry = find(name)) {
        entry->values.assign(1, value);
        return;
    }
    entries_.push_back(Entry{name, {value}});
}

void HeaderMap::erase(const std::string& name) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
        [&name](const Entry& e) { return util::iequals(e.name, name); }),
        entries_.end());
}

std::string HeaderMap::get(const std::string& name) const {
    const Entry* entry = find(name);
    if (!entry || entry->values.empty()) return "";
    return entry->values.front();
}

std::vector<std::string> HeaderMap::values(const std::string& name) const {
    const Entry* entry = find(name);
    return entry ? entry->values : std::vector<std::string>{};
}

bool HeaderMap::contains(const std::string& name) const {
    return find(name) != nullptr;
}
