#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class ResourceKind {
    MetricDescriptors,
    Services,
    Slos,
    Projects
};

// One output row, never modified once appended
using NormalizedItem = nlohmann::json;

struct PageResult {
    std::vector<NormalizedItem> items;
    std::string continuation_token;  // empty when the listing is exhausted
};

struct MetricDescriptor {
    std::string value_type;
    std::string metric_kind;
    std::string type;
    std::string unit;
    std::string service;
    std::string service_short_name;
    std::string display_name;
    std::string description;
};

struct SelectableValue {
    std::string value;
    std::string label;
    double goal = 0.0;
};

void to_json(nlohmann::json& j, const MetricDescriptor& d);
void to_json(nlohmann::json& j, const SelectableValue& v);

class ItemNormalizer {
public:
    // Parses one upstream page and appends its rows to the accumulator.
    // Throws RelayError MalformedUpstreamResponse when the envelope does not
    // parse, InvalidResourceName when a service or SLO name has no trailing
    // segment.
    static PageResult normalize(ResourceKind kind,
                                const std::string& body,
                                std::vector<NormalizedItem> accumulator);

    static const char* kind_name(ResourceKind kind);

private:
    static PageResult metric_descriptors(const nlohmann::json& page, std::vector<NormalizedItem> acc);
    static PageResult services(const nlohmann::json& page, std::vector<NormalizedItem> acc);
    static PageResult slos(const nlohmann::json& page, std::vector<NormalizedItem> acc);
    static PageResult projects(const nlohmann::json& page, std::vector<NormalizedItem> acc);
};
