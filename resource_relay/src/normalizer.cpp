#include "normalizer.hpp"
#include "relay_error.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

const char* kTokenField = "nextPageToken";

RelayError malformed(const std::string& detail) {
    return RelayError(ErrorKind::MalformedUpstreamResponse, detail);
}

nlohmann::json parse_envelope(const std::string& body) {
    nlohmann::json page;
    try {
        page = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw malformed(std::string("unable to parse upstream page: ") + e.what());
    }

    // "null" decodes to an empty envelope
    if (page.is_null()) return nlohmann::json::object();
    if (!page.is_object()) {
        throw malformed("upstream page is not a JSON object");
    }
    return page;
}

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw malformed(fmt::format("field {} is not a string", key));
    }
    return it->get<std::string>();
}

double number_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return 0.0;
    if (!it->is_number()) {
        throw malformed(fmt::format("field {} is not a number", key));
    }
    return it->get<double>();
}

const nlohmann::json& list_field(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json empty_list = nlohmann::json::array();
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return empty_list;
    if (!it->is_array()) {
        throw malformed(fmt::format("field {} is not a list", key));
    }
    return *it;
}

const nlohmann::json& entry_object(const nlohmann::json& entry) {
    static const nlohmann::json empty_object = nlohmann::json::object();
    if (entry.is_null()) return empty_object;
    if (!entry.is_object()) {
        throw malformed("list entry is not a JSON object");
    }
    return entry;
}

std::string resource_name(const std::string& full_name) {
    std::string name = util::last_path_segment(full_name);
    if (name.empty()) {
        throw RelayError(ErrorKind::InvalidResourceName, "unexpected service name: " + full_name);
    }
    return name;
}

} // namespace

void to_json(nlohmann::json& j, const MetricDescriptor& d) {
    j = nlohmann::json{
        {"valueType", d.value_type},
        {"metricKind", d.metric_kind},
        {"type", d.type},
        {"unit", d.unit},
        {"service", d.service},
        {"serviceShortName", d.service_short_name},
        {"displayName", d.display_name},
        {"description", d.description}
    };
}

void to_json(nlohmann::json& j, const SelectableValue& v) {
    j = nlohmann::json{
        {"value", v.value},
        {"label", v.label}
    };
    if (v.goal != 0.0) {
        j["goal"] = v.goal;
    }
}

const char* ItemNormalizer::kind_name(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::MetricDescriptors: return "metricDescriptors";
        case ResourceKind::Services: return "services";
        case ResourceKind::Slos: return "slo-services";
        case ResourceKind::Projects: return "projects";
    }
    return "unknown";
}

PageResult ItemNormalizer::normalize(ResourceKind kind,
                                     const std::string& body,
                                     std::vector<NormalizedItem> accumulator) {
    auto page = parse_envelope(body);

    switch (kind) {
        case ResourceKind::MetricDescriptors:
            return metric_descriptors(page, std::move(accumulator));
        case ResourceKind::Services:
            return services(page, std::move(accumulator));
        case ResourceKind::Slos:
            return slos(page, std::move(accumulator));
        case ResourceKind::Projects:
            return projects(page, std::move(accumulator));
    }
    throw RelayError(ErrorKind::InternalProcessingError, "unknown resource kind");
}

PageResult ItemNormalizer::metric_descriptors(const nlohmann::json& page, std::vector<NormalizedItem> acc) {
    for (const auto& entry : list_field(page, "metricDescriptors")) {
        const auto& raw = entry_object(entry);

        MetricDescriptor d;
        d.value_type = string_field(raw, "valueType");
        d.metric_kind = string_field(raw, "metricKind");
        d.type = string_field(raw, "type");
        d.unit = string_field(raw, "unit");
        d.display_name = string_field(raw, "displayName");
        d.description = string_field(raw, "description");

        // compute.googleapis.com/instance/cpu -> compute.googleapis.com -> compute
        d.service = d.type.substr(0, d.type.find('/'));
        d.service_short_name = d.service.substr(0, d.service.find('.'));
        if (d.display_name.empty()) {
            d.display_name = d.type;
        }

        acc.emplace_back(d);
    }

    return PageResult{std::move(acc), string_field(page, kTokenField)};
}

PageResult ItemNormalizer::services(const nlohmann::json& page, std::vector<NormalizedItem> acc) {
    for (const auto& entry : list_field(page, "services")) {
        const auto& raw = entry_object(entry);

        SelectableValue v;
        v.value = resource_name(string_field(raw, "name"));
        v.label = string_field(raw, "displayName");
        if (v.label.empty()) {
            v.label = v.value;
        }

        acc.emplace_back(v);
    }

    return PageResult{std::move(acc), string_field(page, kTokenField)};
}

PageResult ItemNormalizer::slos(const nlohmann::json& page, std::vector<NormalizedItem> acc) {
    for (const auto& entry : list_field(page, "serviceLevelObjectives")) {
        const auto& raw = entry_object(entry);

        // Label stays empty when the SLO has no display name
        SelectableValue v;
        v.value = resource_name(string_field(raw, "name"));
        v.label = string_field(raw, "displayName");
        v.goal = number_field(raw, "goal");

        acc.emplace_back(v);
    }

    return PageResult{std::move(acc), string_field(page, kTokenField)};
}

PageResult ItemNormalizer::projects(const nlohmann::json& page, std::vector<NormalizedItem> acc) {
    for (const auto& entry : list_field(page, "projects")) {
        const auto& raw = entry_object(entry);

        SelectableValue v;
        v.value = string_field(raw, "projectId");
        v.label = string_field(raw, "name");

        acc.emplace_back(v);
    }

    return PageResult{std::move(acc), string_field(page, kTokenField)};
}
