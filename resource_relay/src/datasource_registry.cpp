#include "datasource_registry.hpp"
#include "relay_error.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

const char* sub_service_name(SubService sub) {
    switch (sub) {
        case SubService::CloudMonitoring: return "cloudmonitoring";
        case SubService::ResourceManager: return "resourcemanager";
    }
    return "unknown";
}

const SubServiceEndpoint& DatasourceInfo::endpoint(SubService sub) const {
    auto it = services.find(sub_service_name(sub));
    if (it == services.end()) {
        throw RelayError(ErrorKind::DatasourceNotFound,
                         fmt::format("sub-service {} is not configured for datasource {}",
                                     sub_service_name(sub), uid));
    }
    return it->second;
}

StaticDatasourceRegistry::StaticDatasourceRegistry(std::vector<std::shared_ptr<const DatasourceInfo>> datasources) {
    for (auto& ds : datasources) {
        if (!datasources_.emplace(ds->uid, ds).second) {
            throw std::runtime_error("Duplicate datasource uid: " + ds->uid);
        }
    }
}

std::unique_ptr<StaticDatasourceRegistry> StaticDatasourceRegistry::from_json(const nlohmann::json& doc,
                                                                              const ClientFactory& make_client) {
    if (!doc.is_object() || !doc.contains("datasources") || !doc["datasources"].is_array()) {
        throw std::runtime_error("Datasource config must contain a \"datasources\" list");
    }

    std::vector<std::shared_ptr<const DatasourceInfo>> datasources;
    for (const auto& entry : doc["datasources"]) {
        try {
            auto info = std::make_shared<DatasourceInfo>();
            info->uid = entry.at("uid").get<std::string>();
            if (info->uid.empty()) {
                throw std::runtime_error("empty uid");
            }

            auto client = make_client(entry.value("access_token", ""));
            std::map<std::string, std::string> urls = {
                {sub_service_name(SubService::CloudMonitoring), kDefaultMonitoringUrl},
                {sub_service_name(SubService::ResourceManager), kDefaultResourceManagerUrl}
            };
            if (entry.contains("services")) {
                const auto& services = entry.at("services");
                if (!services.is_object()) {
                    throw std::runtime_error("services of " + info->uid + " must be an object");
                }
                for (const auto& [name, url] : services.items()) {
                    urls[name] = url.get<std::string>();
                }
            }
            for (const auto& [name, url] : urls) {
                info->services[name] = SubServiceEndpoint{url, client};
            }

            datasources.push_back(std::move(info));
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid datasource entry: ") + e.what());
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(std::string("Invalid datasource entry: ") + e.what());
        }
    }

    spdlog::info("Loaded {} datasource(s)", datasources.size());
    return std::make_unique<StaticDatasourceRegistry>(std::move(datasources));
}

std::unique_ptr<StaticDatasourceRegistry> StaticDatasourceRegistry::from_file(const std::string& path,
                                                                              const ClientFactory& make_client) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open datasource config " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse datasource config " + path + ": " + e.what());
    }
    return from_json(doc, make_client);
}

std::unique_ptr<StaticDatasourceRegistry> StaticDatasourceRegistry::single(const std::string& monitoring_url,
                                                                           const std::string& resource_manager_url,
                                                                           std::shared_ptr<UpstreamClient> client) {
    auto info = std::make_shared<DatasourceInfo>();
    info->uid = kDefaultUid;
    info->services[sub_service_name(SubService::CloudMonitoring)] = SubServiceEndpoint{monitoring_url, client};
    info->services[sub_service_name(SubService::ResourceManager)] = SubServiceEndpoint{resource_manager_url, client};

    std::vector<std::shared_ptr<const DatasourceInfo>> datasources{info};
    return std::make_unique<StaticDatasourceRegistry>(std::move(datasources));
}

std::shared_ptr<const DatasourceInfo> StaticDatasourceRegistry::get(const std::string& uid) const {
    auto it = datasources_.find(uid);
    if (it == datasources_.end()) {
        throw RelayError(ErrorKind::DatasourceNotFound, "unknown datasource " + uid);
    }
    return it->second;
}
