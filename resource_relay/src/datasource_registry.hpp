#pragma once

#include "upstream_client.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class SubService {
    CloudMonitoring,
    ResourceManager
};

const char* sub_service_name(SubService sub);

struct SubServiceEndpoint {
    std::string url;
    std::shared_ptr<UpstreamClient> client;
};

// One tenant's configuration: its upstream backends keyed by sub-service name
struct DatasourceInfo {
    std::string uid;
    std::map<std::string, SubServiceEndpoint> services;

    // Throws RelayError DatasourceNotFound when the sub-service is not configured
    const SubServiceEndpoint& endpoint(SubService sub) const;
};

// Read-only lookup of datasource configuration. Safe for concurrent reads.
class DatasourceRegistry {
public:
    virtual ~DatasourceRegistry() = default;

    // Throws RelayError DatasourceNotFound for an unknown uid
    virtual std::shared_ptr<const DatasourceInfo> get(const std::string& uid) const = 0;
    virtual size_t size() const = 0;
};

// Registry fixed at startup, from a JSON document or from single-datasource
// defaults.
class StaticDatasourceRegistry : public DatasourceRegistry {
public:
    using ClientFactory = std::function<std::shared_ptr<UpstreamClient>(const std::string& access_token)>;

    static constexpr const char* kDefaultUid = "default";
    static constexpr const char* kDefaultMonitoringUrl = "https://monitoring.googleapis.com";
    static constexpr const char* kDefaultResourceManagerUrl = "https://cloudresourcemanager.googleapis.com";

    explicit StaticDatasourceRegistry(std::vector<std::shared_ptr<const DatasourceInfo>> datasources);

    // {"datasources": [{"uid": "...", "access_token": "...",
    //                   "services": {"cloudmonitoring": "https://..."}}]}
    // Throws std::runtime_error on an invalid document.
    static std::unique_ptr<StaticDatasourceRegistry> from_json(const nlohmann::json& doc,
                                                               const ClientFactory& make_client);
    static std::unique_ptr<StaticDatasourceRegistry> from_file(const std::string& path,
                                                               const ClientFactory& make_client);
    static std::unique_ptr<StaticDatasourceRegistry> single(const std::string& monitoring_url,
                                                            const std::string& resource_manager_url,
                                                            std::shared_ptr<UpstreamClient> client);

    std::shared_ptr<const DatasourceInfo> get(const std::string& uid) const override;
    size_t size() const override { return datasources_.size(); }

private:
    std::map<std::string, std::shared_ptr<const DatasourceInfo>> datasources_;
};
