#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;

    // Datasources
    std::string datasources_file;  // empty: single datasource from the URLs below
    std::string monitoring_url;
    std::string resource_manager_url;
    std::string access_token;
    std::string gce_metadata_url;

    // Upstream
    int upstream_timeout_ms;
    int max_pages;  // 0 = follow tokens until exhausted
    int max_decoded_bytes;  // per page after decompression, 0 = unlimited

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
