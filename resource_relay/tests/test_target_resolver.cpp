#include <catch2/catch_test_macros.hpp>
#include "../src/target_resolver.hpp"
#include "test_helpers.hpp"
#include <cstdio>
#include <fstream>
#include <memory>

TEST_CASE("Forward target derivation", "[resolver]") {
    SECTION("First path segment is dropped") {
        auto target = TargetResolver::get_target("/services/v3/projects/p/services");
        REQUIRE(target.path == "/v3/projects/p/services");
        REQUIRE(target.query.empty());
    }

    SECTION("Query is carried over") {
        auto target = TargetResolver::get_target("/metricDescriptors/v3/projects/p/metricDescriptors?filter=a%20b");
        REQUIRE(target.path == "/v3/projects/p/metricDescriptors");
        REQUIRE(target.query == "filter=a%20b");
    }

    SECTION("Projects route maps to the resource manager listing") {
        REQUIRE(TargetResolver::get_target("/projects").path == "/v1/projects");
        REQUIRE(TargetResolver::get_target("/projects?pageSize=5").query == "pageSize=5");
    }

    SECTION("Trailing slash keeps an empty remainder") {
        REQUIRE(TargetResolver::get_target("/services/").path == "/");
    }

    SECTION("Service segment is required") {
        for (const std::string path : {"/services", "/", ""}) {
            INFO("path " << path);
            auto err = capture_relay_error([&] { TargetResolver::get_target(path); });
            REQUIRE(err.kind() == ErrorKind::MissingServiceSegment);
            REQUIRE(err.status() == 400);
        }
    }
}

TEST_CASE("Request resolution against a datasource", "[resolver]") {
    auto client = std::make_shared<FakeUpstreamClient>();
    auto registry = StaticDatasourceRegistry::single("https://monitoring.example.com",
                                                     "http://localhost:9000", client);

    SECTION("Cloud monitoring") {
        auto request = RelayRequest::from_target("/services/v3/projects/p/services?pageSize=3");
        auto chosen = TargetResolver::resolve(request, *registry, "default", SubService::CloudMonitoring);

        REQUIRE(chosen == client);
        REQUIRE(request.url() == "https://monitoring.example.com/v3/projects/p/services?pageSize=3");
    }

    SECTION("Resource manager") {
        auto request = RelayRequest::from_target("/projects");
        TargetResolver::resolve(request, *registry, "default", SubService::ResourceManager);

        REQUIRE(request.url() == "http://localhost:9000/v1/projects");
    }

    SECTION("Unknown datasource") {
        auto request = RelayRequest::from_target("/services/v3/x");
        auto err = capture_relay_error([&] {
            TargetResolver::resolve(request, *registry, "other", SubService::CloudMonitoring);
        });
        REQUIRE(err.kind() == ErrorKind::DatasourceNotFound);
    }

    SECTION("Invalid backend URL") {
        auto broken = StaticDatasourceRegistry::single("not a url", "", client);
        auto request = RelayRequest::from_target("/services/v3/x");
        auto err = capture_relay_error([&] {
            TargetResolver::resolve(request, *broken, "default", SubService::CloudMonitoring);
        });
        REQUIRE(err.kind() == ErrorKind::DatasourceNotFound);
    }
}

TEST_CASE("Datasource registry loading", "[registry]") {
    int created = 0;
    auto factory = [&created](const std::string&) -> std::shared_ptr<UpstreamClient> {
        created++;
        return std::make_shared<FakeUpstreamClient>();
    };

    SECTION("Missing services fall back to the public endpoints") {
        nlohmann::json doc = {{"datasources", {{{"uid", "a"}}}}};
        auto registry = StaticDatasourceRegistry::from_json(doc, factory);

        REQUIRE(registry->size() == 1);
        REQUIRE(created == 1);
        auto info = registry->get("a");
        REQUIRE(info->endpoint(SubService::CloudMonitoring).url == "https://monitoring.googleapis.com");
        REQUIRE(info->endpoint(SubService::ResourceManager).url ==
                "https://cloudresourcemanager.googleapis.com");
    }

    SECTION("Configured endpoints override the defaults") {
        nlohmann::json doc = {{"datasources", {
            {{"uid", "a"}, {"services", {{"resourcemanager", "http://rm.local"}}}}
        }}};
        auto registry = StaticDatasourceRegistry::from_json(doc, factory);

        REQUIRE(registry->get("a")->endpoint(SubService::ResourceManager).url == "http://rm.local");
    }

    SECTION("Invalid documents are rejected") {
        REQUIRE_THROWS_AS(StaticDatasourceRegistry::from_json(nlohmann::json::object(), factory),
                          std::runtime_error);
        REQUIRE_THROWS_AS(StaticDatasourceRegistry::from_json(
                              {{"datasources", {{{"access_token", "x"}}}}}, factory),
                          std::runtime_error);
        REQUIRE_THROWS_AS(StaticDatasourceRegistry::from_json(
                              {{"datasources", {{{"uid", "a"}, {"services", "x"}}}}}, factory),
                          std::runtime_error);
        REQUIRE_THROWS_AS(StaticDatasourceRegistry::from_json(
                              {{"datasources", {{{"uid", "a"}}, {{"uid", "a"}}}}}, factory),
                          std::runtime_error);
    }

    SECTION("Loaded from a file") {
        const std::string path = "test_datasources.json";
        {
            std::ofstream out(path);
            out << R"({"datasources": [{"uid": "file-ds", "access_token": "t"}]})";
        }
        auto registry = StaticDatasourceRegistry::from_file(path, factory);
        std::remove(path.c_str());

        REQUIRE(registry->get("file-ds")->uid == "file-ds");
        REQUIRE_THROWS_AS(StaticDatasourceRegistry::from_file("missing-datasources.json", factory),
                          std::runtime_error);
    }

    SECTION("Unknown sub-service") {
        DatasourceInfo info;
        info.uid = "bare";
        auto err = capture_relay_error([&] { info.endpoint(SubService::CloudMonitoring); });
        REQUIRE(err.kind() == ErrorKind::DatasourceNotFound);
    }
}
