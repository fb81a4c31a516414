#include <catch2/catch_test_macros.hpp>
#include "../src/normalizer.hpp"
#include "test_helpers.hpp"

TEST_CASE("Metric descriptor normalization", "[normalizer]") {
    SECTION("Service names derived from the type") {
        nlohmann::json page = {
            {"metricDescriptors", {
                {{"type", "compute.googleapis.com/instance/cpu/usage"},
                 {"metricKind", "GAUGE"},
                 {"valueType", "DOUBLE"},
                 {"displayName", ""}}
            }}
        };

        auto result = ItemNormalizer::normalize(ResourceKind::MetricDescriptors, page.dump(), {});

        REQUIRE(result.items.size() == 1);
        const auto& d = result.items[0];
        REQUIRE(d["service"] == "compute.googleapis.com");
        REQUIRE(d["serviceShortName"] == "compute");
        REQUIRE(d["displayName"] == "compute.googleapis.com/instance/cpu/usage");
        REQUIRE(d["metricKind"] == "GAUGE");
        REQUIRE(d["valueType"] == "DOUBLE");
        REQUIRE(result.continuation_token.empty());
    }

    SECTION("Display name kept when present") {
        nlohmann::json page = {
            {"metricDescriptors", {
                {{"type", "custom.googleapis.com/queue/depth"}, {"displayName", "Queue depth"}}
            }},
            {"nextPageToken", "next-1"}
        };

        auto result = ItemNormalizer::normalize(ResourceKind::MetricDescriptors, page.dump(), {});

        REQUIRE(result.items[0]["displayName"] == "Queue depth");
        REQUIRE(result.items[0]["serviceShortName"] == "custom");
        REQUIRE(result.continuation_token == "next-1");
    }

    SECTION("Type without separators") {
        nlohmann::json page = {{"metricDescriptors", {{{"type", "plain"}}}}};

        auto result = ItemNormalizer::normalize(ResourceKind::MetricDescriptors, page.dump(), {});

        REQUIRE(result.items[0]["service"] == "plain");
        REQUIRE(result.items[0]["serviceShortName"] == "plain");
    }

    SECTION("Unknown upstream fields are dropped") {
        nlohmann::json page = {{"metricDescriptors", {{{"type", "a.b/c"}, {"labels", {1, 2}}}}}};

        auto result = ItemNormalizer::normalize(ResourceKind::MetricDescriptors, page.dump(), {});

        REQUIRE_FALSE(result.items[0].contains("labels"));
        REQUIRE(result.items[0].contains("unit"));
    }
}

TEST_CASE("Service normalization", "[normalizer]") {
    SECTION("Trailing segment becomes value and default label") {
        nlohmann::json page = {
            {"services", {{{"name", "projects/p/services/custom.svc-1"}, {"displayName", ""}}}}
        };

        auto result = ItemNormalizer::normalize(ResourceKind::Services, page.dump(), {});

        REQUIRE(result.items.size() == 1);
        REQUIRE(result.items[0] == nlohmann::json{{"value", "custom.svc-1"}, {"label", "custom.svc-1"}});
    }

    SECTION("Display name used as label") {
        nlohmann::json page = {
            {"services", {{{"name", "projects/p/services/checkout"}, {"displayName", "Checkout"}}}}
        };

        auto result = ItemNormalizer::normalize(ResourceKind::Services, page.dump(), {});

        REQUIRE(result.items[0]["label"] == "Checkout");
        REQUIRE_FALSE(result.items[0].contains("goal"));
    }

    SECTION("Name ending in a slash is rejected") {
        nlohmann::json page = {{"services", {{{"name", "projects/p/services/"}}}}};

        auto err = capture_relay_error([&] {
            ItemNormalizer::normalize(ResourceKind::Services, page.dump(), {});
        });
        REQUIRE(err.kind() == ErrorKind::InvalidResourceName);
    }

    SECTION("Empty name is rejected") {
        nlohmann::json page = {{"services", {{{"displayName", "orphan"}}}}};

        auto err = capture_relay_error([&] {
            ItemNormalizer::normalize(ResourceKind::Services, page.dump(), {});
        });
        REQUIRE(err.kind() == ErrorKind::InvalidResourceName);
    }
}

TEST_CASE("SLO normalization", "[normalizer]") {
    SECTION("Label is never defaulted from the name") {
        nlohmann::json page = {
            {"serviceLevelObjectives", {
                {{"name", "projects/p/services/s/serviceLevelObjectives/availability"},
                 {"displayName", ""},
                 {"goal", 0.999}}
            }}
        };

        auto result = ItemNormalizer::normalize(ResourceKind::Slos, page.dump(), {});

        REQUIRE(result.items[0]["value"] == "availability");
        REQUIRE(result.items[0]["label"] == "");
        REQUIRE(result.items[0]["goal"] == 0.999);
    }

    SECTION("Invalid name fails the page") {
        nlohmann::json page = {{"serviceLevelObjectives", {{{"name", "a/b/"}, {"goal", 0.9}}}}};

        auto err = capture_relay_error([&] {
            ItemNormalizer::normalize(ResourceKind::Slos, page.dump(), {});
        });
        REQUIRE(err.kind() == ErrorKind::InvalidResourceName);
    }
}

TEST_CASE("Project normalization", "[normalizer]") {
    nlohmann::json page = {
        {"projects", {
            {{"projectId", "my-project-1"}, {"name", "My Project"}},
            {{"projectId", "other"}, {"name", "Other"}}
        }},
        {"nextPageToken", "p2"}
    };

    auto result = ItemNormalizer::normalize(ResourceKind::Projects, page.dump(), {});

    REQUIRE(result.items.size() == 2);
    REQUIRE(result.items[0] == nlohmann::json{{"value", "my-project-1"}, {"label", "My Project"}});
    REQUIRE(result.items[1]["value"] == "other");
    REQUIRE(result.continuation_token == "p2");
}

TEST_CASE("Accumulator and envelope handling", "[normalizer]") {
    SECTION("Existing items stay in front") {
        std::vector<NormalizedItem> acc = {nlohmann::json{{"value", "first"}, {"label", "First"}}};
        nlohmann::json page = {{"projects", {{{"projectId", "second"}, {"name", "Second"}}}}};

        auto result = ItemNormalizer::normalize(ResourceKind::Projects, page.dump(), std::move(acc));

        REQUIRE(result.items.size() == 2);
        REQUIRE(result.items[0]["value"] == "first");
        REQUIRE(result.items[1]["value"] == "second");
    }

    SECTION("Empty envelope yields no items and no token") {
        auto result = ItemNormalizer::normalize(ResourceKind::Services, "{}", {});
        REQUIRE(result.items.empty());
        REQUIRE(result.continuation_token.empty());
    }

    SECTION("Invalid JSON is malformed") {
        auto err = capture_relay_error([] {
            ItemNormalizer::normalize(ResourceKind::Projects, "{\"projects\": [", {});
        });
        REQUIRE(err.kind() == ErrorKind::MalformedUpstreamResponse);
    }

    SECTION("Non-object envelope is malformed") {
        auto err = capture_relay_error([] {
            ItemNormalizer::normalize(ResourceKind::Projects, "[1, 2]", {});
        });
        REQUIRE(err.kind() == ErrorKind::MalformedUpstreamResponse);
    }

    SECTION("Wrong field types are malformed") {
        auto err = capture_relay_error([] {
            ItemNormalizer::normalize(ResourceKind::Services, R"({"services": "nope"})", {});
        });
        REQUIRE(err.kind() == ErrorKind::MalformedUpstreamResponse);

        auto err2 = capture_relay_error([] {
            ItemNormalizer::normalize(ResourceKind::MetricDescriptors,
                                      R"({"metricDescriptors": [{"type": 7}]})", {});
        });
        REQUIRE(err2.kind() == ErrorKind::MalformedUpstreamResponse);
    }
}
