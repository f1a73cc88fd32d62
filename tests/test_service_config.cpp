#include "chaosbox/core/errors.hpp"
#include "chaosbox/core/service_config.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <fstream>

using chaosbox::core::ServiceConfig;
using chaosbox::core::ValidationError;
using chaosbox::testing::TestDirectory;

TEST(ServiceConfigTest, DefaultsMatchSandboxConstants) {
    ServiceConfig config;

    EXPECT_EQ(config.executor.python_image, "python-sandbox:latest");
    EXPECT_EQ(config.executor.javascript_image, "node:20-slim");
    EXPECT_EQ(config.executor.wall_clock_limit, std::chrono::seconds(10));
    EXPECT_EQ(config.network.advertised_host, "host.docker.internal");
    EXPECT_EQ(config.network.port_range_start, 20000);
    EXPECT_EQ(config.network.port_range_end, 20999);
    EXPECT_EQ(config.network.default_upstream, "httpbin.org:80");
    EXPECT_EQ(config.toxiproxy_api_url, "http://localhost:8474");
    EXPECT_EQ(config.retention, std::chrono::seconds(3600));
    EXPECT_NO_THROW(config.Validate());
}

TEST(ServiceConfigTest, ParsesNestedSections) {
    ServiceConfig config = ServiceConfig::FromJsonString(R"({
        "images": {"python": "python:3.12-slim"},
        "temp_root": "/var/tmp/cb",
        "toxiproxy": {
            "api_url": "http://toxiproxy:8474",
            "advertised_host": "172.17.0.1",
            "port_range": [21000, 21009]
        },
        "retention_seconds": 60,
        "verbose": true,
        "unknown_key": {"ignored": true}
    })");

    EXPECT_EQ(config.executor.python_image, "python:3.12-slim");
    EXPECT_EQ(config.executor.javascript_image, "node:20-slim");
    EXPECT_EQ(config.executor.temp_root, std::filesystem::path("/var/tmp/cb"));
    EXPECT_EQ(config.toxiproxy_api_url, "http://toxiproxy:8474");
    EXPECT_EQ(config.network.advertised_host, "172.17.0.1");
    EXPECT_EQ(config.network.listen_host, "0.0.0.0");
    EXPECT_EQ(config.network.port_range_start, 21000);
    EXPECT_EQ(config.network.port_range_end, 21009);
    EXPECT_EQ(config.retention, std::chrono::seconds(60));
    EXPECT_TRUE(config.verbose);
}

TEST(ServiceConfigTest, IllTypedValuesAreRejected) {
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"images": "python"})"), ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"images": {"python": 3}})"), ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"retention_seconds": "1h"})"),
                 ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"verbose": "yes"})"), ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"toxiproxy": {"port_range": [1]}})"),
                 ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString("[1, 2]"), ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString("{not json"), ValidationError);
}

TEST(ServiceConfigTest, InconsistentValuesFailValidation) {
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"toxiproxy": {"port_range": [20100, 20000]}})"),
                 ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"toxiproxy": {"port_range": [0, 10]}})"),
                 ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"retention_seconds": 0})"), ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"images": {"javascript": ""}})"),
                 ValidationError);
    EXPECT_THROW(ServiceConfig::FromJsonString(R"({"docker_binary": ""})"), ValidationError);
}

TEST(ServiceConfigTest, FileRoundTripsThroughSerializedForm) {
    TestDirectory dir("chaosbox_config_test");

    ServiceConfig original;
    original.executor.python_image = "custom-python:1";
    original.network.port_range_start = 25000;
    original.network.port_range_end = 25010;
    original.retention = std::chrono::seconds(120);

    auto path = dir.Path() / "chaosbox.json";
    {
        std::ofstream out(path);
        out << original.ToJsonString();
    }

    ServiceConfig loaded = ServiceConfig::FromFile(path);
    EXPECT_EQ(loaded.executor.python_image, "custom-python:1");
    EXPECT_EQ(loaded.network.port_range_start, 25000);
    EXPECT_EQ(loaded.network.port_range_end, 25010);
    EXPECT_EQ(loaded.retention, std::chrono::seconds(120));

    EXPECT_THROW(ServiceConfig::FromFile(dir.Path() / "missing.json"), ValidationError);
}
