#include "chaosbox/core/errors.hpp"
#include "chaosbox/network/network_fault_controller.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>

using chaosbox::core::ProxyProvisioningError;
using chaosbox::core::Scenario;
using chaosbox::network::NetworkFaultConfig;
using chaosbox::network::NetworkFaultController;
using chaosbox::network::ProxyHandle;
using chaosbox::network::ProxyLease;
using chaosbox::testing::FakeProxyApi;

class NetworkFaultControllerTest : public ::testing::Test {
protected:
    FakeProxyApi api_;
    NetworkFaultController controller_{api_};

    static Scenario LatencyScenario() {
        Scenario scenario;
        scenario.network_latency_ms = 300;
        return scenario;
    }
};

TEST_F(NetworkFaultControllerTest, ProvisionCreatesNamedProxyWithDefaultUpstream) {
    ProxyHandle handle = controller_.Provision("job-1", LatencyScenario());

    EXPECT_EQ(handle.name, "chaosbox_proxy_job-1");
    EXPECT_EQ(handle.listen_port, 20000);
    EXPECT_EQ(handle.advertised_host, "host.docker.internal");
    EXPECT_EQ(handle.ProxyUrl(), "http://host.docker.internal:20000");

    auto proxies = api_.Proxies();
    ASSERT_EQ(proxies.count("chaosbox_proxy_job-1"), 1u);
    EXPECT_EQ(proxies["chaosbox_proxy_job-1"].listen, "0.0.0.0:20000");
    EXPECT_EQ(proxies["chaosbox_proxy_job-1"].upstream, "httpbin.org:80");
    EXPECT_EQ(controller_.LiveProxyCount(), 1u);

    controller_.Teardown(handle);
    EXPECT_TRUE(api_.Proxies().empty());
    EXPECT_EQ(controller_.LiveProxyCount(), 0u);
}

TEST_F(NetworkFaultControllerTest, ToxicsAttachedInLatencyBandwidthTimeoutOrder) {
    Scenario scenario;
    scenario.timeout_ms = 5000;
    scenario.bandwidth_kbps = 64;
    scenario.network_latency_ms = 250;
    scenario.upstream = "example.com:443";

    ProxyHandle handle = controller_.Provision("job-2", scenario);

    auto toxics = api_.Toxics();
    ASSERT_EQ(toxics.size(), 3u);
    EXPECT_EQ(toxics[0].second.type, "latency");
    EXPECT_EQ(toxics[0].second.attributes.at("latency"), 250);
    EXPECT_EQ(toxics[1].second.type, "bandwidth");
    EXPECT_EQ(toxics[1].second.attributes.at("rate"), 64);
    EXPECT_EQ(toxics[2].second.type, "timeout");
    EXPECT_EQ(toxics[2].second.attributes.at("timeout"), 5000);

    EXPECT_EQ(api_.Proxies()[handle.name].upstream, "example.com:443");
    controller_.Teardown(handle);
}

TEST_F(NetworkFaultControllerTest, UpstreamOnlyScenarioCreatesProxyWithoutToxics) {
    Scenario scenario;
    scenario.upstream = "example.com:80";

    ProxyLease lease = controller_.Acquire("job-3", scenario);
    EXPECT_TRUE(lease.Active());
    EXPECT_TRUE(api_.Toxics().empty());
}

TEST_F(NetworkFaultControllerTest, StaleProxyIsReplaced) {
    api_.Seed("chaosbox_proxy_job-4");

    ProxyHandle handle = controller_.Provision("job-4", LatencyScenario());
    EXPECT_EQ(api_.Proxies()[handle.name].upstream, "httpbin.org:80");
    controller_.Teardown(handle);
}

TEST_F(NetworkFaultControllerTest, ToxicFailureRemovesHalfBuiltProxy) {
    api_.fail_toxic_type = "bandwidth";

    Scenario scenario;
    scenario.network_latency_ms = 100;
    scenario.bandwidth_kbps = 10;

    EXPECT_THROW(controller_.Provision("job-5", scenario), ProxyProvisioningError);
    EXPECT_TRUE(api_.Proxies().empty());
    EXPECT_EQ(controller_.LiveProxyCount(), 0u);

    // The port is free again
    api_.fail_toxic_type.clear();
    ProxyHandle handle = controller_.Provision("job-6", scenario);
    EXPECT_EQ(handle.listen_port, 20001);
    controller_.Teardown(handle);
}

TEST_F(NetworkFaultControllerTest, CreateFailureReleasesPort) {
    api_.fail_create = true;
    EXPECT_THROW(controller_.Provision("job-7", LatencyScenario()), ProxyProvisioningError);
    EXPECT_EQ(controller_.LiveProxyCount(), 0u);
}

TEST_F(NetworkFaultControllerTest, TeardownSwallowsDeletionErrors) {
    ProxyHandle handle = controller_.Provision("job-8", LatencyScenario());

    api_.throw_on_delete = true;
    EXPECT_NO_THROW(controller_.Teardown(handle));
    EXPECT_EQ(controller_.LiveProxyCount(), 0u);
}

TEST_F(NetworkFaultControllerTest, ConcurrentJobsGetDistinctPorts) {
    constexpr int kJobs = 16;
    std::vector<ProxyHandle> handles(kJobs);
    std::vector<std::thread> threads;

    for (int i = 0; i < kJobs; ++i) {
        threads.emplace_back([this, i, &handles] {
            handles[i] = controller_.Provision("job-c" + std::to_string(i), LatencyScenario());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<int> ports;
    for (const auto& handle : handles) {
        ports.insert(handle.listen_port);
    }
    EXPECT_EQ(ports.size(), static_cast<std::size_t>(kJobs));
    EXPECT_EQ(controller_.LiveProxyCount(), static_cast<std::size_t>(kJobs));

    for (const auto& handle : handles) {
        controller_.Teardown(handle);
    }
    EXPECT_EQ(controller_.LiveProxyCount(), 0u);
}

TEST_F(NetworkFaultControllerTest, ExhaustedRangeRaisesProvisioningError) {
    NetworkFaultConfig config;
    config.port_range_start = 30000;
    config.port_range_end = 30001;
    NetworkFaultController small(api_, config);

    ProxyLease a = small.Acquire("a", LatencyScenario());
    ProxyLease b = small.Acquire("b", LatencyScenario());
    EXPECT_THROW(small.Acquire("c", LatencyScenario()), ProxyProvisioningError);

    b.Release();
    ProxyLease c = small.Acquire("c", LatencyScenario());
    EXPECT_EQ(c.Handle().listen_port, 30001);
}

TEST_F(NetworkFaultControllerTest, SecondProxyForSameJobIsRejected) {
    ProxyLease first = controller_.Acquire("job-9", LatencyScenario());
    EXPECT_THROW(controller_.Provision("job-9", LatencyScenario()), ProxyProvisioningError);
    EXPECT_EQ(api_.Proxies().count("chaosbox_proxy_job-9"), 1u);
}

TEST_F(NetworkFaultControllerTest, LeaseTearsDownExactlyOnce) {
    {
        ProxyLease lease = controller_.Acquire("job-10", LatencyScenario());
        ProxyLease moved = std::move(lease);
        EXPECT_FALSE(lease.Active());
        EXPECT_TRUE(moved.Active());
        EXPECT_EQ(controller_.LiveProxyCount(), 1u);
    }

    EXPECT_EQ(controller_.LiveProxyCount(), 0u);

    int teardown_deletes = 0;
    for (const auto& name : api_.Deletes()) {
        if (name == "chaosbox_proxy_job-10") {
            ++teardown_deletes;
        }
    }
    // One stale-check delete plus one teardown delete
    EXPECT_EQ(teardown_deletes, 2);
}

TEST_F(NetworkFaultControllerTest, PurgeRemovesOnlyUnownedPrefixedProxies) {
    api_.Seed("chaosbox_proxy_left-over");
    api_.Seed("someone_elses_proxy");
    ProxyLease lease = controller_.Acquire("job-11", LatencyScenario());

    EXPECT_EQ(controller_.PurgeStaleProxies(), 1u);

    auto proxies = api_.Proxies();
    EXPECT_EQ(proxies.count("chaosbox_proxy_left-over"), 0u);
    EXPECT_EQ(proxies.count("someone_elses_proxy"), 1u);
    EXPECT_EQ(proxies.count("chaosbox_proxy_job-11"), 1u);
}

TEST_F(NetworkFaultControllerTest, ProxyEnvironmentSetsBothVariables) {
    ProxyHandle handle;
    handle.advertised_host = "host.docker.internal";
    handle.listen_port = 20042;

    auto env = NetworkFaultController::ProxyEnvironment(handle);
    EXPECT_EQ(env.at("HTTP_PROXY"), "http://host.docker.internal:20042");
    EXPECT_EQ(env.at("HTTPS_PROXY"), "http://host.docker.internal:20042");
}
