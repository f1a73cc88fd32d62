#include "chaosbox/core/errors.hpp"
#include "chaosbox/network/toxiproxy_client.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

using chaosbox::core::ProxyProvisioningError;
using chaosbox::network::ToxicSpec;
using chaosbox::network::ToxiproxyClient;
using chaosbox::testing::TestDirectory;

/**
 * Replaces curl with a shell script that records its arguments and prints
 * a canned body followed by the status line, as `curl -w '\n%{http_code}'`
 * would.
 */
class ToxiproxyClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        script_ = dir_.Path() / "fake-curl";
        std::ofstream out(script_);
        out << "#!/bin/sh\n"
            << "printf '%s\\n' \"$@\" >> '" << (dir_.Path() / "calls.log").string() << "'\n"
            << "cat '" << (dir_.Path() / "response").string() << "'\n";
        out.close();
        std::filesystem::permissions(script_, std::filesystem::perms::owner_all);
    }

    void Respond(const std::string& body, int status) {
        std::ofstream out(dir_.Path() / "response");
        out << body << "\n" << status;
    }

    std::string Calls() const {
        std::ifstream in(dir_.Path() / "calls.log");
        std::stringstream content;
        content << in.rdbuf();
        return content.str();
    }

    ToxiproxyClient Client() const {
        return ToxiproxyClient("http://toxiproxy:8474/", script_.string());
    }

    TestDirectory dir_{"chaosbox_toxiproxy_test"};
    std::filesystem::path script_;
};

TEST_F(ToxiproxyClientTest, CreateProxyPostsDefinition) {
    Respond(R"({"name":"chaosbox_proxy_j1"})", 201);

    EXPECT_NO_THROW(Client().CreateProxy("chaosbox_proxy_j1", "0.0.0.0:20000", "httpbin.org:80"));

    std::string calls = Calls();
    EXPECT_NE(calls.find("POST\n"), std::string::npos);
    EXPECT_NE(calls.find("http://toxiproxy:8474/proxies\n"), std::string::npos);
    EXPECT_NE(calls.find("\"listen\":\"0.0.0.0:20000\""), std::string::npos);
    EXPECT_NE(calls.find("\"upstream\":\"httpbin.org:80\""), std::string::npos);
}

TEST_F(ToxiproxyClientTest, CreateProxyConflictRaises) {
    Respond("proxy already exists", 409);

    EXPECT_THROW(Client().CreateProxy("p", "0.0.0.0:20000", "httpbin.org:80"),
                 ProxyProvisioningError);
}

TEST_F(ToxiproxyClientTest, AddToxicSendsAttributes) {
    Respond("{}", 200);

    ToxicSpec toxic;
    toxic.type = "latency";
    toxic.attributes["latency"] = 300;
    Client().AddToxic("chaosbox_proxy_j1", toxic);

    std::string calls = Calls();
    EXPECT_NE(calls.find("http://toxiproxy:8474/proxies/chaosbox_proxy_j1/toxics"),
              std::string::npos);
    EXPECT_NE(calls.find("\"attributes\":{\"latency\":300}"), std::string::npos);
    EXPECT_NE(calls.find("\"stream\":\"downstream\""), std::string::npos);

    Respond("bad toxic", 400);
    EXPECT_THROW(Client().AddToxic("chaosbox_proxy_j1", toxic), ProxyProvisioningError);
}

TEST_F(ToxiproxyClientTest, DeleteProxyDistinguishesMissing) {
    Respond("", 204);
    EXPECT_TRUE(Client().DeleteProxy("p"));

    Respond("proxy not found", 404);
    EXPECT_FALSE(Client().DeleteProxy("p"));

    EXPECT_NE(Calls().find("DELETE\n"), std::string::npos);
}

TEST_F(ToxiproxyClientTest, ListProxiesReadsObjectKeys) {
    Respond(R"({"chaosbox_proxy_a": {}, "other": {}})", 200);

    auto names = Client().ListProxies();
    EXPECT_EQ(names, (std::vector<std::string>{"chaosbox_proxy_a", "other"}));

    Respond("not json", 200);
    EXPECT_TRUE(Client().ListProxies().empty());
}

TEST(ToxiproxyClientUnreachableTest, MissingCurlBinaryIsNotSuccess) {
    ToxiproxyClient client("http://localhost:8474", "/nonexistent/curl");
    EXPECT_FALSE(client.DeleteProxy("p"));
    EXPECT_THROW(client.CreateProxy("p", "0.0.0.0:1", "x:80"), ProxyProvisioningError);
}
