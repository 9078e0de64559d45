/**
 * @file test_http_client.cpp
 * @brief Unit tests for CurlHttpClient against loopback listeners
 *
 * Tests cover:
 * - Transport failure classification (refused connection, timeout)
 * - Status, content type and body capture
 * - Response ordering within a batch
 * - Liveness and system-info probing over the real transport
 */

#include <gtest/gtest.h>
#include <ubnt/core/http_prober.hpp>
#include <ubnt/core/liveness_checker.hpp>
#include <ubnt/net/http_client.hpp>
#include <ubnt/utils/logger.hpp>

#include "fixtures/loopback_http_server.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace ubnt;
using namespace std::chrono_literals;
using ubnt::fixtures::LoopbackHttpServer;
using ubnt::fixtures::closedLoopbackPort;
using ubnt::fixtures::httpReply;

namespace {

const char* const UDM_SYSTEM_JSON =
    R"({"hardware": {"shortname": "UDMPROSE"}, "name": "UDM Pro SE", "mac": "245A4CDD6616"})";

net::HttpRequest requestFor(const std::string& url) {
    net::HttpRequest request;
    request.url = url;
    request.connect_timeout = 1000ms;
    request.total_timeout = 2000ms;
    return request;
}

std::string urlFor(uint16_t port, const std::string& path = "/api/system") {
    return "http://127.0.0.1:" + std::to_string(port) + path;
}

}  // namespace

class CurlHttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::DEBUG);
        client_ = std::make_shared<net::CurlHttpClient>();
        ASSERT_TRUE(client_->isInitialized());
    }

    void TearDown() override {
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    std::shared_ptr<core::HttpProber> plainHttpProber() {
        core::ProbeConfig config;
        config.scheme = "http";
        config.connect_timeout = 1000ms;
        config.total_timeout = 2000ms;
        return std::make_shared<core::HttpProber>(client_, config);
    }

    std::shared_ptr<net::CurlHttpClient> client_;
};

// =============================================================================
// Transport Failures
// =============================================================================

TEST_F(CurlHttpClientTest, RefusedConnectionIsConnectFailed) {
    net::HttpResponse response = client_->perform(requestFor(urlFor(closedLoopbackPort())));

    EXPECT_FALSE(response.received());
    EXPECT_EQ(response.error, net::TransportError::CONNECT_FAILED);
    EXPECT_EQ(response.status, 0);
    EXPECT_FALSE(response.error_message.empty());
}

TEST_F(CurlHttpClientTest, SilentServerTimesOut) {
    LoopbackHttpServer server("", LoopbackHttpServer::Mode::SILENT);

    net::HttpRequest request = requestFor(urlFor(server.port()));
    request.total_timeout = 300ms;

    auto start = std::chrono::steady_clock::now();
    net::HttpResponse response = client_->perform(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(response.error, net::TransportError::TIMEOUT);
    EXPECT_GE(elapsed, 250ms);
    EXPECT_LT(elapsed, 3s);
}

// =============================================================================
// Responses
// =============================================================================

TEST_F(CurlHttpClientTest, CapturesStatusOnly) {
    LoopbackHttpServer server(httpReply(401, "Unauthorized"));

    net::HttpResponse response = client_->perform(requestFor(urlFor(server.port())));

    EXPECT_TRUE(response.received());
    EXPECT_EQ(response.status, 401);
    EXPECT_TRUE(response.body.empty());
}

TEST_F(CurlHttpClientTest, CapturesContentTypeAndBody) {
    LoopbackHttpServer server(httpReply(200, "OK", "application/json; charset=utf-8",
                                        UDM_SYSTEM_JSON));

    net::HttpResponse response = client_->perform(requestFor(urlFor(server.port())));

    ASSERT_TRUE(response.received());
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.content_type, "application/json; charset=utf-8");
    EXPECT_EQ(response.body, UDM_SYSTEM_JSON);
}

TEST_F(CurlHttpClientTest, BatchResponsesFollowRequestOrder) {
    LoopbackHttpServer ok(httpReply(200, "OK", "text/plain", "fine"));
    LoopbackHttpServer locked(httpReply(401, "Unauthorized"));
    const uint16_t closed = closedLoopbackPort();

    std::vector<net::HttpRequest> requests = {
        requestFor(urlFor(locked.port())),
        requestFor(urlFor(closed)),
        requestFor(urlFor(ok.port())),
        requestFor(urlFor(locked.port(), "/proxy/protect/api")),
    };

    auto responses = client_->performAll(requests);

    ASSERT_EQ(responses.size(), 4u);
    EXPECT_EQ(responses[0].status, 401);
    EXPECT_EQ(responses[1].error, net::TransportError::CONNECT_FAILED);
    EXPECT_EQ(responses[2].status, 200);
    EXPECT_EQ(responses[2].body, "fine");
    EXPECT_EQ(responses[3].status, 401);
}

TEST_F(CurlHttpClientTest, EmptyBatch) {
    EXPECT_TRUE(client_->performAll({}).empty());
}

// =============================================================================
// Probing Over The Real Transport
// =============================================================================

TEST_F(CurlHttpClientTest, RefusedHostIsNotAlive) {
    core::LivenessChecker checker(plainHttpProber());
    EXPECT_FALSE(checker.isAlive("127.0.0.1:" + std::to_string(closedLoopbackPort())));
}

TEST_F(CurlHttpClientTest, UnauthorizedHostIsAlive) {
    LoopbackHttpServer server(httpReply(401, "Unauthorized"));

    core::LivenessChecker checker(plainHttpProber());
    EXPECT_TRUE(checker.isAlive(server.address()));
    EXPECT_GE(server.connections(), 1);
}

TEST_F(CurlHttpClientTest, SystemInfoSucceedsOverHttp) {
    LoopbackHttpServer server(httpReply(200, "OK", "application/json", UDM_SYSTEM_JSON));

    core::SystemInfoResult result = plainHttpProber()->probeSystemInfo(server.address());

    ASSERT_EQ(result.outcome, core::ProbeOutcome::SUCCESS);
    EXPECT_EQ(result.http_status, 200);
    EXPECT_EQ(result.info.platform, std::optional<std::string>("UDMPROSE"));
    EXPECT_EQ(result.info.hostname, std::optional<std::string>("UDM-Pro-SE"));
    EXPECT_EQ(result.info.hw_addr, std::optional<std::string>("24:5a:4c:dd:66:16"));
}

TEST_F(CurlHttpClientTest, SilentHostIsUnreachable) {
    LoopbackHttpServer server("", LoopbackHttpServer::Mode::SILENT);

    core::ProbeConfig config;
    config.scheme = "http";
    config.connect_timeout = 300ms;
    config.total_timeout = 300ms;
    core::HttpProber prober(client_, config);

    EXPECT_EQ(prober.probeSystemInfo(server.address()).outcome,
              core::ProbeOutcome::UNREACHABLE);
}
