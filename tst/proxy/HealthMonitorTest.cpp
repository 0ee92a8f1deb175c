// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Ferry a resilient forwarding and transfer-scheduling service.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include "common/Error.hpp"
#include "common/NetworkMonitor.hpp"
#include "common/RetryCoordinator.hpp"
#include "common/RetryPolicy.hpp"
#include "proxy/CircuitBreaker.hpp"
#include "proxy/Dispatcher.hpp"
#include "proxy/Endpoint.hpp"
#include "proxy/EndpointRegistry.hpp"
#include "proxy/HealthMonitor.hpp"
#include "TransferTestFramework/FakeTransport.hpp"
#include "TransferTestFramework/MockTransport.hpp"

using ferry::CircuitBreaker;
using ferry::CircuitPolicy;
using ferry::Dispatcher;
using ferry::EmbedMode;
using ferry::Endpoint;
using ferry::EndpointRegistry;
using ferry::Error;
using ferry::ErrorCode;
using ferry::ForwardResponse;
using ferry::HealthMonitor;
using ferry::HttpRequest;
using ferry::HttpResponse;
using ferry::NetworkMonitor;
using ferry::RetryCoordinator;
using ferry::RetryPolicy;
using ferry::test::FakeTransport;
using ferry::test::MockTransport;
using ferry::test::ok;
using ferry::test::status;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::StartsWith;

using Result = std::expected<HttpResponse, Error>;

namespace {

const std::string kCanary = "https://canary.example/get";

Endpoint endpoint(const std::string& name) {
    return Endpoint {name, "https://" + name + ".example/?u=", EmbedMode::Query, std::chrono::milliseconds{8000L}, 1};
}

} // namespace

class HealthMonitorTest : public ::testing::Test {
protected:
    EndpointRegistry registry {{endpoint("a"), endpoint("b")}, CircuitPolicy {1, std::chrono::seconds{60}}};
    ::testing::NiceMock<MockTransport> transport;
    NetworkMonitor network {};
    HealthMonitor monitor {registry, transport, network, kCanary};
};

TEST_F(HealthMonitorTest, ProbeUsesShortTimeoutAndCanary) {
    EXPECT_CALL(transport, get(_)).WillOnce([](const HttpRequest& r) {
        EXPECT_EQ(r.url, "https://a.example/?u=https%3A%2F%2Fcanary.example%2Fget");
        EXPECT_EQ(r.timeout, std::chrono::milliseconds{5000L});
        EXPECT_EQ(r.headers.at("User-Agent"), "Ferry/1.0 ConnectivityTest");
        return Result {ok("{}")};
    });
    EXPECT_TRUE(HealthMonitor::probe(endpoint("a"), transport, kCanary).has_value());
}

TEST_F(HealthMonitorTest, ProbeAllFeedsCircuits) {
    EXPECT_CALL(transport, get(Field(&HttpRequest::url, StartsWith("https://a.example"))))
        .WillOnce(Return(Result {status(500)}));
    EXPECT_CALL(transport, get(Field(&HttpRequest::url, StartsWith("https://b.example"))))
        .WillOnce(Return(Result {ok("{}")}));
    monitor.probeAll();
    const auto stats = registry.stats();
    EXPECT_EQ(stats.endpoints[0].circuit, CircuitBreaker::State::Open);
    EXPECT_EQ(stats.endpoints[1].circuit, CircuitBreaker::State::Closed);
    EXPECT_TRUE(network.online());
}

TEST_F(HealthMonitorTest, ProbesDoNotConsumeRateBudget) {
    EXPECT_CALL(transport, get(_)).WillRepeatedly(Return(Result {ok("{}")}));
    monitor.probeAll();
    monitor.probeAll();
    EXPECT_TRUE(registry.checkRateLimit("a"));
    EXPECT_EQ(registry.stats().endpoints[0].requests, 0);
}

TEST_F(HealthMonitorTest, SilentRoundDoesNotMarkOffline) {
    EXPECT_CALL(transport, get(_))
        .WillRepeatedly(Return(Result {std::unexpected {Error {ErrorCode::Network, "could not resolve host"}}}));
    monitor.probeAll();
    EXPECT_TRUE(network.online());
}

TEST_F(HealthMonitorTest, AnyAnswerRestoresOnline) {
    network.setOnline(false);
    EXPECT_CALL(transport, get(Field(&HttpRequest::url, StartsWith("https://a.example"))))
        .WillOnce(Return(Result {std::unexpected {Error {ErrorCode::Timeout, "timed out"}}}));
    EXPECT_CALL(transport, get(Field(&HttpRequest::url, StartsWith("https://b.example"))))
        .WillOnce(Return(Result {status(503)}));
    monitor.probeAll();
    EXPECT_TRUE(network.online());
}

TEST(HealthMonitorRecoveryTest, TrafficResumesAfterSilentRound) {
    EndpointRegistry registry {{endpoint("a"), endpoint("b")}, CircuitPolicy {3, std::chrono::seconds{60}}};
    ::testing::NiceMock<MockTransport> transport;
    NetworkMonitor network {};
    HealthMonitor monitor {registry, transport, network, kCanary};
    Dispatcher dispatcher {registry, transport, network};
    RetryCoordinator retries {"request", RetryPolicy {std::chrono::microseconds{10L}, std::chrono::microseconds{100L}, 2}, network};

    ON_CALL(transport, get(_))
        .WillByDefault(Return(Result {std::unexpected {Error {ErrorCode::Timeout, "timed out"}}}));
    monitor.probeAll();
    ASSERT_TRUE(network.online());

    ON_CALL(transport, get(_)).WillByDefault(Return(Result {ok("hello")}));
    const std::function<std::expected<ForwardResponse, Error>()> work = [&dispatcher] {
        return dispatcher.forward("https://site.example/");
    };
    auto result = retries.run<ForwardResponse>("fetch", work);
    ASSERT_TRUE(result.has_value()) << result.error().what;
    EXPECT_EQ(result->response.body, "hello");
}

TEST(HealthMonitorConcurrencyTest, OneSlowEndpointDoesNotDelayTheOthers) {
    EndpointRegistry registry {{endpoint("slow"), endpoint("fast")}, CircuitPolicy {3, std::chrono::seconds{60}}};
    std::mutex m;
    std::condition_variable cv;
    bool fastAnswered = false;
    FakeTransport transport {[&](const HttpRequest& r) -> Result {
        std::unique_lock lock{m};
        if (r.url.starts_with("https://slow.example")) {
            // Only answers once the other canary has gone through.
            if (!cv.wait_for(lock, std::chrono::seconds{2}, [&] { return fastAnswered; })) {
                return std::unexpected {Error {ErrorCode::Timeout, "timed out"}};
            }
            return ok("{}");
        }
        fastAnswered = true;
        cv.notify_all();
        return ok("{}");
    }};
    NetworkMonitor network {};
    HealthMonitor monitor {registry, transport, network, kCanary};
    monitor.probeAll();
    const auto stats = registry.stats();
    EXPECT_EQ(stats.endpoints[0].consecutiveFailures, 0);
    EXPECT_EQ(stats.endpoints[1].consecutiveFailures, 0);
}

TEST_F(HealthMonitorTest, ReachableDropsFailingEndpoints) {
    EXPECT_CALL(transport, get(Field(&HttpRequest::url, StartsWith("https://a.example"))))
        .WillOnce(Return(Result {std::unexpected {Error {ErrorCode::Timeout, "timed out"}}}));
    EXPECT_CALL(transport, get(Field(&HttpRequest::url, StartsWith("https://b.example"))))
        .WillOnce(Return(Result {ok("{}")}));
    const auto reachable = HealthMonitor::reachable({endpoint("a"), endpoint("b")}, transport, kCanary);
    ASSERT_EQ(reachable.size(), 1U);
    EXPECT_EQ(reachable[0].name, "b");
}
