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
#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <thread>
#include <tuple>
#include <vector>
#include "common/Error.hpp"
#include "common/NetworkMonitor.hpp"
#include "common/RetryCoordinator.hpp"
#include "common/RetryPolicy.hpp"

using ferry::Error;
using ferry::ErrorCode;
using ferry::NetworkMonitor;
using ferry::RetryCoordinator;
using ferry::RetryPolicy;

class RetryCoordinatorTest : public ::testing::Test {
protected:
    NetworkMonitor network {};
    RetryPolicy policy {std::chrono::microseconds{100L}, std::chrono::microseconds{1000L}, 3};
    RetryCoordinator retries {"test", policy, network};

    // Fails with code the first failures calls, then succeeds.
    static std::function<std::expected<int, Error>()> failing(std::atomic<int>& calls, int failures, ErrorCode code) {
        return [&calls, failures, code]() -> std::expected<int, Error> {
            if (calls++ < failures) {
                return std::unexpected {Error {code, "flaky"}};
            }
            return 42;
        };
    }
};

TEST_F(RetryCoordinatorTest, SucceedsAfterTransientFailures) {
    std::atomic<int> calls {0};
    std::vector<int> seen;
    auto result = retries.run<int>("op", failing(calls, 2, ErrorCode::Network),
        [&seen](int attempt, std::chrono::microseconds, const Error&) { seen.push_back(attempt); });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
    EXPECT_EQ(retries.attemptCount("op"), 0);
}

TEST_F(RetryCoordinatorTest, ExhaustsAfterMaxRetries) {
    std::atomic<int> calls {0};
    auto result = retries.run<int>("op", failing(calls, 100, ErrorCode::Timeout));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(calls.load(), policy.maxRetries + 1);
    EXPECT_EQ(retries.attemptCount("op"), 0);
}

TEST_F(RetryCoordinatorTest, NonRetryableFailsImmediately) {
    std::atomic<int> calls {0};
    auto result = retries.run<int>("op", failing(calls, 100, ErrorCode::Cors));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cors);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(RetryCoordinatorTest, NotFoundStatusIsNotRetried) {
    std::atomic<int> calls {0};
    auto result = retries.run<int>("op", [&calls]() -> std::expected<int, Error> {
        calls++;
        return std::unexpected {Error {ErrorCode::HttpStatus, "missing", 404}};
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(RetryCoordinatorTest, OfflineFailsWithoutCallingWork) {
    network.setOnline(false);
    std::atomic<int> calls {0};
    auto result = retries.run<int>("op", failing(calls, 0, ErrorCode::Network));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Offline);
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(retries.attemptCount("op"), 0);
}

TEST_F(RetryCoordinatorTest, DelaysGrowExponentially) {
    std::atomic<int> calls {0};
    std::vector<std::chrono::microseconds> delays;
    auto result = retries.run<int>("op", failing(calls, 100, ErrorCode::Network),
        [&delays](int, std::chrono::microseconds d, const Error&) { delays.push_back(d); });
    ASSERT_FALSE(result.has_value());
    const std::vector<std::chrono::microseconds> expected {
        std::chrono::microseconds{100L}, std::chrono::microseconds{200L}, std::chrono::microseconds{400L}};
    EXPECT_EQ(delays, expected);
}

TEST_F(RetryCoordinatorTest, OperationsHaveIndependentBudgets) {
    std::atomic<int> a {0};
    std::atomic<int> b {0};
    auto first = retries.run<int>("a", failing(a, 100, ErrorCode::Network));
    auto second = retries.run<int>("b", failing(b, 1, ErrorCode::Network));
    EXPECT_FALSE(first.has_value());
    EXPECT_TRUE(second.has_value());
    EXPECT_EQ(a.load(), 4);
    EXPECT_EQ(b.load(), 2);
}

TEST_F(RetryCoordinatorTest, InterruptCutsBackoffShort) {
    RetryCoordinator slow {"slow", RetryPolicy {std::chrono::seconds{10}, std::chrono::seconds{10}, 3}, network};
    std::atomic<int> calls {0};
    std::atomic<bool> waiting {false};
    std::expected<int, Error> result {0};
    std::thread runner([&] {
        result = slow.run<int>("op", failing(calls, 100, ErrorCode::Network),
            [&waiting](int, std::chrono::microseconds, const Error&) { waiting = true; });
    });
    while (!waiting.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds{1L});
    }
    const auto start = std::chrono::steady_clock::now();
    slow.interrupt("op");
    runner.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{5});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Network);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(RetryCoordinatorTest, StatsCountOutstandingRetries) {
    RetryCoordinator slow {"slow", RetryPolicy {std::chrono::seconds{10}, std::chrono::seconds{10}, 3}, network};
    std::atomic<int> calls {0};
    std::atomic<bool> waiting {false};
    std::thread runner([&] {
        std::ignore = slow.run<int>("op", failing(calls, 100, ErrorCode::Network),
            [&waiting](int, std::chrono::microseconds, const Error&) { waiting = true; });
    });
    while (!waiting.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds{1L});
    }
    const auto stats = slow.stats();
    EXPECT_EQ(stats.totalRetries, 1U);
    EXPECT_EQ(stats.activeOperations, 1U);
    EXPECT_TRUE(stats.online);
    EXPECT_EQ(slow.attemptCount("op"), 1);
    slow.stop();
    runner.join();
    EXPECT_EQ(slow.stats().activeOperations, 0U);
}
