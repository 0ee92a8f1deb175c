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
#include <chrono>
#include <stdexcept>
#include "common/RetryPolicy.hpp"

using ferry::RetryPolicy;

TEST(RetryPolicyTest, ValidConstruction) {
    const RetryPolicy policy(
        std::chrono::microseconds{100L},
        std::chrono::microseconds{1000L},
        3
    );
    EXPECT_EQ(policy.baseDelay, std::chrono::microseconds{100L});
    EXPECT_EQ(policy.maxDelay, std::chrono::microseconds{1000L});
    EXPECT_EQ(policy.maxRetries, 3);
}

TEST(RetryPolicyTest, ZeroRetriesIsAllowed) {
    const RetryPolicy policy(std::chrono::microseconds{0L}, std::chrono::microseconds{0L}, 0);
    EXPECT_EQ(policy.maxRetries, 0);
}

TEST(RetryPolicyTest, NegativeRetriesThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{100L}, std::chrono::microseconds{1000L}, -1),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, NegativeBaseDelayThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{-100}, std::chrono::microseconds{1000L}, 3),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, MaxDelayBelowBaseThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{1000L}, std::chrono::microseconds{100L}, 3),
        std::invalid_argument
    );
}
