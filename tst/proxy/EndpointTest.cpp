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
#include <set>
#include <string>
#include "proxy/Endpoint.hpp"

using ferry::EmbedMode;
using ferry::Endpoint;

TEST(EndpointTest, QueryEmbeddingEncodesTarget) {
    const Endpoint e {"q", "https://fwd.example/get?url=", EmbedMode::Query, std::chrono::milliseconds{1000L}, 10};
    EXPECT_EQ(e.forwardUrl("https://a.example/x?y=1"),
        "https://fwd.example/get?url=https%3A%2F%2Fa.example%2Fx%3Fy%3D1");
}

TEST(EndpointTest, PathEmbeddingAppendsVerbatim) {
    const Endpoint e {"p", "https://fwd.example/", EmbedMode::Path, std::chrono::milliseconds{1000L}, 10};
    EXPECT_EQ(e.forwardUrl("https://a.example/x"), "https://fwd.example/https://a.example/x");
}

TEST(EndpointTest, PlaceholderIsReplaced) {
    const Endpoint e {"t", "https://fwd.example/raw?url={target}&fmt=1", EmbedMode::Query, std::chrono::milliseconds{1000L}, 10};
    EXPECT_EQ(e.forwardUrl("https://a.example/"), "https://fwd.example/raw?url=https%3A%2F%2Fa.example%2F&fmt=1");
}

TEST(EndpointTest, DefaultEndpoints) {
    const auto endpoints = ferry::defaultEndpoints();
    ASSERT_EQ(endpoints.size(), 3U);
    std::set<std::string> names;
    for (const auto& e : endpoints) {
        names.insert(e.name);
        EXPECT_GT(e.timeout.count(), 0);
        EXPECT_GT(e.rateLimitPerMinute, 0);
        EXPECT_EQ(e.url.rfind("https://", 0), 0U);
    }
    EXPECT_EQ(names.size(), 3U);
    EXPECT_EQ(endpoints[0].name, "AllOrigins");
    EXPECT_EQ(endpoints[0].rateLimitPerMinute, 100);
    EXPECT_EQ(endpoints[1].embed, EmbedMode::Path);
    EXPECT_EQ(endpoints[2].timeout, std::chrono::milliseconds{12000L});
}
