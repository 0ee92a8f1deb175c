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
#include <map>
#include <string>
#include "proxy/ContentSanitizer.hpp"

using ferry::containsCredentials;
using ferry::sanitizeContent;
using ferry::sanitizeHeaders;
using ferry::sanitizeHeaderValue;

namespace {

size_t hitsFor(const ferry::SanitizeReport& report, const std::string& pattern) {
    for (const auto& h : report.hits) {
        if (h.pattern == pattern) {
            return h.count;
        }
    }
    return 0;
}

} // namespace

TEST(ContentSanitizerTest, CleanMarkupIsUntouched) {
    const std::string html = "<html><body><p>Hello</p></body></html>";
    const auto report = sanitizeContent(html);
    EXPECT_FALSE(report.modified);
    EXPECT_EQ(report.sanitized, html);
    EXPECT_TRUE(report.hits.empty());
}

TEST(ContentSanitizerTest, MasksCredentials) {
    const auto report = sanitizeContent("<a href=\"/x?token=abc123&Api_Key=k-1\">x</a> Bearer xyz.789");
    EXPECT_TRUE(report.modified);
    EXPECT_EQ(report.sanitized, "<a href=\"/x?token=***&Api_Key=***\">x</a> Bearer ***.789");
    EXPECT_EQ(hitsFor(report, "token"), 1U);
    EXPECT_EQ(hitsFor(report, "api_key"), 1U);
    EXPECT_EQ(hitsFor(report, "bearer"), 1U);
}

TEST(ContentSanitizerTest, RemovesScripts) {
    const auto report = sanitizeContent("a<SCRIPT type=\"x\">alert(1)</script>b<script>x()</Script>c<scripted>");
    EXPECT_TRUE(report.modified);
    EXPECT_EQ(report.sanitized, "abc<scripted>");
    EXPECT_EQ(hitsFor(report, "script tags"), 2U);
}

TEST(ContentSanitizerTest, NeutralisesLinksAndHandlers) {
    const auto report = sanitizeContent("<a href=\"JavaScript:go()\" onclick=\"go()\">go</a>");
    EXPECT_TRUE(report.modified);
    EXPECT_EQ(report.sanitized, "<a href=\"javascript-blocked:go()\" on-event-blocked=\"go()\">go</a>");
    EXPECT_EQ(hitsFor(report, "javascript protocol"), 1U);
    EXPECT_EQ(hitsFor(report, "event handlers"), 1U);
}

TEST(ContentSanitizerTest, DetectsCredentials) {
    EXPECT_TRUE(containsCredentials("password=hunter2"));
    EXPECT_TRUE(containsCredentials("session_id: abc"));
    EXPECT_FALSE(containsCredentials("nothing to see"));
}

TEST(ContentSanitizerTest, KeepsOnlyAllowedHeaders) {
    const std::map<std::string, std::string> headers {
        {"Accept-Language", " en-US "},
        {"Authorization", "Bearer secret"},
        {"Cookie", "a=b"},
        {"Referer", "https://a.example/"}
    };
    const auto cleaned = sanitizeHeaders(headers);
    ASSERT_EQ(cleaned.size(), 2U);
    EXPECT_EQ(cleaned.at("Accept-Language"), "en-US");
    EXPECT_EQ(cleaned.at("Referer"), "https://a.example/");
}

TEST(ContentSanitizerTest, HeaderValuesAreCleaned) {
    EXPECT_EQ(sanitizeHeaderValue("a\r\nb\tc"), "abc");
    EXPECT_EQ(sanitizeHeaderValue(std::string(2000, 'x')).size(), 1000U);
}
