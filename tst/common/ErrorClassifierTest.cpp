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
#include <sstream>
#include "common/Error.hpp"
#include "common/ErrorClassifier.hpp"

using ferry::classify;
using ferry::Error;
using ferry::ErrorCode;
using ferry::ErrorKind;
using ferry::Severity;

TEST(ErrorClassifierTest, RetryabilityTable) {
    EXPECT_TRUE(classify(ErrorKind::Network).retryable);
    EXPECT_TRUE(classify(ErrorKind::Timeout).retryable);
    EXPECT_TRUE(classify(ErrorKind::Server).retryable);
    EXPECT_FALSE(classify(ErrorKind::Cors).retryable);
    EXPECT_FALSE(classify(ErrorKind::Ssl).retryable);
    EXPECT_FALSE(classify(ErrorKind::NotFound).retryable);
    EXPECT_FALSE(classify(ErrorKind::Auth).retryable);
    EXPECT_FALSE(classify(ErrorKind::Unknown).retryable);
}

TEST(ErrorClassifierTest, SeverityTable) {
    EXPECT_EQ(classify(ErrorKind::Network).severity, Severity::High);
    EXPECT_EQ(classify(ErrorKind::Timeout).severity, Severity::Medium);
    EXPECT_EQ(classify(ErrorKind::NotFound).severity, Severity::Low);
    EXPECT_EQ(classify(ErrorKind::Auth).severity, Severity::Medium);
    EXPECT_EQ(classify(ErrorKind::Server).severity, Severity::High);
}

TEST(ErrorClassifierTest, ClassifiesByCode) {
    EXPECT_EQ(classify(Error {ErrorCode::Network, "reset"}).kind, ErrorKind::Network);
    EXPECT_EQ(classify(Error {ErrorCode::Offline}).kind, ErrorKind::Network);
    EXPECT_EQ(classify(Error {ErrorCode::Timeout}).kind, ErrorKind::Timeout);
    EXPECT_EQ(classify(Error {ErrorCode::Ssl}).kind, ErrorKind::Ssl);
    EXPECT_EQ(classify(Error {ErrorCode::Cors}).kind, ErrorKind::Cors);
    EXPECT_EQ(classify(Error {ErrorCode::InvalidArg}).kind, ErrorKind::Unknown);
    EXPECT_EQ(classify(Error {ErrorCode::Cancelled}).kind, ErrorKind::Unknown);
}

TEST(ErrorClassifierTest, ClassifiesByHttpStatus) {
    EXPECT_EQ(classify(Error {ErrorCode::HttpStatus, "gone", 404}).kind, ErrorKind::NotFound);
    EXPECT_EQ(classify(Error {ErrorCode::HttpStatus, "gone", 410}).kind, ErrorKind::NotFound);
    EXPECT_EQ(classify(Error {ErrorCode::HttpStatus, "denied", 401}).kind, ErrorKind::Auth);
    EXPECT_EQ(classify(Error {ErrorCode::HttpStatus, "denied", 403}).kind, ErrorKind::Auth);
    EXPECT_EQ(classify(Error {ErrorCode::HttpStatus, "slow", 504}).kind, ErrorKind::Timeout);
    EXPECT_EQ(classify(Error {ErrorCode::HttpStatus, "broken", 502}).kind, ErrorKind::Server);
    EXPECT_EQ(classify(Error {ErrorCode::HttpStatus, "teapot", 418}).kind, ErrorKind::Unknown);
}

TEST(ErrorClassifierTest, AllEndpointsFailedUsesCause) {
    const Error server {ErrorCode::HttpStatus, "bad gateway", 502};
    const Error all {ErrorCode::AllEndpointsFailed, "all failed", server};
    const auto c = classify(all);
    EXPECT_EQ(c.kind, ErrorKind::Server);
    EXPECT_TRUE(c.retryable);
    EXPECT_EQ(all.root().status, 502);
}

TEST(ErrorClassifierTest, UnknownErrorsUseMessage) {
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "Request TIMED OUT"}).kind, ErrorKind::Timeout);
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "blocked by CORS policy"}).kind, ErrorKind::Cors);
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "SSL handshake failed"}).kind, ErrorKind::Ssl);
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "HTTP 404"}).kind, ErrorKind::NotFound);
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "HTTP 403"}).kind, ErrorKind::Auth);
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "HTTP 503"}).kind, ErrorKind::Server);
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "Failed to fetch"}).kind, ErrorKind::Network);
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "connection timeout"}).kind, ErrorKind::Timeout);
    EXPECT_EQ(classify(Error {ErrorCode::Unknown, "something odd"}).kind, ErrorKind::Unknown);
}

TEST(ErrorClassifierTest, KindsHaveNamesAndMessages) {
    std::ostringstream os;
    os << ErrorKind::NotFound;
    EXPECT_EQ(os.str(), "notfound");
    EXPECT_EQ(ferry::toString(Severity::High), "high");
    EXPECT_FALSE(ferry::userMessage(ErrorKind::Network).empty());
    EXPECT_NE(ferry::userMessage(ErrorKind::Network), ferry::userMessage(ErrorKind::Timeout));
}
