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

#include "common/ErrorClassifier.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <string>
#include <string_view>
#include <utility>

namespace ferry {

namespace {

ErrorKind kindFromStatus(long status) {
    if (status == 404 || status == 410) {
        return ErrorKind::NotFound;
    }
    if (status == 401 || status == 403) {
        return ErrorKind::Auth;
    }
    if (status == 408 || status == 504) {
        return ErrorKind::Timeout;
    }
    if (status >= 500 && status < 600) {
        return ErrorKind::Server;
    }
    return ErrorKind::Unknown;
}

ErrorKind kindFromMessage(std::string_view what) {
    const auto msg = ferry_to_lower(what);
    if (ferry_contains(msg, "timeout") || ferry_contains(msg, "timed out")) {
        return ErrorKind::Timeout;
    }
    if (ferry_contains(msg, "cors") || ferry_contains(msg, "cross-origin")) {
        return ErrorKind::Cors;
    }
    if (ferry_contains(msg, "ssl") || ferry_contains(msg, "certificate")) {
        return ErrorKind::Ssl;
    }
    if (ferry_contains(msg, "404")) {
        return ErrorKind::NotFound;
    }
    if (ferry_contains(msg, "403") || ferry_contains(msg, "401")) {
        return ErrorKind::Auth;
    }
    if (ferry_contains(msg, "500") || ferry_contains(msg, "502") || ferry_contains(msg, "503")) {
        return ErrorKind::Server;
    }
    if (ferry_contains(msg, "failed to fetch") || ferry_contains(msg, "connection") || ferry_contains(msg, "network")) {
        return ErrorKind::Network;
    }
    return ErrorKind::Unknown;
}

ErrorKind kindOf(const Error& error) {
    switch (error.code) {
        case ErrorCode::Network:
        case ErrorCode::Offline:
            return ErrorKind::Network;
        case ErrorCode::Timeout:
            return ErrorKind::Timeout;
        case ErrorCode::Cors:
            return ErrorKind::Cors;
        case ErrorCode::Ssl:
            return ErrorKind::Ssl;
        case ErrorCode::NotFound:
            return ErrorKind::NotFound;
        case ErrorCode::HttpStatus:
            return kindFromStatus(error.status);
        case ErrorCode::AllEndpointsFailed:
            return error.cause ? kindOf(*error.cause) : ErrorKind::Unknown;
        case ErrorCode::Unknown:
            return kindFromMessage(error.what);
        case ErrorCode::OK:
        case ErrorCode::InvalidArg:
        case ErrorCode::UnsafeTarget:
        case ErrorCode::NoEndpointsAvailable:
        case ErrorCode::ResponseTooLarge:
        case ErrorCode::Cancelled:
        case ErrorCode::InvalidState:
            return ErrorKind::Unknown;
    }
    std::unreachable();
}

} // namespace

std::string toString(const ErrorKind& kind) {
    switch (kind) {
        case ErrorKind::Network: return "network";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Cors: return "cors";
        case ErrorKind::Ssl: return "ssl";
        case ErrorKind::NotFound: return "notfound";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Server: return "server";
        case ErrorKind::Unknown: return "unknown";
    }
    std::unreachable();
}

std::string toString(const Severity& severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
    }
    std::unreachable();
}

std::ostream& operator<<(std::ostream& os, const ErrorKind& kind) {
    os << toString(kind);
    return os;
}

Classification classify(const ErrorKind& kind) {
    switch (kind) {
        case ErrorKind::Network: return {kind, true, Severity::High};
        case ErrorKind::Timeout: return {kind, true, Severity::Medium};
        case ErrorKind::Cors: return {kind, false, Severity::High};
        case ErrorKind::Ssl: return {kind, false, Severity::High};
        case ErrorKind::NotFound: return {kind, false, Severity::Low};
        case ErrorKind::Auth: return {kind, false, Severity::Medium};
        case ErrorKind::Server: return {kind, true, Severity::High};
        case ErrorKind::Unknown: return {kind, false, Severity::Medium};
    }
    std::unreachable();
}

Classification classify(const Error& error) {
    return classify(kindOf(error));
}

std::string userMessage(const ErrorKind& kind) {
    switch (kind) {
        case ErrorKind::Network: return "Network connection failed, check your connection and try again";
        case ErrorKind::Timeout: return "The request timed out, try again later";
        case ErrorKind::Cors: return "The cross-origin request was blocked, use a forwarding endpoint";
        case ErrorKind::Ssl: return "Certificate verification failed, confirm the site is trustworthy";
        case ErrorKind::NotFound: return "The requested resource does not exist";
        case ErrorKind::Auth: return "Access was denied, check your permissions";
        case ErrorKind::Server: return "The server failed, try again later";
        case ErrorKind::Unknown: return "An unknown error occurred, try again later";
    }
    std::unreachable();
}

} // namespace ferry
