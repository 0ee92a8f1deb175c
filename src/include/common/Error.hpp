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

#ifndef SRC_COMMON_ERROR_HPP
#define SRC_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <memory>
#include <proto/ferry.pb.h>

namespace ferry {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    UnsafeTarget = 2,
    NoEndpointsAvailable = 3,
    AllEndpointsFailed = 4,
    Network = 5,
    Timeout = 6,
    Ssl = 7,
    Cors = 8,
    HttpStatus = 9,
    ResponseTooLarge = 10,
    Offline = 11,
    Cancelled = 12,
    NotFound = 13,
    InvalidState = 14,
    Unknown = 128
};

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    // HTTP status of the response that caused the error, 0 when no response was received.
    long status;
    // Last underlying error of an AllEndpointsFailed.
    std::shared_ptr<const Error> cause;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, long s);
    Error(const ErrorCode& c, std::string w, const Error& underlying);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& details);

    [[nodiscard]] const Error& root() const;
};

} // namespace ferry

#endif // SRC_COMMON_ERROR_HPP
