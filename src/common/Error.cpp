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

#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <memory>
#include <proto/ferry.pb.h>

namespace ferry {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::UnsafeTarget: return "UnsafeTarget";
        case ErrorCode::NoEndpointsAvailable: return "NoEndpointsAvailable";
        case ErrorCode::AllEndpointsFailed: return "AllEndpointsFailed";
        case ErrorCode::Network: return "Network";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Ssl: return "Ssl";
        case ErrorCode::Cors: return "Cors";
        case ErrorCode::HttpStatus: return "HttpStatus";
        case ErrorCode::ResponseTooLarge: return "ResponseTooLarge";
        case ErrorCode::Offline: return "Offline";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, status {0}, cause {} {}
Error::Error(const ErrorCode& c, std::string w, long s) : code {c}, what {std::move(w)}, status {s}, cause {} {}
Error::Error(const ErrorCode& c, std::string w, const Error& underlying)
    : code {c},
      what {std::move(w)},
      status {underlying.status},
      cause {std::make_shared<const Error>(underlying)} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, status {0}, cause {} {}

Error::Error(const proto::ErrorDetails& details)
    : code {static_cast<ErrorCode>(details.code())},
      what {details.what()},
      status {static_cast<long>(details.status())},
      cause {} {
    if (details.has_cause()) {
        cause = std::make_shared<const Error>(details.cause());
    }
}

const Error& Error::root() const {
    const Error* e = this;
    while (e->cause) {
        e = e->cause.get();
    }
    return *e;
}

} // namespace ferry
