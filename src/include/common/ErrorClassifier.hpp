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

#ifndef SRC_COMMON_ERRORCLASSIFIER_HPP
#define SRC_COMMON_ERRORCLASSIFIER_HPP

#include "common/Error.hpp"
#include <string>
#include <ostream>

namespace ferry {

enum class ErrorKind : char {
    Network,
    Timeout,
    Cors,
    Ssl,
    NotFound,
    Auth,
    Server,
    Unknown
};

enum class Severity : char {
    Low,
    Medium,
    High
};

struct Classification {
    ErrorKind kind;
    bool retryable;
    Severity severity;
};

std::string toString(const ErrorKind& kind);
std::string toString(const Severity& severity);
std::ostream& operator<<(std::ostream& os, const ErrorKind& kind);

// Fixed retryability and severity of each kind.
Classification classify(const ErrorKind& kind);

// Maps a failure to its kind from the error code, the HTTP status and, for
// uncategorised errors, the message text.
Classification classify(const Error& error);

std::string userMessage(const ErrorKind& kind);

} // namespace ferry

#endif // SRC_COMMON_ERRORCLASSIFIER_HPP
