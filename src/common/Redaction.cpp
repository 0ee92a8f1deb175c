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

#include "common/Redaction.hpp"
#include <regex>
#include <string>
#include <string_view>

namespace ferry {

std::string redact(std::string_view text) {
    static const std::regex keyValue {
        R"(((?:password|passwd|pwd|token|access_token|api[_-]?key|key|secret|auth\w*|credential\w*|session_id)\s*[=:]\s*)([^&\s"';,]+))",
        std::regex::icase};
    static const std::regex bearer {R"((bearer\s+)[A-Za-z0-9._~+/=-]+)", std::regex::icase};
    auto result = std::regex_replace(std::string{text}, keyValue, "$1[REDACTED]");
    return std::regex_replace(result, bearer, "$1[REDACTED]");
}

} // namespace ferry
