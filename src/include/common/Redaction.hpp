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

#ifndef SRC_COMMON_REDACTION_HPP
#define SRC_COMMON_REDACTION_HPP

#include <string>
#include <string_view>

namespace ferry {

// Replaces credential-shaped values (password=, token=, api_key=, secret=, auth*=,
// credential*=, session_id=, bearer tokens) with [REDACTED] so the text can be logged.
std::string redact(std::string_view text);

} // namespace ferry

#endif // SRC_COMMON_REDACTION_HPP
