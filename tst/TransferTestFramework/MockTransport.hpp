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

#ifndef TST_TRANSFERTESTFRAMEWORK_MOCKTRANSPORT_HPP
#define TST_TRANSFERTESTFRAMEWORK_MOCKTRANSPORT_HPP

#include <gmock/gmock.h>
#include <expected>
#include <string>
#include "common/Error.hpp"
#include "proxy/HttpTransport.hpp"

namespace ferry::test {

class MockTransport : public HttpTransport {
public:
    MOCK_METHOD((std::expected<HttpResponse, Error>), get, (const HttpRequest& request), (override));
};

inline HttpResponse ok(std::string body, std::string contentType = "application/json") {
    return HttpResponse {200, std::move(body), std::move(contentType), std::nullopt, ""};
}

inline HttpResponse status(long code) {
    return HttpResponse {code, "", "text/plain", std::nullopt, ""};
}

} // namespace ferry::test

#endif // TST_TRANSFERTESTFRAMEWORK_MOCKTRANSPORT_HPP
