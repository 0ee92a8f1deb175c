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

#include "proxy/RateLimiter.hpp"
#include <stdexcept>

namespace ferry {

RateLimiter::RateLimiter(int limitPerWindow)
    : requests {0},
      max {limitPerWindow} {
    if (limitPerWindow <= 0) {
        throw std::invalid_argument("Rate limit must be > zero.");
    }
}

bool RateLimiter::check() const {
    return requests < max;
}

void RateLimiter::record() {
    requests++;
}

void RateLimiter::reset() {
    requests = 0;
}

int RateLimiter::count() const {
    return requests;
}

int RateLimiter::limit() const {
    return max;
}

} // namespace ferry
