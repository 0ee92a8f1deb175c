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

#ifndef SRC_PROXY_RATELIMITER_HPP
#define SRC_PROXY_RATELIMITER_HPP

namespace ferry {

// Per-endpoint request counter for the current rate window. Not synchronized; the
// owning registry serializes access.
class RateLimiter {
public:
    explicit RateLimiter(int limitPerWindow);
    // Pure read: true while another request fits in the window.
    [[nodiscard]] bool check() const;
    void record();
    void reset();
    [[nodiscard]] int count() const;
    [[nodiscard]] int limit() const;
private:
    int requests;
    int max;
};

} // namespace ferry

#endif // SRC_PROXY_RATELIMITER_HPP
