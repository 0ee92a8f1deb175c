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

#ifndef SRC_PROXY_ENDPOINTREGISTRY_HPP
#define SRC_PROXY_ENDPOINTREGISTRY_HPP

#include "common/AsyncTimer.hpp"
#include "common/Error.hpp"
#include "proxy/CircuitBreaker.hpp"
#include "proxy/Endpoint.hpp"
#include "proxy/RateLimiter.hpp"
#include <chrono>
#include <expected>
#include <mutex>
#include <string>
#include <vector>

namespace ferry {

struct EndpointStats {
    std::string name;
    int requests;
    int limit;
    CircuitBreaker::State circuit;
    int consecutiveFailures;
};

struct RegistryStats {
    std::vector<EndpointStats> endpoints;
    size_t total;
    size_t available;
};

// Owns the endpoints with their circuit and rate state. Every mutation goes through
// one mutex so concurrent dispatchers never interleave a select and its record.
class EndpointRegistry {
public:
    EndpointRegistry(std::vector<Endpoint> endpoints, const CircuitPolicy policy);
    EndpointRegistry(const EndpointRegistry&) = delete;
    EndpointRegistry& operator=(const EndpointRegistry&) = delete;
    ~EndpointRegistry();

    // Least recently used endpoint that is neither circuit-open nor over budget.
    std::expected<Endpoint, Error> selectEndpoint();
    // selectEndpoint followed by recordAttempt, under one lock.
    std::expected<Endpoint, Error> acquire();

    void recordAttempt(const std::string& name);
    void recordSuccess(const std::string& name);
    void recordFailure(const std::string& name);
    // The attempt was abandoned by its caller; it counts as neither success nor failure.
    void recordAbandoned(const std::string& name);
    [[nodiscard]] bool checkRateLimit(const std::string& name) const;
    [[nodiscard]] bool available(const std::string& name);
    void resetRateLimits();

    void startRateWindow(std::chrono::milliseconds window);
    void stopRateWindow();

    [[nodiscard]] std::vector<Endpoint> endpoints() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] RegistryStats stats();
private:
    struct Entry {
        Endpoint endpoint;
        CircuitBreaker circuit;
        RateLimiter limiter;
        std::chrono::steady_clock::time_point lastUsed;
    };
    Entry* find(const std::string& name);
    const Entry* find(const std::string& name) const;
    Entry* select();
    void touch(Entry& e);

    mutable std::mutex m;
    std::vector<Entry> entries;
    AsyncTimer rateWindow;
};

} // namespace ferry

#endif // SRC_PROXY_ENDPOINTREGISTRY_HPP
