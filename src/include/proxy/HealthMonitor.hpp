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

#ifndef SRC_PROXY_HEALTHMONITOR_HPP
#define SRC_PROXY_HEALTHMONITOR_HPP

#include "common/AsyncTimer.hpp"
#include "common/Error.hpp"
#include "common/NetworkMonitor.hpp"
#include "proxy/Endpoint.hpp"
#include "proxy/EndpointRegistry.hpp"
#include "proxy/HttpTransport.hpp"
#include <chrono>
#include <expected>
#include <string>
#include <variant>
#include <vector>

namespace ferry {

inline constexpr const char* kDefaultCanaryTarget = "https://httpbin.org/get";

// Periodically sends a canary request through every endpoint and feeds the outcome
// into the registry's circuit breakers, so open circuits recover without user traffic.
// Any answer marks the network online; losing it is left to the embedder's own signal.
class HealthMonitor {
public:
    HealthMonitor(EndpointRegistry& r, HttpTransport& t, NetworkMonitor& n, std::string canaryTarget);
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;
    ~HealthMonitor();

    // One canary request, not counted against the endpoint's rate budget.
    static std::expected<std::monostate, Error> probe(const Endpoint& e, HttpTransport& t, const std::string& canaryTarget);
    // Probes every endpoint at once; results are in endpoint order.
    static std::vector<std::expected<std::monostate, Error>> probeEach(
        const std::vector<Endpoint>& endpoints, HttpTransport& t, const std::string& canaryTarget);
    // Endpoints that answered the canary, in their original order.
    static std::vector<Endpoint> reachable(const std::vector<Endpoint>& endpoints, HttpTransport& t, const std::string& canaryTarget);

    void probeAll();
    void start(std::chrono::milliseconds interval);
    void stop();
private:
    EndpointRegistry& registry;
    HttpTransport& transport;
    NetworkMonitor& network;
    std::string canary;
    AsyncTimer timer;
};

} // namespace ferry

#endif // SRC_PROXY_HEALTHMONITOR_HPP
