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

#include "proxy/EndpointRegistry.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ferry {

EndpointRegistry::EndpointRegistry(std::vector<Endpoint> endpoints, const CircuitPolicy policy)
    : m {},
      entries {},
      rateWindow {"rate-window"} {
    if (endpoints.empty()) {
        throw std::invalid_argument("At least one endpoint is required.");
    }
    std::set<std::string> names;
    entries.reserve(endpoints.size());
    for (auto& e : endpoints) {
        if (!names.insert(e.name).second) {
            throw std::invalid_argument("Duplicate endpoint name: " + e.name);
        }
        if (e.timeout <= std::chrono::milliseconds::zero()) {
            throw std::invalid_argument("Endpoint timeout must be > zero: " + e.name);
        }
        RateLimiter limiter {e.rateLimitPerMinute};
        CircuitBreaker circuit {e.name, policy};
        entries.push_back(Entry {std::move(e), std::move(circuit), limiter, std::chrono::steady_clock::time_point {}});
    }
}

EndpointRegistry::~EndpointRegistry() {
    stopRateWindow();
}

EndpointRegistry::Entry* EndpointRegistry::find(const std::string& name) {
    for (auto& e : entries) {
        if (e.endpoint.name == name) {
            return &e;
        }
    }
    return nullptr;
}

const EndpointRegistry::Entry* EndpointRegistry::find(const std::string& name) const {
    for (const auto& e : entries) {
        if (e.endpoint.name == name) {
            return &e;
        }
    }
    return nullptr;
}

EndpointRegistry::Entry* EndpointRegistry::select() {
    Entry* best = nullptr;
    for (auto& e : entries) {
        if (!e.circuit.allows() || !e.limiter.check()) {
            continue;
        }
        if (best == nullptr || e.lastUsed < best->lastUsed) {
            best = &e;
        }
    }
    return best;
}

void EndpointRegistry::touch(Entry& e) {
    e.lastUsed = std::chrono::steady_clock::now();
    e.limiter.record();
    e.circuit.onAttempt();
}

std::expected<Endpoint, Error> EndpointRegistry::selectEndpoint() {
    std::lock_guard lock{m};
    auto* e = select();
    if (e == nullptr) {
        return std::unexpected {Error {ErrorCode::NoEndpointsAvailable, "no forwarding endpoint is available"}};
    }
    return e->endpoint;
}

std::expected<Endpoint, Error> EndpointRegistry::acquire() {
    std::lock_guard lock{m};
    auto* e = select();
    if (e == nullptr) {
        return std::unexpected {Error {ErrorCode::NoEndpointsAvailable, "no forwarding endpoint is available"}};
    }
    touch(*e);
    return e->endpoint;
}

void EndpointRegistry::recordAttempt(const std::string& name) {
    std::lock_guard lock{m};
    if (auto* e = find(name)) {
        touch(*e);
    }
}

void EndpointRegistry::recordSuccess(const std::string& name) {
    std::lock_guard lock{m};
    if (auto* e = find(name)) {
        e->circuit.recordSuccess();
    }
}

void EndpointRegistry::recordFailure(const std::string& name) {
    std::lock_guard lock{m};
    if (auto* e = find(name)) {
        e->circuit.recordFailure();
        spdlog::debug("EndpointRegistry: {} has {} consecutive failures", name, e->circuit.consecutiveFailures());
    }
}

void EndpointRegistry::recordAbandoned(const std::string& name) {
    std::lock_guard lock{m};
    if (auto* e = find(name)) {
        e->circuit.abandonProbe();
    }
}

bool EndpointRegistry::checkRateLimit(const std::string& name) const {
    std::lock_guard lock{m};
    const auto* e = find(name);
    return e != nullptr && e->limiter.check();
}

bool EndpointRegistry::available(const std::string& name) {
    std::lock_guard lock{m};
    auto* e = find(name);
    return e != nullptr && e->circuit.allows() && e->limiter.check();
}

void EndpointRegistry::resetRateLimits() {
    std::lock_guard lock{m};
    for (auto& e : entries) {
        e.limiter.reset();
    }
    spdlog::debug("EndpointRegistry: rate windows reset");
}

void EndpointRegistry::startRateWindow(std::chrono::milliseconds window) {
    rateWindow.start(window, [this] { resetRateLimits(); });
}

void EndpointRegistry::stopRateWindow() {
    rateWindow.stop();
}

std::vector<Endpoint> EndpointRegistry::endpoints() const {
    std::lock_guard lock{m};
    std::vector<Endpoint> result;
    result.reserve(entries.size());
    for (const auto& e : entries) {
        result.push_back(e.endpoint);
    }
    return result;
}

size_t EndpointRegistry::size() const {
    std::lock_guard lock{m};
    return entries.size();
}

RegistryStats EndpointRegistry::stats() {
    std::lock_guard lock{m};
    RegistryStats s {{}, entries.size(), 0};
    for (auto& e : entries) {
        const bool avail = e.circuit.allows() && e.limiter.check();
        if (avail) {
            s.available++;
        }
        s.endpoints.push_back(EndpointStats {
            e.endpoint.name,
            e.limiter.count(),
            e.limiter.limit(),
            e.circuit.state(),
            e.circuit.consecutiveFailures()});
    }
    return s;
}

} // namespace ferry
