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

#include "proxy/HealthMonitor.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <string>
#include <utility>
#include <vector>

namespace ferry {

namespace {
constexpr std::chrono::milliseconds kProbeTimeout {5000L};
constexpr uint64_t kProbeMaxBytes = 1024 * 1024;
constexpr const char* kProbeUserAgent = "Ferry/1.0 ConnectivityTest";
} // namespace

HealthMonitor::HealthMonitor(EndpointRegistry& r, HttpTransport& t, NetworkMonitor& n, std::string canaryTarget)
    : registry {r},
      transport {t},
      network {n},
      canary {std::move(canaryTarget)},
      timer {"health-check"} {}

HealthMonitor::~HealthMonitor() {
    stop();
}

std::expected<std::monostate, Error> HealthMonitor::probe(const Endpoint& e, HttpTransport& t, const std::string& canaryTarget) {
    HttpRequest request {
        e.forwardUrl(canaryTarget),
        {{"User-Agent", kProbeUserAgent}},
        std::min(e.timeout, kProbeTimeout),
        kProbeMaxBytes,
        {}
    };
    auto response = t.get(request);
    if (!response.has_value()) {
        return std::unexpected {response.error()};
    }
    if (response->status < 200 || response->status >= 300) {
        return std::unexpected {Error {ErrorCode::HttpStatus, "canary answered HTTP " + std::to_string(response->status), response->status}};
    }
    return {};
}

std::vector<std::expected<std::monostate, Error>> HealthMonitor::probeEach(
    const std::vector<Endpoint>& endpoints, HttpTransport& t, const std::string& canaryTarget) {
    std::vector<std::future<std::expected<std::monostate, Error>>> pending;
    pending.reserve(endpoints.size());
    for (const auto& e : endpoints) {
        pending.push_back(std::async(std::launch::async, [&e, &t, &canaryTarget] {
            return probe(e, t, canaryTarget);
        }));
    }
    std::vector<std::expected<std::monostate, Error>> results;
    results.reserve(pending.size());
    for (auto& f : pending) {
        results.push_back(f.get());
    }
    return results;
}

std::vector<Endpoint> HealthMonitor::reachable(const std::vector<Endpoint>& endpoints, HttpTransport& t, const std::string& canaryTarget) {
    const auto results = probeEach(endpoints, t, canaryTarget);
    std::vector<Endpoint> result;
    for (size_t i = 0; i < endpoints.size(); ++i) {
        const auto& e = endpoints[i];
        if (results[i].has_value()) {
            spdlog::info("HealthMonitor: endpoint {} reachable", e.name);
            result.push_back(e);
        } else {
            spdlog::warn("HealthMonitor: endpoint {} unreachable, dropping it: {}", e.name, results[i].error().what);
        }
    }
    return result;
}

void HealthMonitor::probeAll() {
    spdlog::debug("HealthMonitor: probing endpoints");
    const auto endpoints = registry.endpoints();
    const auto results = probeEach(endpoints, transport, canary);
    bool anyResponse = false;
    for (size_t i = 0; i < endpoints.size(); ++i) {
        const auto& e = endpoints[i];
        if (results[i].has_value()) {
            registry.recordSuccess(e.name);
            anyResponse = true;
            continue;
        }
        registry.recordFailure(e.name);
        spdlog::warn("HealthMonitor: endpoint {} unhealthy: {}", e.name, results[i].error().what);
        const auto code = results[i].error().code;
        if (code != ErrorCode::Network && code != ErrorCode::Timeout) {
            anyResponse = true;
        }
    }
    // Silent endpoints say nothing about the host's own connectivity, so a round
    // without answers leaves the flag alone.
    if (anyResponse) {
        network.setOnline(true);
    } else if (!endpoints.empty()) {
        spdlog::warn("HealthMonitor: no endpoint answered its canary");
    }
}

void HealthMonitor::start(std::chrono::milliseconds interval) {
    timer.start(interval, [this] { probeAll(); });
}

void HealthMonitor::stop() {
    timer.stop();
}

} // namespace ferry
