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

#include "context/FerryContext.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ferry {

namespace {

std::vector<Endpoint> usableEndpoints(const Config& c, HttpTransport& t) {
    if (!c.validateEndpointsOnStart) {
        return c.endpoints;
    }
    auto reachable = HealthMonitor::reachable(c.endpoints, t, c.healthCheckTarget);
    if (reachable.empty()) {
        throw std::runtime_error("No forwarding endpoint is reachable.");
    }
    spdlog::info("FerryContext: {} of {} endpoints reachable", reachable.size(), c.endpoints.size());
    return reachable;
}

RetryPolicy policyFor(std::chrono::milliseconds base, std::chrono::milliseconds max, int retries) {
    return RetryPolicy {
        std::chrono::duration_cast<std::chrono::microseconds>(base),
        std::chrono::duration_cast<std::chrono::microseconds>(std::max(base, max)),
        retries};
}

} // namespace

FerryContext::FerryContext(const Config& c, HttpTransport& t)
    : cfg {c},
      transport {t},
      networkMonitor {true},
      endpointRegistry {std::make_unique<EndpointRegistry>(
          usableEndpoints(cfg, t),
          CircuitPolicy {cfg.circuitFailureThreshold, std::chrono::duration_cast<std::chrono::microseconds>(cfg.circuitCooldown)})},
      requestDispatcher {std::make_unique<Dispatcher>(*endpointRegistry, transport, networkMonitor, cfg.maxResponseBytes)},
      requestRetries {"request", policyFor(cfg.retryBaseDelay, cfg.retryMaxDelay, cfg.maxRetries), networkMonitor},
      taskRetries {"task", policyFor(cfg.taskRetryBaseDelay, cfg.retryMaxDelay, cfg.taskMaxRetries), networkMonitor},
      healthMonitor {std::make_unique<HealthMonitor>(*endpointRegistry, transport, networkMonitor, cfg.healthCheckTarget)},
      transferScheduler {std::make_unique<TransferScheduler>(*requestDispatcher, taskRetries, cfg.maxConcurrent, cfg.taskRetention)},
      started {false} {}

FerryContext::~FerryContext() {
    shutdown();
}

void FerryContext::start() {
    if (started) {
        return;
    }
    started = true;
    endpointRegistry->startRateWindow(cfg.rateWindow);
    healthMonitor->start(cfg.healthCheckInterval);
    transferScheduler->startHousekeeping(cfg.cleanupInterval);
    spdlog::info("FerryContext: started with {} endpoints, {} concurrent transfers",
        endpointRegistry->size(), transferScheduler->maxConcurrent());
}

void FerryContext::shutdown() {
    requestRetries.stop();
    transferScheduler->shutdown();
    healthMonitor->stop();
    endpointRegistry->stopRateWindow();
    if (started) {
        started = false;
        spdlog::info("FerryContext: stopped");
    }
}

std::expected<ForwardResponse, Error> FerryContext::fetch(const std::string& target, const ForwardOptions& options) {
    const auto op = "fetch-" + uuid_v7_to_string(generate_uuid_v7());
    const std::function<std::expected<ForwardResponse, Error>()> work = [this, &target, &options] {
        return requestDispatcher->forward(target, options);
    };
    return requestRetries.run<ForwardResponse>(op, work);
}

const Config& FerryContext::config() const {
    return cfg;
}

NetworkMonitor& FerryContext::network() {
    return networkMonitor;
}

EndpointRegistry& FerryContext::registry() {
    return *endpointRegistry;
}

Dispatcher& FerryContext::dispatcher() {
    return *requestDispatcher;
}

RetryCoordinator& FerryContext::retries() {
    return requestRetries;
}

RetryStats FerryContext::retryStats() const {
    const auto requests = requestRetries.stats();
    const auto transfers = taskRetries.stats();
    return RetryStats {
        requests.totalRetries + transfers.totalRetries,
        requests.activeOperations + transfers.activeOperations,
        requests.online};
}

HealthMonitor& FerryContext::health() {
    return *healthMonitor;
}

TransferScheduler& FerryContext::scheduler() {
    return *transferScheduler;
}

} // namespace ferry
