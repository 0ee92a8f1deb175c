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

#ifndef SRC_CONTEXT_FERRYCONTEXT_HPP
#define SRC_CONTEXT_FERRYCONTEXT_HPP

#include "common/Error.hpp"
#include "common/NetworkMonitor.hpp"
#include "common/RetryCoordinator.hpp"
#include "config/Config.hpp"
#include "proxy/Dispatcher.hpp"
#include "proxy/EndpointRegistry.hpp"
#include "proxy/HealthMonitor.hpp"
#include "proxy/HttpTransport.hpp"
#include "transfer/TransferScheduler.hpp"
#include <expected>
#include <memory>
#include <string>

namespace ferry {

// Owns the whole dispatch and scheduling stack for one configuration. Components
// reference each other through this object instead of process-wide state.
class FerryContext {
public:
    FerryContext(const Config& c, HttpTransport& t);
    FerryContext(const FerryContext&) = delete;
    FerryContext& operator=(const FerryContext&) = delete;
    ~FerryContext();

    // Starts the rate window, health probes and task housekeeping.
    void start();
    void shutdown();

    // One-shot forward with retry, outside the task scheduler.
    std::expected<ForwardResponse, Error> fetch(const std::string& target, const ForwardOptions& options = {});

    [[nodiscard]] const Config& config() const;
    NetworkMonitor& network();
    EndpointRegistry& registry();
    Dispatcher& dispatcher();
    RetryCoordinator& retries();
    // Request and task retries together.
    [[nodiscard]] RetryStats retryStats() const;
    HealthMonitor& health();
    TransferScheduler& scheduler();
private:
    Config cfg;
    HttpTransport& transport;
    NetworkMonitor networkMonitor;
    std::unique_ptr<EndpointRegistry> endpointRegistry;
    std::unique_ptr<Dispatcher> requestDispatcher;
    RetryCoordinator requestRetries;
    RetryCoordinator taskRetries;
    std::unique_ptr<HealthMonitor> healthMonitor;
    std::unique_ptr<TransferScheduler> transferScheduler;
    bool started;
};

} // namespace ferry

#endif // SRC_CONTEXT_FERRYCONTEXT_HPP
