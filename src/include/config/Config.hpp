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

#ifndef CONFIG_H
#define CONFIG_H

#include "common/Error.hpp"
#include "proxy/Endpoint.hpp"
#include <proto/config.pb.h>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace ferry {

struct Config {
    std::vector<Endpoint> endpoints;
    size_t maxConcurrent;
    int maxRetries;
    std::chrono::milliseconds retryBaseDelay;
    std::chrono::milliseconds retryMaxDelay;
    int circuitFailureThreshold;
    std::chrono::milliseconds circuitCooldown;
    std::chrono::milliseconds rateWindow;
    std::chrono::milliseconds healthCheckInterval;
    std::string healthCheckTarget;
    uint64_t maxResponseBytes;
    int taskMaxRetries;
    std::chrono::milliseconds taskRetryBaseDelay;
    std::chrono::milliseconds taskRetention;
    std::chrono::milliseconds cleanupInterval;
    bool validateEndpointsOnStart;
    std::string listenAddress;
    std::string logLevel;
    std::string logFile;
};

Config defaultConfig();

// Zero or empty fields take the defaults. Throws std::invalid_argument on an
// unusable configuration.
Config fromProto(const config::FerryConfig& proto);

std::expected<Config, Error> parseConfig(const std::string& json);

std::expected<Config, Error> loadConfig(const std::string& path);

} // namespace ferry

#endif // CONFIG_H
