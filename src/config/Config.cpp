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

#include "config/Config.hpp"
#include "common/Error.hpp"
#include "proxy/Url.hpp"
#include <google/protobuf/util/json_util.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ferry {

namespace {

struct Defaults {
    static constexpr size_t MAX_CONCURRENT = 3;
    static constexpr int MAX_RETRIES = 3;
    static constexpr std::chrono::milliseconds RETRY_BASE_DELAY {1000L};
    static constexpr std::chrono::milliseconds RETRY_MAX_DELAY {30'000L};
    static constexpr int CIRCUIT_FAILURE_THRESHOLD = 3;
    static constexpr std::chrono::milliseconds CIRCUIT_COOLDOWN {5L * 60 * 1000};
    static constexpr std::chrono::milliseconds RATE_WINDOW {60'000L};
    static constexpr std::chrono::milliseconds HEALTH_CHECK_INTERVAL {5L * 60 * 1000};
    static constexpr const char* HEALTH_CHECK_TARGET = "https://httpbin.org/get";
    static constexpr uint64_t MAX_RESPONSE_BYTES = 50ULL * 1024 * 1024;
    static constexpr int TASK_MAX_RETRIES = 3;
    static constexpr std::chrono::milliseconds TASK_RETRY_BASE_DELAY {2000L};
    static constexpr std::chrono::milliseconds TASK_RETENTION {24L * 60 * 60 * 1000};
    static constexpr std::chrono::milliseconds CLEANUP_INTERVAL {60'000L};
    static constexpr const char* LISTEN_ADDRESS = "127.0.0.1:50151";
    static constexpr const char* LOG_LEVEL = "info";
    static constexpr const char* LOG_FILE = "logs/ferry.txt";
};

template<typename T>
T orDefault(T value, T fallback) {
    return value == T {} ? fallback : value;
}

std::chrono::milliseconds msOrDefault(uint64_t value, std::chrono::milliseconds fallback) {
    return value == 0 ? fallback : std::chrono::milliseconds {static_cast<int64_t>(value)};
}

Endpoint toEndpoint(const config::EndpointConfig& e) {
    if (e.name().empty()) {
        throw std::invalid_argument("Endpoint name must not be empty.");
    }
    if (auto safe = validateUrlSafety(e.url()); !safe.has_value()) {
        throw std::invalid_argument("Endpoint " + e.name() + " has an unsafe URL: " + safe.error().what);
    }
    if (!isHttps(e.url())) {
        throw std::invalid_argument("Endpoint " + e.name() + " must use https.");
    }
    if (e.timeout_ms() == 0) {
        throw std::invalid_argument("Endpoint " + e.name() + " timeout must be > zero.");
    }
    if (e.rate_limit_per_minute() == 0) {
        throw std::invalid_argument("Endpoint " + e.name() + " rate limit must be > zero.");
    }
    return Endpoint {
        e.name(),
        e.url(),
        e.embed() == config::EMBED_PATH ? EmbedMode::Path : EmbedMode::Query,
        std::chrono::milliseconds {static_cast<int64_t>(e.timeout_ms())},
        static_cast<int>(e.rate_limit_per_minute())
    };
}

} // namespace

Config defaultConfig() {
    return Config {
        defaultEndpoints(),
        Defaults::MAX_CONCURRENT,
        Defaults::MAX_RETRIES,
        Defaults::RETRY_BASE_DELAY,
        Defaults::RETRY_MAX_DELAY,
        Defaults::CIRCUIT_FAILURE_THRESHOLD,
        Defaults::CIRCUIT_COOLDOWN,
        Defaults::RATE_WINDOW,
        Defaults::HEALTH_CHECK_INTERVAL,
        Defaults::HEALTH_CHECK_TARGET,
        Defaults::MAX_RESPONSE_BYTES,
        Defaults::TASK_MAX_RETRIES,
        Defaults::TASK_RETRY_BASE_DELAY,
        Defaults::TASK_RETENTION,
        Defaults::CLEANUP_INTERVAL,
        false,
        Defaults::LISTEN_ADDRESS,
        Defaults::LOG_LEVEL,
        Defaults::LOG_FILE
    };
}

Config fromProto(const config::FerryConfig& proto) {
    auto c = defaultConfig();
    if (proto.endpoints_size() > 0) {
        c.endpoints.clear();
        std::set<std::string> names;
        for (const auto& e : proto.endpoints()) {
            if (!names.insert(e.name()).second) {
                throw std::invalid_argument("Duplicate endpoint name: " + e.name());
            }
            c.endpoints.push_back(toEndpoint(e));
        }
    }
    c.maxConcurrent = orDefault<size_t>(proto.max_concurrent(), c.maxConcurrent);
    c.maxRetries = orDefault<int>(static_cast<int>(proto.max_retries()), c.maxRetries);
    c.retryBaseDelay = msOrDefault(proto.retry_base_delay_ms(), c.retryBaseDelay);
    c.retryMaxDelay = msOrDefault(proto.retry_max_delay_ms(), c.retryMaxDelay);
    c.circuitFailureThreshold = orDefault<int>(static_cast<int>(proto.circuit_failure_threshold()), c.circuitFailureThreshold);
    c.circuitCooldown = msOrDefault(proto.circuit_cooldown_ms(), c.circuitCooldown);
    c.rateWindow = msOrDefault(proto.rate_window_ms(), c.rateWindow);
    c.healthCheckInterval = msOrDefault(proto.health_check_interval_ms(), c.healthCheckInterval);
    c.healthCheckTarget = orDefault<std::string>(proto.health_check_target(), c.healthCheckTarget);
    c.maxResponseBytes = orDefault<uint64_t>(proto.max_response_bytes(), c.maxResponseBytes);
    c.taskMaxRetries = orDefault<int>(static_cast<int>(proto.task_max_retries()), c.taskMaxRetries);
    c.taskRetryBaseDelay = msOrDefault(proto.task_retry_base_delay_ms(), c.taskRetryBaseDelay);
    c.taskRetention = msOrDefault(proto.task_retention_ms(), c.taskRetention);
    c.cleanupInterval = msOrDefault(proto.cleanup_interval_ms(), c.cleanupInterval);
    c.validateEndpointsOnStart = proto.validate_endpoints_on_start();
    c.listenAddress = orDefault<std::string>(proto.listen_address(), c.listenAddress);
    c.logLevel = orDefault<std::string>(proto.log_level(), c.logLevel);
    c.logFile = orDefault<std::string>(proto.log_file(), c.logFile);

    if (c.retryMaxDelay < c.retryBaseDelay) {
        throw std::invalid_argument("Retry max delay must be >= retry base delay.");
    }
    if (auto safe = validateUrlSafety(c.healthCheckTarget); !safe.has_value()) {
        throw std::invalid_argument("Health check target is unsafe: " + safe.error().what);
    }
    if (c.logLevel != "trace" && c.logLevel != "debug" && c.logLevel != "info" && c.logLevel != "warn"
        && c.logLevel != "error" && c.logLevel != "critical" && c.logLevel != "off") {
        throw std::invalid_argument("Unknown log level: " + c.logLevel);
    }
    return c;
}

std::expected<Config, Error> parseConfig(const std::string& json) {
    config::FerryConfig proto;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    const auto status = google::protobuf::util::JsonStringToMessage(json, &proto, options);
    if (!status.ok()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "malformed configuration: " + status.ToString()}};
    }
    try {
        return fromProto(proto);
    } catch (const std::invalid_argument& e) {
        return std::unexpected {Error {ErrorCode::InvalidArg, e.what()}};
    }
}

std::expected<Config, Error> loadConfig(const std::string& path) {
    std::ifstream in {path};
    if (!in) {
        return std::unexpected {Error {ErrorCode::NotFound, "cannot open configuration file " + path}};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    spdlog::info("Loading configuration from {}", path);
    return parseConfig(buffer.str());
}

} // namespace ferry
