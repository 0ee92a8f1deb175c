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

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/common.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "config/Config.hpp"
#include "context/FerryContext.hpp"
#include "proxy/CurlGlobal.hpp"
#include "proxy/CurlTransport.hpp"
#include "server/TransferServiceImpl.hpp"

using ferry::Config;
using ferry::CurlGlobal;
using ferry::CurlTransport;
using ferry::FerryContext;
using ferry::TransferServer;
using ferry::TransferServiceImpl;

namespace {

std::atomic<bool> stopRequested {false};

extern "C" void onSignal(int /*signal*/) {
    stopRequested.store(true);
}

void installLogger(const Config& cfg) {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        cfg.logFile, 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "gAsync", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]\n";
        return 1;
    }
    Config cfg = ferry::defaultConfig();
    if (argc == 2) {
        auto loaded = ferry::loadConfig(argv[1]);
        if (!loaded.has_value()) {
            std::cerr << "ferryd: " << loaded.error().what << '\n';
            return 1;
        }
        cfg = loaded.value();
    }
    installLogger(cfg);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    int result = 0;
    try {
        const CurlGlobal curl {};
        CurlTransport transport {};
        FerryContext ctx {cfg, transport};
        ctx.start();
        TransferServiceImpl service {ctx};
        TransferServer server {cfg.listenAddress, service};
        spdlog::info("Ferry! Serving {} endpoints on {}", ctx.registry().size(), cfg.listenAddress);
        while (!stopRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds{200L});
        }
        spdlog::info("Ferry! Shutting down...");
        server.shutdown();
        ctx.shutdown();
    } catch (const std::exception& e) {
        spdlog::critical("ferryd: {}", e.what());
        result = 1;
    }
    spdlog::shutdown();
    return result;
}
