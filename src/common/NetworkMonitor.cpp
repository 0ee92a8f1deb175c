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

#include "common/NetworkMonitor.hpp"
#include <spdlog/spdlog.h>
#include <utility>
#include <string>

namespace ferry {

std::string toString(const NetworkEvent& event) {
    switch (event) {
        case NetworkEvent::Loss: return "network-loss";
        case NetworkEvent::Restore: return "network-restore";
    }
    std::unreachable();
}

NetworkMonitor::NetworkMonitor(bool initiallyOnline)
    : isOnline {initiallyOnline},
      listeners {"NetworkMonitor"} {}

bool NetworkMonitor::online() const {
    return isOnline.load();
}

void NetworkMonitor::setOnline(bool value) {
    if (isOnline.exchange(value) == value) {
        return;
    }
    const auto event = value ? NetworkEvent::Restore : NetworkEvent::Loss;
    if (value) {
        spdlog::info("NetworkMonitor: {}", toString(event));
    } else {
        spdlog::warn("NetworkMonitor: {}", toString(event));
    }
    listeners.notify(event);
}

NetworkMonitor::Id NetworkMonitor::subscribe(Observer o) {
    return listeners.subscribe(std::move(o));
}

bool NetworkMonitor::unsubscribe(Id id) {
    return listeners.unsubscribe(id);
}

} // namespace ferry
