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

#ifndef SRC_COMMON_OBSERVERLIST_HPP
#define SRC_COMMON_OBSERVERLIST_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace ferry {

// Observers attached after an event was emitted never see it.
template<typename Event>
class ObserverList {
public:
    using Id = uint64_t;
    using Observer = std::function<void(const Event&)>;

    explicit ObserverList(std::string n) : name {std::move(n)} {}
    ObserverList(const ObserverList&) = delete;
    ObserverList& operator=(const ObserverList&) = delete;

    Id subscribe(Observer o) {
        std::lock_guard lock{m};
        const auto id = nextId++;
        observers.emplace(id, std::move(o));
        return id;
    }

    bool unsubscribe(Id id) {
        std::lock_guard lock{m};
        return observers.erase(id) > 0;
    }

    // Calls every observer outside the lock so observers may subscribe or unsubscribe.
    void notify(const Event& event) const {
        std::vector<Observer> snapshot;
        {
            std::lock_guard lock{m};
            snapshot.reserve(observers.size());
            for (const auto& [id, o] : observers) {
                snapshot.push_back(o);
            }
        }
        for (const auto& o : snapshot) {
            try {
                o(event);
            } catch (const std::exception& e) {
                spdlog::error("{}: observer threw: {}", name, e.what());
            }
        }
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock{m};
        return observers.size();
    }
private:
    std::string name;
    mutable std::mutex m;
    std::map<Id, Observer> observers;
    Id nextId {1};
};

} // namespace ferry

#endif // SRC_COMMON_OBSERVERLIST_HPP
