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

#ifndef LOCKED_UNORDERED_MAP_H
#define LOCKED_UNORDERED_MAP_H

#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <utility>

namespace ferry {

// Values never leave the lock by reference; callers read copies or mutate in place
// through apply/upsert.
template <typename Key, typename Value>
class LockedUnorderedMap {
public:
    template<typename... Args>
    bool emplace(Args&&... args) {
        std::unique_lock lock{mutex};
        return map.emplace(std::forward<Args>(args)...).second;
    }

    bool erase(const Key& key) {
        std::unique_lock lock{mutex};
        return map.erase(key) > 0;
    }

    [[nodiscard]] bool contains(const Key& key) const {
        std::shared_lock lock{mutex};
        return map.contains(key);
    }

    [[nodiscard]] std::optional<Value> get(const Key& key) const {
        std::shared_lock lock{mutex};
        auto it = map.find(key);
        if (it == map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Runs f on the value of an existing key; returns false when the key is absent.
    template<typename F>
    bool apply(const Key& key, F&& f) {
        std::unique_lock lock{mutex};
        auto it = map.find(key);
        if (it == map.end()) {
            return false;
        }
        std::forward<F>(f)(it->second);
        return true;
    }

    // Runs f on the value of key, constructing it from init first when absent.
    template<typename F>
    auto upsert(const Key& key, const Value& init, F&& f) {
        std::unique_lock lock{mutex};
        auto it = map.try_emplace(key, init).first;
        return std::forward<F>(f)(it->second);
    }

    template<typename F>
    void forEach(F&& f) const {
        std::shared_lock lock{mutex};
        for (const auto& [k, v] : map) {
            f(k, v);
        }
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock lock{mutex};
        return map.size();
    }

    void clear() {
        std::unique_lock lock{mutex};
        map.clear();
    }

private:
    std::unordered_map<Key, Value> map;
    mutable std::shared_mutex mutex;
};

} // namespace ferry

#endif // LOCKED_UNORDERED_MAP_H
