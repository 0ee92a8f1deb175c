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

#include "transfer/Task.hpp"
#include "common/ErrorClassifier.hpp"
#include <ostream>
#include <string>
#include <utility>

namespace ferry {

std::string toString(const TaskKind& kind) {
    switch (kind) {
        case TaskKind::ContentFetch: return "content-fetch";
        case TaskKind::ByteTransfer: return "byte-transfer";
    }
    std::unreachable();
}

std::string toString(const TaskStatus& status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Queued: return "queued";
        case TaskStatus::Downloading: return "downloading";
        case TaskStatus::Retrying: return "retrying";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    std::unreachable();
}

std::ostream& operator<<(std::ostream& os, const TaskStatus& status) {
    os << toString(status);
    return os;
}

bool isTerminal(const TaskStatus& status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed || status == TaskStatus::Cancelled;
}

TaskError::TaskError(const Error& e)
    : error {e},
      classification {classify(e)},
      message {userMessage(classification.kind)} {}

std::string toString(const TaskEvent::Type& type) {
    switch (type) {
        case TaskEvent::Type::Progress: return "progress";
        case TaskEvent::Type::StatusChanged: return "status-changed";
        case TaskEvent::Type::Completed: return "completed";
        case TaskEvent::Type::Failed: return "failed";
    }
    std::unreachable();
}

} // namespace ferry
