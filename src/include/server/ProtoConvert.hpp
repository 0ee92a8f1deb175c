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

#ifndef SRC_SERVER_PROTOCONVERT_HPP
#define SRC_SERVER_PROTOCONVERT_HPP

#include "common/RetryCoordinator.hpp"
#include "proxy/EndpointRegistry.hpp"
#include "transfer/Task.hpp"
#include "transfer/TransferScheduler.hpp"
#include <proto/ferry.pb.h>

namespace ferry {

proto::TaskKind toProto(const TaskKind& kind);
TaskKind fromProto(const proto::TaskKind& kind);
proto::TaskStatus toProto(const TaskStatus& status);
proto::ClassifiedError toProto(const TaskError& error);
proto::TaskInfo toProto(const TransferTask& task, bool includeContent);
proto::TaskEvent toProto(const TaskEvent& event);
proto::StatsReply toProto(const RegistryStats& endpoints, const RetryStats& retries, const SchedulerStats& scheduler);

} // namespace ferry

#endif // SRC_SERVER_PROTOCONVERT_HPP
