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

#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include <proto/ferry.pb.h>
#include <google/protobuf/any.pb.h>
#include <grpcpp/support/status.h>
#include <stdexcept>

namespace ferry {

grpc::StatusCode toGrpcStatusCode(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::NotFound:
            return grpc::StatusCode::NOT_FOUND;

        case ErrorCode::InvalidArg:
        case ErrorCode::UnsafeTarget:
            return grpc::StatusCode::INVALID_ARGUMENT;

        case ErrorCode::InvalidState:
            return grpc::StatusCode::FAILED_PRECONDITION;

        case ErrorCode::NoEndpointsAvailable:
        case ErrorCode::AllEndpointsFailed:
        case ErrorCode::Network:
        case ErrorCode::Offline:
            return grpc::StatusCode::UNAVAILABLE;

        case ErrorCode::Timeout:
            return grpc::StatusCode::DEADLINE_EXCEEDED;

        case ErrorCode::Cancelled:
            return grpc::StatusCode::CANCELLED;

        case ErrorCode::ResponseTooLarge:
            return grpc::StatusCode::RESOURCE_EXHAUSTED;

        case ErrorCode::Ssl:
        case ErrorCode::Cors:
            return grpc::StatusCode::PERMISSION_DENIED;

        default:
            return grpc::StatusCode::UNKNOWN;
    }
}

proto::ErrorDetails toProto(const Error& error) {
    proto::ErrorDetails details;
    details.set_code(static_cast<int32_t>(error.code));
    details.set_what(error.what);
    details.set_status(error.status);
    if (error.cause) {
        *details.mutable_cause() = toProto(*error.cause);
    }
    return details;
}

std::expected<std::monostate, Error> toExpected(const grpc::Status& status) {
    if (status.ok()) {
        return {};
    }
    return std::unexpected {toError(status)};
}

grpc::Status toGrpcStatus(const Error& error) {
    google::protobuf::Any anyDetail;
    anyDetail.PackFrom(toProto(error));
    return grpc::Status(toGrpcStatusCode(error.code), error.what, anyDetail.SerializeAsString());
}

Error toError(const grpc::Status& status) {
    if (status.error_code() == grpc::StatusCode::OK) {
        throw std::logic_error("Cannot convert OK status to error");
    }
    proto::ErrorDetails details;
    google::protobuf::Any any;
    if (any.ParseFromString(status.error_details()) && any.UnpackTo(&details)) {
        return Error {details};
    }
    ErrorCode code = ErrorCode::Unknown;
    switch (status.error_code()) {
        case grpc::StatusCode::NOT_FOUND:
            code = ErrorCode::NotFound;
            break;
        case grpc::StatusCode::INVALID_ARGUMENT:
            code = ErrorCode::InvalidArg;
            break;
        case grpc::StatusCode::FAILED_PRECONDITION:
            code = ErrorCode::InvalidState;
            break;
        case grpc::StatusCode::UNAVAILABLE:
            code = ErrorCode::Network;
            break;
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            code = ErrorCode::Timeout;
            break;
        case grpc::StatusCode::CANCELLED:
            code = ErrorCode::Cancelled;
            break;
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            code = ErrorCode::ResponseTooLarge;
            break;
        default:
            code = ErrorCode::Unknown;
    }
    return Error(code, status.error_message());
}

} // namespace ferry
