// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#ifndef PBGATE_GRPC_STATUS_H
#define PBGATE_GRPC_STATUS_H

namespace pbgate {

// Canonical status codes of the rpc layer. They are independent of any
// transport and are what an rpc failure is classified by before being
// translated into an http status, see http_status_code.h
enum GrpcStatus : int {
    // OK is returned on success.
    GRPC_OK = 0,

    // CANCELED indicates the operation was canceled (typically by the caller).
    GRPC_CANCELED,

    // Unknown error. Errors raised by APIs that do not return enough error
    // information may be converted to this error.
    GRPC_UNKNOWN,

    // INVALIDARGUMENT Indicates client specified an invalid argument.
    // Note that this differs from FAILEDPRECONDITION. It indicates arguments
    // that are problematic regardless of the state of the system
    // (e.g., a malformed file name).
    GRPC_INVALIDARGUMENT,

    // DEADLINEEXCEEDED Means operation expired before completion.
    GRPC_DEADLINEEXCEEDED,

    // NOTFOUND Means some requested entity (e.g., file or directory) was
    // not found.
    GRPC_NOTFOUND,

    // ALREADYEXISTS Means an attempt to create an entity failed because one
    // already exists.
    GRPC_ALREADYEXISTS,

    // PERMISSIONDENIED Indicates the caller does not have permission to
    // execute the specified operation.
    GRPC_PERMISSIONDENIED,

    // RESOURCEEXHAUSTED Indicates some resource has been exhausted, perhaps
    // a per-user quota, or perhaps the entire file system is out of space.
    GRPC_RESOURCEEXHAUSTED,

    // FAILEDPRECONDITION indicates operation was rejected because the
    // system is not in a state required for the operation's execution.
    GRPC_FAILEDPRECONDITION,

    // ABORTED indicates the operation was aborted, typically due to a
    // concurrency issue like sequencer check failures, transaction aborts,
    // etc.
    GRPC_ABORTED,

    // OUTOFRANGE means operation was attempted past the valid range.
    // E.g., seeking or reading past end of file.
    GRPC_OUTOFRANGE,

    // UNIMPLEMENTED indicates operation is not implemented or not
    // supported/enabled in this service.
    GRPC_UNIMPLEMENTED,

    // INTERNAL errors. Means some invariants expected by underlying
    // system has been broken.
    GRPC_INTERNAL,

    // UNAVAILABLE indicates the service is currently unavailable.
    GRPC_UNAVAILABLE,

    // DATALOSS indicates unrecoverable data loss or corruption.
    GRPC_DATALOSS,

    // UNAUTHENTICATED indicates the request does not have valid
    // authentication credentials for the operation.
    GRPC_UNAUTHENTICATED,

    GRPC_MAX,
};

// Get description of the status, "GRPC_NOTFOUND" for example.
const char* GrpcStatusToString(GrpcStatus);

// True if `code' is one of the canonical codes above (GRPC_MAX excluded).
inline bool IsValidGrpcStatus(int code) {
    return code >= GRPC_OK && code < GRPC_MAX;
}

} // namespace pbgate

#endif // PBGATE_GRPC_STATUS_H
