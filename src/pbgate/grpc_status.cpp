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

#include "pbgate/grpc_status.h"

namespace pbgate {

const char* GrpcStatusToString(GrpcStatus s) {
    switch (s) {
        case GRPC_OK: return "GRPC_OK";
        case GRPC_CANCELED: return "GRPC_CANCELED";
        case GRPC_UNKNOWN: return "GRPC_UNKNOWN";
        case GRPC_INVALIDARGUMENT: return "GRPC_INVALIDARGUMENT";
        case GRPC_DEADLINEEXCEEDED: return "GRPC_DEADLINEEXCEEDED";
        case GRPC_NOTFOUND: return "GRPC_NOTFOUND";
        case GRPC_ALREADYEXISTS: return "GRPC_ALREADYEXISTS";
        case GRPC_PERMISSIONDENIED: return "GRPC_PERMISSIONDENIED";
        case GRPC_RESOURCEEXHAUSTED: return "GRPC_RESOURCEEXHAUSTED";
        case GRPC_FAILEDPRECONDITION: return "GRPC_FAILEDPRECONDITION";
        case GRPC_ABORTED: return "GRPC_ABORTED";
        case GRPC_OUTOFRANGE: return "GRPC_OUTOFRANGE";
        case GRPC_UNIMPLEMENTED: return "GRPC_UNIMPLEMENTED";
        case GRPC_INTERNAL: return "GRPC_INTERNAL";
        case GRPC_UNAVAILABLE: return "GRPC_UNAVAILABLE";
        case GRPC_DATALOSS: return "GRPC_DATALOSS";
        case GRPC_UNAUTHENTICATED: return "GRPC_UNAUTHENTICATED";
        case GRPC_MAX: return "GRPC_MAX";
    }
    return "Unknown-GrpcStatus";
}

} // namespace pbgate
