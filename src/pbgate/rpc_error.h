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

#ifndef PBGATE_RPC_ERROR_H
#define PBGATE_RPC_ERROR_H

#include <ostream>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/repeated_field.h>
#include "gutil/status.h"
#include "pbgate/grpc_status.h"
#include "pbgate/error.pb.h"

namespace pbgate {

// A failure handed to the gateway. It either originates from the rpc layer
// and carries a canonical GrpcStatus, or is a plain gutil::Status raised
// anywhere else (a marshaler, a hook, the receive source) without canonical
// code. Both kinds may carry details.
class RpcError {
public:
    // No error.
    RpcError();

    // A failure reported by the rpc layer.
    RpcError(GrpcStatus code, const std::string& message);

    // A failure raised outside of the rpc layer. An OK `status' makes an
    // OK RpcError.
    explicit RpcError(const gutil::Status& status);

    bool ok() const;

    // True iff this failure carries a canonical code.
    bool has_grpc_status() const { return _has_grpc_status; }

    // The carried canonical code. GRPC_INTERNAL for failed plain errors and
    // GRPC_OK when ok().
    GrpcStatus grpc_status() const;

    // Code of the plain gutil::Status, 0 for rpc-layer failures.
    int error_code() const { return _error_code; }

    const std::string& message() const { return _message; }

    // Pack `detail' into a google.protobuf.Any and append it.
    void AddDetail(const google::protobuf::Message& detail);
    const google::protobuf::RepeatedPtrField<google::protobuf::Any>&
    details() const { return _details; }

    // "GRPC_NOTFOUND: no such resource" or "[2001] cannot marshal".
    std::string ToString() const;

private:
    bool _has_grpc_status;
    GrpcStatus _grpc_status;
    int _error_code;
    std::string _message;
    google::protobuf::RepeatedPtrField<google::protobuf::Any> _details;
};

inline std::ostream& operator<<(std::ostream& os, const RpcError& e) {
    return os << e.ToString();
}

// ToString() cut to `max_length' bytes followed by "...", for logging.
// Not cut if `max_length' is not positive.
std::string ToLoggedString(const RpcError& error, int max_length);

// ---- error envelopes ----
// Following functions never fail. A failure without canonical code is
// reported as GRPC_INTERNAL with its text as message.

// The code used to pick the http status of `error'.
GrpcStatus CanonicalCode(const RpcError& error);

// Fill the body of a failed non-streaming response.
void BuildErrorBody(const RpcError& error, ErrorBody* body);

// Fill the payload of the chunk terminating a failed stream.
void BuildStreamError(const RpcError& error, StreamError* stream_error);

} // namespace pbgate

#endif // PBGATE_RPC_ERROR_H
