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

#ifndef PBGATE_GATEWAY_OPTIONS_H
#define PBGATE_GATEWAY_OPTIONS_H

#include <functional>
#include <string>
#include <vector>
#include <gflags/gflags_declare.h>
#include <google/protobuf/message.h>
#include "gutil/status.h"


namespace pbgate {

DECLARE_string(pbgate_metadata_header_prefix);
DECLARE_string(pbgate_metadata_trailer_prefix);
DECLARE_int32(pbgate_max_logged_error_length);

class CallContext;
class HttpHeader;
class HttpResponseWriter;
class Marshaler;
class RpcError;
struct GatewayOptions;

// Called with every response message right before it is serialized. A hook
// may modify headers of `writer' which are not committed yet. A failed
// status aborts the response as if the rpc failed with it.
typedef std::function<gutil::Status(const CallContext& ctx,
                                    HttpResponseWriter* writer,
                                    const google::protobuf::Message& response)>
ForwardResponseHook;

// Writes `error' as the whole http response.
typedef std::function<void(const CallContext& ctx,
                           const GatewayOptions& options,
                           const Marshaler& marshaler,
                           HttpResponseWriter* writer,
                           const HttpHeader& request,
                           const RpcError& error)>
HttpErrorHandler;

struct GatewayOptions {
    // Constructed with default options.
    GatewayOptions();

    // Server metadata in headers is sent as http headers with this prefix.
    // Default: -pbgate_metadata_header_prefix ("Grpc-Metadata-")
    std::string metadata_header_prefix;

    // Server metadata in trailers is sent as http headers with this prefix.
    // Default: -pbgate_metadata_trailer_prefix ("Grpc-Trailer-")
    std::string metadata_trailer_prefix;

    // Run in order, see ForwardResponseHook.
    // Default: empty
    std::vector<ForwardResponseHook> forward_response_hooks;

    // Reports failures happening before the response is committed.
    // Default: empty, DefaultHttpError is used
    HttpErrorHandler error_handler;

    // Error messages longer than this are truncated in logs.
    // Default: -pbgate_max_logged_error_length (256)
    int max_logged_error_length;
};

} // namespace pbgate

#endif // PBGATE_GATEWAY_OPTIONS_H
