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

#ifndef PBGATE_ERRORS_H
#define PBGATE_ERRORS_H

#include "pbgate/gateway_options.h"
#include "pbgate/http_header.h"
#include "pbgate/marshaler.h"
#include "pbgate/response_writer.h"
#include "pbgate/rpc_error.h"
#include "pbgate/server_metadata.h"


namespace pbgate {

// Body and content type sent when the error body itself can't be marshaled.
extern const char* const FALLBACK_ERROR_BODY;
extern const char* const FALLBACK_CONTENT_TYPE;

// Write `error' as a complete, non-streaming http response:
//   - the status code is mapped from the canonical code of `error'.
//   - the body is an ErrorBody marshaled by `marshaler'. If that fails, the
//     response becomes 500 with FALLBACK_ERROR_BODY.
//   - Content-Type is asked from `marshaler' after marshaling, and is
//     FALLBACK_CONTENT_TYPE if empty.
//   - server metadata of `ctx' is sent as prefixed headers.
// `writer' must not be committed yet.
void DefaultHttpError(const CallContext& ctx,
                      const GatewayOptions& options,
                      const Marshaler& marshaler,
                      HttpResponseWriter* writer,
                      const HttpHeader& request,
                      const RpcError& error);

// Report `error' with options.error_handler, or DefaultHttpError if it's
// empty.
void HttpError(const CallContext& ctx,
               const GatewayOptions& options,
               const Marshaler& marshaler,
               HttpResponseWriter* writer,
               const HttpHeader& request,
               const RpcError& error);

// Add server metadata of `ctx' to `h' with prefixes of `options'.
void AppendServerMetadata(const CallContext& ctx,
                          const GatewayOptions& options,
                          HttpHeader* h);

} // namespace pbgate

#endif // PBGATE_ERRORS_H
