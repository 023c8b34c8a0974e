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

#ifndef PBGATE_FORWARD_H
#define PBGATE_FORWARD_H

#include <functional>
#include <memory>
#include <google/protobuf/message.h>
#include "pbgate/errors.h"


namespace pbgate {

enum RecvState {
    RECV_MESSAGE = 0,   // A response message is received.
    RECV_EOF = 1,       // The stream ended normally.
    RECV_FAILED = 2,    // The stream ended with an error.
};

typedef std::unique_ptr<google::protobuf::Message> MessagePtr;

// Blocks until the next outcome of a server-streaming call is known.
// Sets *message when RECV_MESSAGE is returned and *error when RECV_FAILED
// is returned. Not called again after RECV_EOF or RECV_FAILED.
typedef std::function<RecvState(MessagePtr* message, RpcError* error)>
RecvFunction;

// Forward messages from `recv' to `writer' as a chunked http response.
//
// Each message is sent as the marshaled {"result": message} followed by
// the delimiter of `marshaler' and flushed at once. Status 200 is committed
// with the first message. If the stream fails before that, the response is
// reported by HttpError() as a plain error response. If the stream fails
// after that, the status can't be changed any more and the error is sent
// as a last {"error": StreamError} chunk.
//
// Returns after the stream ended or the client can't be written any more.
void ForwardResponseStream(const CallContext& ctx,
                           const GatewayOptions& options,
                           const Marshaler& marshaler,
                           HttpResponseWriter* writer,
                           const HttpHeader& request,
                           const RecvFunction& recv);

// Forward the response of a unary call: `response' marshaled as a bare
// message with status 200.
void ForwardResponseMessage(const CallContext& ctx,
                            const GatewayOptions& options,
                            const Marshaler& marshaler,
                            HttpResponseWriter* writer,
                            const HttpHeader& request,
                            const google::protobuf::Message& response);

} // namespace pbgate

#endif // PBGATE_FORWARD_H
