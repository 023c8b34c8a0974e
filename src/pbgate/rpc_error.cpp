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

#include <sstream>
#include "pbgate/http_status_code.h"
#include "pbgate/rpc_error.h"

namespace pbgate {

RpcError::RpcError()
    : _has_grpc_status(false)
    , _grpc_status(GRPC_OK)
    , _error_code(0) {
}

RpcError::RpcError(GrpcStatus code, const std::string& message)
    : _has_grpc_status(true)
    , _grpc_status(code)
    , _error_code(0)
    , _message(message) {
}

RpcError::RpcError(const gutil::Status& status)
    : _has_grpc_status(false)
    , _grpc_status(GRPC_OK)
    , _error_code(status.error_code()) {
    if (!status.ok()) {
        _message = status.error_str();
    }
}

bool RpcError::ok() const {
    if (_has_grpc_status) {
        return _grpc_status == GRPC_OK;
    }
    return _error_code == 0;
}

GrpcStatus RpcError::grpc_status() const {
    if (_has_grpc_status) {
        return _grpc_status;
    }
    return _error_code == 0 ? GRPC_OK : GRPC_INTERNAL;
}

void RpcError::AddDetail(const google::protobuf::Message& detail) {
    _details.Add()->PackFrom(detail);
}

std::string RpcError::ToString() const {
    if (ok()) {
        return "OK";
    }
    std::ostringstream os;
    if (_has_grpc_status) {
        os << GrpcStatusToString(_grpc_status) << ": " << _message;
    } else {
        os << '[' << _error_code << "] " << _message;
    }
    return os.str();
}

std::string ToLoggedString(const RpcError& error, int max_length) {
    std::string s = error.ToString();
    if (max_length > 0 && s.size() > (size_t)max_length) {
        s.resize(max_length);
        s.append("...");
    }
    return s;
}

GrpcStatus CanonicalCode(const RpcError& error) {
    if (error.has_grpc_status()) {
        return error.grpc_status();
    }
    return GRPC_INTERNAL;
}

void BuildErrorBody(const RpcError& error, ErrorBody* body) {
    body->Clear();
    body->set_error(error.message());
    body->set_code(CanonicalCode(error));
    body->mutable_details()->CopyFrom(error.details());
}

void BuildStreamError(const RpcError& error, StreamError* stream_error) {
    stream_error->Clear();
    const GrpcStatus code = CanonicalCode(error);
    const int http_code = GrpcStatusToHttpStatus(code);
    stream_error->set_grpc_code(code);
    stream_error->set_http_code(http_code);
    stream_error->set_message(error.message());
    stream_error->set_http_status(HttpReasonPhrase(http_code));
    stream_error->mutable_details()->CopyFrom(error.details());
}

} // namespace pbgate
