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

#include <string>
#include "gutil/logging.h"
#include "pbgate/errno.pb.h"
#include "pbgate/http_status_code.h"
#include "pbgate/forward.h"


namespace pbgate {

namespace {

enum StreamState {
    STREAM_INIT,        // Nothing is committed.
    STREAM_STREAMING,   // Status 200 and headers are committed.
    STREAM_DONE,
};

gutil::Status RunForwardResponseHooks(const CallContext& ctx,
                                      const GatewayOptions& options,
                                      HttpResponseWriter* writer,
                                      const google::protobuf::Message& msg) {
    for (size_t i = 0; i < options.forward_response_hooks.size(); ++i) {
        const gutil::Status st =
            options.forward_response_hooks[i](ctx, writer, msg);
        if (!st.ok()) {
            return gutil::Status(EHOOK, "Hook #%zu failed: %s",
                                 i, st.error_cstr());
        }
    }
    return gutil::Status::OK();
}

class StreamForwarder {
public:
    StreamForwarder(const CallContext& ctx,
                    const GatewayOptions& options,
                    const Marshaler& marshaler,
                    HttpResponseWriter* writer,
                    const HttpHeader& request)
        : _ctx(ctx)
        , _options(options)
        , _marshaler(marshaler)
        , _writer(writer)
        , _request(request)
        , _delimiter(GetDelimiter(marshaler))
        , _state(STREAM_INIT)
        , _nmessage(0) {}

    void Run(const RecvFunction& recv);

private:
    DISALLOW_COPY_AND_ASSIGN(StreamForwarder);

    void OnMessage(const google::protobuf::Message& msg);
    void OnFailure(const RpcError& error);
    void CommitHeader();
    // Write `data' followed by the delimiter and flush.
    // Returns false if the client can't be written.
    bool WriteChunk(const std::string& data);

    const CallContext& _ctx;
    const GatewayOptions& _options;
    const Marshaler& _marshaler;
    HttpResponseWriter* _writer;
    const HttpHeader& _request;
    const std::string _delimiter;
    StreamState _state;
    size_t _nmessage;
};

void StreamForwarder::Run(const RecvFunction& recv) {
    while (_state != STREAM_DONE) {
        MessagePtr msg;
        RpcError error;
        const RecvState rs = recv(&msg, &error);
        switch (rs) {
        case RECV_MESSAGE:
            if (!msg) {
                OnFailure(RpcError(gutil::Status(
                    EINVARIANT, "Received a NULL message")));
                break;
            }
            OnMessage(*msg);
            break;
        case RECV_EOF:
            if (_state == STREAM_INIT) {
                CommitHeader();
                if (_writer->Flush() != 0) {
                    PLOG(WARNING) << "Fail to flush empty stream of "
                                  << _request.path();
                }
            }
            _state = STREAM_DONE;
            break;
        case RECV_FAILED:
            if (error.ok()) {
                // Always end a failed stream with a failure.
                error = RpcError(gutil::Status(
                    ETRANSPORT, "Stream failed without an error"));
            }
            OnFailure(error);
            break;
        default:
            OnFailure(RpcError(gutil::Status(
                EINVARIANT, "Unknown RecvState=%d", (int)rs)));
            break;
        }
    }
}

void StreamForwarder::OnMessage(const google::protobuf::Message& msg) {
    const gutil::Status hook_st =
        RunForwardResponseHooks(_ctx, _options, _writer, msg);
    if (!hook_st.ok()) {
        return OnFailure(RpcError(hook_st));
    }
    std::string buf;
    const gutil::Status st = _marshaler.Marshal(Envelope(RESULT_KEY, msg), &buf);
    if (!st.ok()) {
        return OnFailure(RpcError(st));
    }
    if (_state == STREAM_INIT) {
        CommitHeader();
        _state = STREAM_STREAMING;
    }
    if (!WriteChunk(buf)) {
        _state = STREAM_DONE;
        return;
    }
    ++_nmessage;
}

void StreamForwarder::OnFailure(const RpcError& error) {
    if (_state == STREAM_INIT) {
        // Nothing is sent, the error still decides the status.
        HttpError(_ctx, _options, _marshaler, _writer, _request, error);
        _state = STREAM_DONE;
        return;
    }
    _state = STREAM_DONE;
    LOG(WARNING) << "log_id=" << _ctx.log_id() << " stream of "
                 << _request.path() << " failed after " << _nmessage
                 << " messages: "
                 << ToLoggedString(error, _options.max_logged_error_length);
    StreamError stream_error;
    BuildStreamError(error, &stream_error);
    std::string buf;
    const gutil::Status st =
        _marshaler.Marshal(Envelope(ERROR_KEY, stream_error), &buf);
    if (!st.ok()) {
        LOG(ERROR) << "Fail to marshal stream error of " << _request.path()
                   << ": " << st;
        return;
    }
    WriteChunk(buf);
}

void StreamForwarder::CommitHeader() {
    HttpHeader& h = _writer->header();
    h.SetHeader("Transfer-Encoding", "chunked");
    std::string content_type = _marshaler.ContentType();
    if (content_type.empty()) {
        content_type = FALLBACK_CONTENT_TYPE;
    }
    h.set_content_type(content_type);
    const ServerMetadata* md = _ctx.server_metadata();
    if (md != NULL) {
        // Trailers are not known until the stream ends.
        AppendMetadataToHeader(md->header, _options.metadata_header_prefix, &h);
    }
    _writer->WriteHeader(HTTP_STATUS_OK);
}

bool StreamForwarder::WriteChunk(const std::string& data) {
    if (_writer->Write(data.data(), data.size()) != 0 ||
        _writer->Write(_delimiter.data(), _delimiter.size()) != 0) {
        PLOG(WARNING) << "Fail to write chunk of " << _request.path();
        return false;
    }
    if (_writer->Flush() != 0) {
        PLOG(WARNING) << "Fail to flush chunk of " << _request.path();
        return false;
    }
    return true;
}

}  // namespace

void ForwardResponseStream(const CallContext& ctx,
                           const GatewayOptions& options,
                           const Marshaler& marshaler,
                           HttpResponseWriter* writer,
                           const HttpHeader& request,
                           const RecvFunction& recv) {
    StreamForwarder forwarder(ctx, options, marshaler, writer, request);
    forwarder.Run(recv);
}

void ForwardResponseMessage(const CallContext& ctx,
                            const GatewayOptions& options,
                            const Marshaler& marshaler,
                            HttpResponseWriter* writer,
                            const HttpHeader& request,
                            const google::protobuf::Message& response) {
    const gutil::Status hook_st =
        RunForwardResponseHooks(ctx, options, writer, response);
    if (!hook_st.ok()) {
        return HttpError(ctx, options, marshaler, writer, request,
                         RpcError(hook_st));
    }
    std::string buf;
    const gutil::Status st = marshaler.Marshal(Envelope(response), &buf);
    if (!st.ok()) {
        return HttpError(ctx, options, marshaler, writer, request,
                         RpcError(st));
    }
    HttpHeader& h = writer->header();
    std::string content_type = marshaler.ContentType();
    if (content_type.empty()) {
        content_type = FALLBACK_CONTENT_TYPE;
    }
    h.set_content_type(content_type);
    AppendServerMetadata(ctx, options, &h);
    writer->WriteHeader(HTTP_STATUS_OK);
    if (writer->Write(buf.data(), buf.size()) != 0) {
        PLOG(WARNING) << "Fail to write response of " << request.path();
        return;
    }
    if (writer->Flush() != 0) {
        PLOG(WARNING) << "Fail to flush response of " << request.path();
    }
}

} // namespace pbgate
