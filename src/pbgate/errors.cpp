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

#include "gutil/logging.h"
#include "pbgate/http_status_code.h"
#include "pbgate/errors.h"


namespace pbgate {

const char* const FALLBACK_ERROR_BODY =
    "{\"error\": \"failed to marshal error message\"}";
const char* const FALLBACK_CONTENT_TYPE = "application/json";

void AppendServerMetadata(const CallContext& ctx,
                          const GatewayOptions& options,
                          HttpHeader* h) {
    const ServerMetadata* md = ctx.server_metadata();
    if (md == NULL) {
        return;
    }
    AppendMetadataToHeader(md->header, options.metadata_header_prefix, h);
    AppendMetadataToHeader(md->trailer, options.metadata_trailer_prefix, h);
}

void DefaultHttpError(const CallContext& ctx,
                      const GatewayOptions& options,
                      const Marshaler& marshaler,
                      HttpResponseWriter* writer,
                      const HttpHeader& request,
                      const RpcError& error) {
    LOG_IF(WARNING, writer->header_written())
        << "Response to " << request.path()
        << " was committed, status of the error is lost";

    ErrorBody body;
    BuildErrorBody(error, &body);
    int status_code = GrpcStatusToHttpStatus(CanonicalCode(error));
    std::string buf;
    std::string content_type;
    const gutil::Status st = marshaler.Marshal(Envelope(body), &buf);
    if (!st.ok()) {
        LOG(ERROR) << "Fail to marshal error message of " << request.path()
                   << ": " << st << ", original error: "
                   << ToLoggedString(error, options.max_logged_error_length);
        status_code = HTTP_STATUS_INTERNAL_SERVER_ERROR;
        buf = FALLBACK_ERROR_BODY;
        content_type = FALLBACK_CONTENT_TYPE;
    } else {
        // Marshaler may decide the type by what it just marshaled.
        content_type = marshaler.ContentType();
        if (content_type.empty()) {
            content_type = FALLBACK_CONTENT_TYPE;
        }
    }
    VLOG(1) << "log_id=" << ctx.log_id() << " reply " << status_code
            << " to " << request.path() << ": "
            << ToLoggedString(error, options.max_logged_error_length);

    HttpHeader& h = writer->header();
    // The whole response goes out at once, nothing is announced as trailer.
    h.RemoveHeader("Trailer");
    h.set_content_type(content_type);
    AppendServerMetadata(ctx, options, &h);
    writer->WriteHeader(status_code);
    if (writer->Write(buf.data(), buf.size()) != 0) {
        PLOG(WARNING) << "Fail to write error response of " << request.path();
        return;
    }
    if (writer->Flush() != 0) {
        PLOG(WARNING) << "Fail to flush error response of " << request.path();
    }
}

void HttpError(const CallContext& ctx,
               const GatewayOptions& options,
               const Marshaler& marshaler,
               HttpResponseWriter* writer,
               const HttpHeader& request,
               const RpcError& error) {
    if (options.error_handler) {
        options.error_handler(ctx, options, marshaler, writer, request, error);
    } else {
        DefaultHttpError(ctx, options, marshaler, writer, request, error);
    }
}

} // namespace pbgate
