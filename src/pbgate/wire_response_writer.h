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

#ifndef PBGATE_WIRE_RESPONSE_WRITER_H
#define PBGATE_WIRE_RESPONSE_WRITER_H

#include <string>
#include "gutil/macros.h"
#include "pbgate/response_writer.h"


namespace pbgate {

// Encode the response as HTTP/1.x onto a file descriptor (usually the
// accepted connection). The fd is not owned.
//
// A response whose header() has "Transfer-Encoding: chunked" when committed
// is sent in chunked-encoding: every Write() becomes one chunk and Flush()
// pushes the pending chunks to the fd. Otherwise the body is buffered until
// Finish() since "Content-Length" must be sent before it. Responses to
// requests before HTTP/1.1 are never chunked.
//
// `fd' must be blocking. Not thread-safe.
class WireResponseWriter : public HttpResponseWriter {
public:
    explicit WireResponseWriter(int fd);
    // Finish() the response if it's not.
    ~WireResponseWriter();

    // Version of the status line, set it to the version of the request.
    void set_version(int http_major, int http_minor);

    HttpHeader& header() override { return _header; }
    void WriteHeader(int status_code) override;
    int Write(const void* data, size_t n) override;
    int Flush() override;
    bool header_written() const override { return _header_written; }

    // Complete the response: write the last chunk of a chunked response, or
    // the headers and buffered body of others.
    // Returns 0 on success, -1 otherwise and errno is set.
    int Finish();

    bool chunked() const { return _chunked; }

private:
    DISALLOW_COPY_AND_ASSIGN(WireResponseWriter);

    void AppendHead(bool with_content_length);
    // Write all of _buf to _fd.
    int FlushBuffer();

    int _fd;
    HttpHeader _header;
    bool _header_written;
    bool _chunked;
    bool _finished;
    // errno of the first failed write, 0 if none.
    int _error;
    std::string _buf;
    std::string _body;
};

} // namespace pbgate

#endif // PBGATE_WIRE_RESPONSE_WRITER_H
