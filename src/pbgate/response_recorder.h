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

#ifndef PBGATE_RESPONSE_RECORDER_H
#define PBGATE_RESPONSE_RECORDER_H

#include <string>
#include "gutil/macros.h"
#include "pbgate/response_writer.h"


namespace pbgate {

// An HttpResponseWriter keeping the response in memory, for inspecting what
// the gateway produced.
class ResponseRecorder : public HttpResponseWriter {
public:
    ResponseRecorder();

    HttpHeader& header() override { return _header; }
    void WriteHeader(int status_code) override;
    int Write(const void* data, size_t n) override;
    int Flush() override;
    bool header_written() const override { return _header_written; }

    // Status code committed, 200 if nothing was committed.
    int code() const { return _code; }

    // Headers as they were when committed.
    const HttpHeader& result_header() const { return _result_header; }

    const std::string& body() const { return _body; }

    // Number of Flush() calls.
    int flushed() const { return _flushed; }

    // Number of Write() calls with non-empty data.
    int write_count() const { return _write_count; }

    // Number of WriteHeader() calls, including ignored ones.
    int write_header_count() const { return _write_header_count; }

private:
    DISALLOW_COPY_AND_ASSIGN(ResponseRecorder);

    HttpHeader _header;
    HttpHeader _result_header;
    bool _header_written;
    int _code;
    std::string _body;
    int _flushed;
    int _write_count;
    int _write_header_count;
};

} // namespace pbgate

#endif // PBGATE_RESPONSE_RECORDER_H
