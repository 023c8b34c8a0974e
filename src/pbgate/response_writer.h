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

#ifndef PBGATE_RESPONSE_WRITER_H
#define PBGATE_RESPONSE_WRITER_H

#include <stddef.h>                     // size_t
#include "pbgate/http_header.h"


namespace pbgate {

// Where the gateway writes one http response. A writer is owned by exactly
// one request for the whole time the response is being produced.
//
// Status code and headers are committed by the first WriteHeader() or by the
// first Write(), whichever comes first. Modifications to header() after that
// are not sent.
class HttpResponseWriter {
public:
    virtual ~HttpResponseWriter() {}

    // Headers to be sent with the response.
    virtual HttpHeader& header() = 0;

    // Commit `status_code' and header(). Calls after the first one are
    // ignored.
    virtual void WriteHeader(int status_code) = 0;

    // Append `n' bytes to the body, committing status 200 if nothing was
    // committed yet.
    // Returns 0 on success, -1 otherwise and errno is set.
    virtual int Write(const void* data, size_t n) = 0;

    // Send everything written so far to the client.
    // Returns 0 on success, -1 otherwise and errno is set.
    virtual int Flush() = 0;

    // True iff status and headers were committed.
    virtual bool header_written() const = 0;
};

} // namespace pbgate

#endif // PBGATE_RESPONSE_WRITER_H
