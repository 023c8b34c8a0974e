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
#include "pbgate/response_recorder.h"


namespace pbgate {

ResponseRecorder::ResponseRecorder()
    : _header_written(false)
    , _code(HTTP_STATUS_OK)
    , _flushed(0)
    , _write_count(0)
    , _write_header_count(0) {
}

void ResponseRecorder::WriteHeader(int status_code) {
    ++_write_header_count;
    if (_header_written) {
        LOG(WARNING) << "Superfluous WriteHeader(" << status_code
                     << "), status " << _code << " was already written";
        return;
    }
    _header_written = true;
    _code = status_code;
    _result_header = _header;
    _result_header.set_status_code(status_code);
}

int ResponseRecorder::Write(const void* data, size_t n) {
    if (!_header_written) {
        WriteHeader(HTTP_STATUS_OK);
    }
    if (n == 0) {
        return 0;
    }
    ++_write_count;
    _body.append(static_cast<const char*>(data), n);
    return 0;
}

int ResponseRecorder::Flush() {
    if (!_header_written) {
        WriteHeader(HTTP_STATUS_OK);
    }
    ++_flushed;
    return 0;
}

} // namespace pbgate
