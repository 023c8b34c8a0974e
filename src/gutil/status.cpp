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

#include <stdio.h>
#include <string.h>
#include "gutil/status.h"

namespace gutil {

Status::Status(int code, const char* fmt, ...) : _code(0) {
    va_list ap;
    va_start(ap, fmt);
    set_errorv(code, fmt, ap);
    va_end(ap);
}

int Status::set_error(int code, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    const int rc = set_errorv(code, fmt, ap);
    va_end(ap);
    return rc;
}

int Status::set_error(int code, const std::string& error_msg) {
    if (0 == code) {
        reset();
        return 0;
    }
    _code = code;
    _message = error_msg;
    return 0;
}

int Status::set_errorv(int code, const char* fmt, va_list args) {
    if (0 == code) {
        reset();
        return 0;
    }
    char buf[256];
    va_list copied_args;
    va_copy(copied_args, args);
    const int bytes_used = vsnprintf(buf, sizeof(buf), fmt, copied_args);
    va_end(copied_args);
    if (bytes_used < 0) {
        return -1;
    }
    if ((size_t)bytes_used < sizeof(buf)) {
        _message.assign(buf, bytes_used);
    } else {
        // Not enough space, format again into a buffer of exact size.
        std::string msg;
        msg.resize(bytes_used + 1);
        va_copy(copied_args, args);
        const int bytes_used2 =
            vsnprintf(&msg[0], msg.size(), fmt, copied_args);
        va_end(copied_args);
        if (bytes_used2 != bytes_used) {
            return -1;
        }
        msg.resize(bytes_used);
        _message.swap(msg);
    }
    _code = code;
    return 0;
}

}  // namespace gutil
