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

#ifndef GUTIL_STATUS_H
#define GUTIL_STATUS_H

#include <stdarg.h>                       // va_list
#include <string>                         // std::string
#include <utility>                        // std::swap
#include <ostream>                        // std::ostream
#include "gutil/macros.h"

namespace gutil {

// A Status encapsulates the result of an operation. It may indicate success,
// or it may indicate an error with an associated error code and message.
// It's the error value returned by every fallible API of the gateway, which
// never throws.
//
// Multiple threads can invoke const methods on a Status without
// external synchronization, but if any of the threads may call a
// non-const method, all threads accessing the same Status must use
// external synchronization.
class Status {
public:
    // Create a success status.
    Status() : _code(0) { }
    // Return a success status.
    static Status OK() { return Status(); }

    // Create a failed status.
    // error_text is formatted from `fmt' and following arguments.
    // A zero `code' creates a success status and drops the text.
    Status(int code, const char* fmt, ...) GUTIL_PRINTF_FORMAT(3, 4);
    Status(int code, const std::string& error_msg) : _code(0) {
        set_error(code, error_msg);
    }

    // Reset this status to be OK.
    void reset() {
        _code = 0;
        _message.clear();
    }

    // Reset this status to be failed.
    // Returns 0 on success, -1 otherwise and internal fields are not changed.
    int set_error(int code, const char* error_format, ...)
        GUTIL_PRINTF_FORMAT(3, 4);
    int set_error(int code, const std::string& error_msg);
    int set_errorv(int code, const char* error_format, va_list args);

    // Returns true iff the status indicates success.
    bool ok() const { return _code == 0; }

    // Get the error code
    int error_code() const { return _code; }

    // Return a string representation of the status.
    // Returns "OK" for success.
    // NOTICE: if message contains '\0', error_cstr() will not be shown fully.
    const char* error_cstr() const {
        return ok() ? "OK" : _message.c_str();
    }
    std::string error_str() const {
        return ok() ? std::string("OK", 2) : _message;
    }

    void swap(Status& other) {
        std::swap(_code, other._code);
        _message.swap(other._message);
    }

private:
    int _code;
    std::string _message;
};

inline std::ostream& operator<<(std::ostream& os, const Status& st) {
    return os << st.error_str();
}

}  // namespace gutil

#endif  // GUTIL_STATUS_H
