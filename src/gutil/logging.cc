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

#include <stdlib.h>                        // abort
#include <string.h>                        // strerror_r
#include <sys/syscall.h>                   // SYS_gettid
#include <sys/time.h>                      // gettimeofday
#include <time.h>                          // localtime_r
#include <unistd.h>                        // syscall
#include <algorithm>                       // std::min
#include <iomanip>                         // std::setw
#include <iostream>                        // std::cerr
#include <gflags/gflags.h>

namespace gutil {
namespace logging {

DEFINE_bool(crash_on_fatal_log, false,
            "Crash process when a FATAL log is printed");

DEFINE_int32(v, 0, "Show all VLOG(m) messages for m <= this.");

DEFINE_int32(minloglevel, 0, "Any log at or above this level will be "
             "displayed. Anything below this level will be silently ignored. "
             "0=INFO 1=NOTICE 2=WARNING 3=ERROR 4=FATAL");

DEFINE_bool(log_func_name, false, "Log function name in each log");

static std::mutex s_sink_mutex;
static LogSink* s_sink = NULL;

void SetMinLogLevel(int level) {
    FLAGS_minloglevel = std::min(BLOG_FATAL, level);
}

int GetMinLogLevel() {
    return FLAGS_minloglevel;
}

LogSink* SetLogSink(LogSink* sink) {
    std::lock_guard<std::mutex> guard(s_sink_mutex);
    LogSink* old_sink = s_sink;
    s_sink = sink;
    return old_sink;
}

const char* const log_severity_names[LOG_NUM_SEVERITIES] = {
    "INFO", "NOTICE", "WARNING", "ERROR", "FATAL" };

static void PrintLogSeverity(std::ostream& os, int severity) {
    if (severity < 0) {
        // Add extra space to separate from following datetime.
        os << 'V' << -severity << ' ';
    } else if (severity < LOG_NUM_SEVERITIES) {
        os << log_severity_names[severity][0];
    } else {
        os << 'U';
    }
}

static void PrintLogPrefix(std::ostream& os, int severity,
                           const char* file, int line, const char* func) {
    PrintLogSeverity(os, severity);
    timeval tv;
    gettimeofday(&tv, NULL);
    time_t t = tv.tv_sec;
    struct tm local_tm;
    localtime_r(&t, &local_tm);
    const char prev_fill = os.fill('0');
    os << std::setw(2) << local_tm.tm_mon + 1
       << std::setw(2) << local_tm.tm_mday << ' '
       << std::setw(2) << local_tm.tm_hour << ':'
       << std::setw(2) << local_tm.tm_min << ':'
       << std::setw(2) << local_tm.tm_sec
       << '.' << std::setw(6) << tv.tv_usec;
    os << ' ' << std::setfill(' ') << std::setw(5)
       << (long)syscall(SYS_gettid) << std::setfill('0');
    os << ' ' << file << ':' << line;
    if (FLAGS_log_func_name && func && *func != '\0') {
        os << " " << func;
    }
    os << "] ";
    os.fill(prev_fill);
}

void PrintLog(std::ostream& os, int severity, const char* file, int line,
              const char* func, const std::string& content) {
    PrintLogPrefix(os, severity, file, line, func);
    os << content;
    if (content.empty() || content[content.size() - 1] != '\n') {
        os << '\n';
    }
}

bool StringSink::OnLogMessage(int severity, const char* file, int line,
                              const char* func,
                              const std::string& content) {
    std::ostringstream os;
    PrintLog(os, severity, file, line, func, content);
    const std::string msg = os.str();
    {
        std::lock_guard<std::mutex> guard(_mutex);
        append(msg);
    }
    return true;
}

LogMessage::LogMessage(const char* file, int line, const char* func,
                       LogSeverity severity)
    : _file(file), _line(line), _func(func), _severity(severity) {
}

LogMessage::LogMessage(const char* file, int line, const char* func,
                       std::string* result)
    : _file(file), _line(line), _func(func), _severity(BLOG_FATAL) {
    _stream << "Check failed: " << *result;
    delete result;
}

LogMessage::~LogMessage() {
    const std::string content = _stream.str();
    bool done = false;
    {
        std::lock_guard<std::mutex> guard(s_sink_mutex);
        if (s_sink != NULL) {
            done = s_sink->OnLogMessage(_severity, _file, _line, _func,
                                        content);
        }
    }
    if (!done) {
        std::ostringstream os;
        PrintLog(os, _severity, _file, _line, _func, content);
        std::cerr << os.str() << std::flush;
    }
    if (_severity == BLOG_FATAL && FLAGS_crash_on_fatal_log) {
        abort();
    }
}

ErrnoLogMessage::ErrnoLogMessage(const char* file, int line, const char* func,
                                 LogSeverity severity, int err)
    : _err(err)
    , _log_message(file, line, func, severity) {
}

ErrnoLogMessage::~ErrnoLogMessage() {
    char buf[128];
    // GNU strerror_r returns the message which may not be in `buf'.
    const char* desc = strerror_r(_err, buf, sizeof(buf));
    stream() << ": " << desc;
}

}  // namespace logging
}  // namespace gutil
