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

#ifndef GUTIL_LOGGING_H
#define GUTIL_LOGGING_H

#include <errno.h>                        // errno
#include <string>
#include <sstream>
#include <mutex>
#include <gflags/gflags_declare.h>
#include "gutil/macros.h"

// Stream-style logging used across the gateway.
//
// Make a bunch of macros for logging.  The way to log things is to stream
// things to LOG(<a particular severity level>).  E.g.,
//
//   LOG(INFO) << "Found " << num_cookies << " cookies";
//
// You can also do conditional logging:
//
//   LOG_IF(INFO, num_cookies > 10) << "Got lots of cookies";
//
// The CHECK(condition) macro is active in both debug and release builds and
// effectively performs a LOG(FATAL) which terminates the process only when
// -crash_on_fatal_log is on.
//
//   CHECK(writer != NULL) << "Need a writer";
//
// There are also "debug mode" variations of these macros (DLOG, DCHECK)
// which are compiled away in release builds.
//
// Verbose logs are controlled by -v:
//
//   VLOG(1) << "I'm printed when you run the program with --v=1 or more";
//
// PLOG() and PLOG_IF() append the description of the current errno.

namespace gutil {
namespace logging {

DECLARE_int32(v);
DECLARE_int32(minloglevel);
DECLARE_bool(crash_on_fatal_log);

typedef int LogSeverity;
const LogSeverity BLOG_VERBOSE = -1;  // This is level 1 verbosity
// Note: the log severities are used to index into the array of names,
// see log_severity_names.
const LogSeverity BLOG_INFO = 0;
const LogSeverity BLOG_NOTICE = 1;
const LogSeverity BLOG_WARNING = 2;
const LogSeverity BLOG_ERROR = 3;
const LogSeverity BLOG_FATAL = 4;
const int LOG_NUM_SEVERITIES = 5;

// BLOG_DFATAL is BLOG_FATAL in debug mode, ERROR in normal mode
#ifndef NDEBUG
const LogSeverity BLOG_DFATAL = BLOG_FATAL;
#else
const LogSeverity BLOG_DFATAL = BLOG_ERROR;
#endif

// Sets the log level. Anything at or above this level will be written to the
// log file/displayed to the user (if applicable). Anything below this level
// will be silently ignored.
void SetMinLogLevel(int level);

// Gets the current log level.
int GetMinLogLevel();

class LogSink {
public:
    LogSink() {}
    virtual ~LogSink() {}
    // Called when a log is ready to be written out.
    // Returns true to stop further processing.
    virtual bool OnLogMessage(int severity, const char* file, int line,
                              const char* func,
                              const std::string& log_content) = 0;
private:
    DISALLOW_COPY_AND_ASSIGN(LogSink);
};

// Sets the LogSink that gets passed every log message before
// it's sent to stderr.
// This function is thread-safe and waits until current LogSink is not used
// anymore. A sink must not log by itself.
// Returns previous sink.
LogSink* SetLogSink(LogSink* sink);

// Print |content| with other info into |os|.
void PrintLog(std::ostream& os,
              int severity, const char* file, int line,
              const char* func, const std::string& content);

// The LogSink mainly for unit-testing. Logs will be appended to it.
class StringSink : public LogSink, public std::string {
public:
    bool OnLogMessage(int severity, const char* file, int line,
                      const char* func,
                      const std::string& log_content) override;
private:
    std::mutex _mutex;
};

// Used by CHECK_EQ() and friends.
template <typename t1, typename t2>
std::string* MakeCheckOpString(const t1& v1, const t2& v2, const char* names) {
    std::ostringstream ss;
    ss << names << " (" << v1 << " vs. " << v2 << ")";
    return new std::string(ss.str());
}

// This class more or less represents a particular log message.  You
// create an instance of LogMessage and then stream stuff to it.
// When you finish streaming to it, ~LogMessage is called and the
// full message gets streamed to the appropriate destination.
class LogMessage {
public:
    LogMessage(const char* file, int line, const char* func,
               LogSeverity severity);

    // Used for CHECK_EQ(), etc. Takes ownership of the given string.
    // Implied severity = BLOG_FATAL.
    LogMessage(const char* file, int line, const char* func,
               std::string* result);

    ~LogMessage();

    std::ostream& stream() { return _stream; }

private:
    DISALLOW_COPY_AND_ASSIGN(LogMessage);

    const char* _file;
    int _line;
    const char* _func;
    LogSeverity _severity;
    std::ostringstream _stream;
};

// Appends a formatted system message of the errno type
class ErrnoLogMessage {
public:
    ErrnoLogMessage(const char* file, int line, const char* func,
                    LogSeverity severity, int err);

    // Appends the error message before destructing the encapsulated class.
    ~ErrnoLogMessage();

    std::ostream& stream() { return _log_message.stream(); }

private:
    DISALLOW_COPY_AND_ASSIGN(ErrnoLogMessage);

    int _err;
    LogMessage _log_message;
};

// This class is used to explicitly ignore values in the conditional
// logging macros.  This avoids compiler warnings like "value computed
// is not used" and "statement has no effect".
class LogMessageVoidify {
public:
    LogMessageVoidify() { }
    // This has to be an operator with a precedence lower than << but
    // higher than ?:
    void operator&(std::ostream&) { }
};

#define GUTIL_DEFINE_CHECK_OP_IMPL(name, op)                            \
    template <class t1, class t2>                                       \
    inline std::string* Check##name##Impl(const t1& v1, const t2& v2,   \
                                          const char* names) {          \
        if (v1 op v2) {                                                 \
            return NULL;                                                \
        }                                                               \
        return MakeCheckOpString(v1, v2, names);                        \
    }
GUTIL_DEFINE_CHECK_OP_IMPL(EQ, ==)
GUTIL_DEFINE_CHECK_OP_IMPL(NE, !=)
GUTIL_DEFINE_CHECK_OP_IMPL(LE, <=)
GUTIL_DEFINE_CHECK_OP_IMPL(LT, < )
GUTIL_DEFINE_CHECK_OP_IMPL(GE, >=)
GUTIL_DEFINE_CHECK_OP_IMPL(GT, > )
#undef GUTIL_DEFINE_CHECK_OP_IMPL

}  // namespace logging
}  // namespace gutil

#define GUTIL_COMPACT_LOG(severity)                                     \
    ::gutil::logging::LogMessage(__FILE__, __LINE__, __func__,          \
                                 ::gutil::logging::BLOG_##severity)

// As special cases, we can assume that LOG_IS_ON(FATAL) always holds.
#define LOG_IS_ON(severity)                                             \
    (::gutil::logging::BLOG_##severity >=                               \
     ::gutil::logging::GetMinLogLevel())

#define VLOG_IS_ON(verbose_level)                                       \
    (::gutil::logging::FLAGS_v >= (verbose_level))

// Helper macro which avoids evaluating the arguments to a stream if
// the condition doesn't hold.
#define GUTIL_LAZY_STREAM(stream, condition)                            \
    !(condition) ? (void) 0 : ::gutil::logging::LogMessageVoidify() & (stream)

#define LOG_STREAM(severity) GUTIL_COMPACT_LOG(severity).stream()

#define LOG(severity)                                                   \
    GUTIL_LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity))
#define LOG_IF(severity, condition)                                     \
    GUTIL_LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity) && (condition))

#define VLOG_STREAM(verbose_level)                                      \
    ::gutil::logging::LogMessage(__FILE__, __LINE__, __func__,          \
                                 -(verbose_level)).stream()
#define VLOG(verbose_level)                                             \
    GUTIL_LAZY_STREAM(VLOG_STREAM(verbose_level), VLOG_IS_ON(verbose_level))
#define VLOG_IF(verbose_level, condition)                               \
    GUTIL_LAZY_STREAM(VLOG_STREAM(verbose_level),                       \
                      VLOG_IS_ON(verbose_level) && (condition))

#define PLOG_STREAM(severity)                                           \
    ::gutil::logging::ErrnoLogMessage(__FILE__, __LINE__, __func__,     \
        ::gutil::logging::BLOG_##severity, errno).stream()
#define PLOG(severity)                                                  \
    GUTIL_LAZY_STREAM(PLOG_STREAM(severity), LOG_IS_ON(severity))
#define PLOG_IF(severity, condition)                                    \
    GUTIL_LAZY_STREAM(PLOG_STREAM(severity), LOG_IS_ON(severity) && (condition))

#define CHECK(condition)                                                \
    GUTIL_LAZY_STREAM(LOG_STREAM(FATAL), !(condition))                  \
    << "Check failed: " #condition ". "

#define PCHECK(condition)                                               \
    GUTIL_LAZY_STREAM(PLOG_STREAM(FATAL), !(condition))                 \
    << "Check failed: " #condition ". "

#define GUTIL_CHECK_OP(name, op, val1, val2)                            \
    if (std::string* _result =                                          \
        ::gutil::logging::Check##name##Impl((val1), (val2),             \
                                            #val1 " " #op " " #val2))   \
        ::gutil::logging::LogMessage(__FILE__, __LINE__, __func__,      \
                                     _result).stream()

#define CHECK_EQ(val1, val2) GUTIL_CHECK_OP(EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) GUTIL_CHECK_OP(NE, !=, val1, val2)
#define CHECK_LE(val1, val2) GUTIL_CHECK_OP(LE, <=, val1, val2)
#define CHECK_LT(val1, val2) GUTIL_CHECK_OP(LT, < , val1, val2)
#define CHECK_GE(val1, val2) GUTIL_CHECK_OP(GE, >=, val1, val2)
#define CHECK_GT(val1, val2) GUTIL_CHECK_OP(GT, > , val1, val2)

#ifndef NDEBUG
# define DLOG(severity) LOG(severity)
# define DLOG_IF(severity, condition) LOG_IF(severity, condition)
# define DCHECK(condition) CHECK(condition)
#else
# define DLOG(severity) GUTIL_LAZY_STREAM(LOG_STREAM(severity), false)
# define DLOG_IF(severity, condition)                                   \
    GUTIL_LAZY_STREAM(LOG_STREAM(severity), false && (condition))
# define DCHECK(condition)                                              \
    GUTIL_LAZY_STREAM(LOG_STREAM(FATAL), false && !(condition))
#endif

#endif  // GUTIL_LOGGING_H
