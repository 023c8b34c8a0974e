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

#include <errno.h>
#include <gtest/gtest.h>
#include "gutil/logging.h"

namespace {

class LoggingTest : public testing::Test {
protected:
    void SetUp() override {
        _old_min_log_level = ::gutil::logging::GetMinLogLevel();
        _old_v = ::gutil::logging::FLAGS_v;
        _old_sink = ::gutil::logging::SetLogSink(&_sink);
    }
    void TearDown() override {
        ::gutil::logging::SetLogSink(_old_sink);
        ::gutil::logging::SetMinLogLevel(_old_min_log_level);
        ::gutil::logging::FLAGS_v = _old_v;
    }

    ::gutil::logging::StringSink _sink;
    ::gutil::logging::LogSink* _old_sink;
    int _old_min_log_level;
    int _old_v;
};

TEST_F(LoggingTest, log_is_on) {
    ::gutil::logging::SetMinLogLevel(::gutil::logging::BLOG_INFO);
    EXPECT_TRUE(LOG_IS_ON(INFO));
    EXPECT_TRUE(LOG_IS_ON(WARNING));
    EXPECT_TRUE(LOG_IS_ON(FATAL));

    ::gutil::logging::SetMinLogLevel(::gutil::logging::BLOG_ERROR);
    EXPECT_FALSE(LOG_IS_ON(INFO));
    EXPECT_FALSE(LOG_IS_ON(WARNING));
    EXPECT_TRUE(LOG_IS_ON(ERROR));

    // Levels above FATAL are clamped.
    ::gutil::logging::SetMinLogLevel(100);
    EXPECT_EQ(::gutil::logging::BLOG_FATAL, ::gutil::logging::GetMinLogLevel());
}

TEST_F(LoggingTest, sink_receives_logs) {
    ::gutil::logging::SetMinLogLevel(::gutil::logging::BLOG_INFO);
    LOG(WARNING) << "marshal " << 42;
    ASSERT_NE(std::string::npos, _sink.find("marshal 42\n"));
    ASSERT_EQ('W', _sink[0]);
    ASSERT_NE(std::string::npos, _sink.find("gutil_logging_unittest.cpp:"));
}

TEST_F(LoggingTest, filtered_logs_are_not_evaluated) {
    ::gutil::logging::SetMinLogLevel(::gutil::logging::BLOG_ERROR);
    int count = 0;
    LOG(INFO) << ++count;
    LOG_IF(ERROR, false) << ++count;
    ASSERT_EQ(0, count);
    ASSERT_TRUE(_sink.empty());
    LOG_IF(ERROR, true) << ++count;
    ASSERT_EQ(1, count);
    ASSERT_EQ('E', _sink[0]);
}

TEST_F(LoggingTest, vlog) {
    ::gutil::logging::FLAGS_v = 0;
    VLOG(1) << "hidden";
    ASSERT_TRUE(_sink.empty());
    ::gutil::logging::FLAGS_v = 2;
    VLOG(2) << "shown";
    ASSERT_NE(std::string::npos, _sink.find("shown"));
    ASSERT_EQ(0, _sink.find("V2 "));
}

TEST_F(LoggingTest, plog_appends_errno) {
    ::gutil::logging::SetMinLogLevel(::gutil::logging::BLOG_INFO);
    errno = EPIPE;
    PLOG(WARNING) << "Fail to write";
    ASSERT_NE(std::string::npos, _sink.find("Fail to write: "));
    ASSERT_NE(std::string::npos, _sink.find("Broken pipe"));
}

TEST_F(LoggingTest, check_without_crash) {
    const bool saved = ::gutil::logging::FLAGS_crash_on_fatal_log;
    ::gutil::logging::FLAGS_crash_on_fatal_log = false;
    CHECK(1 + 1 == 3) << "math";
    ASSERT_NE(std::string::npos, _sink.find("Check failed: 1 + 1 == 3. math"));
    _sink.clear();
    CHECK_EQ(1, 2);
    ASSERT_NE(std::string::npos, _sink.find("Check failed: 1 == 2 (1 vs. 2)"));
    _sink.clear();
    CHECK_LT(1, 2);
    ASSERT_TRUE(_sink.empty());
    ::gutil::logging::FLAGS_crash_on_fatal_log = saved;
}

} // namespace
