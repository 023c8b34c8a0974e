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
#include <sstream>
#include <gtest/gtest.h>
#include "gutil/status.h"

namespace {
class StatusTest : public ::testing::Test{
protected:
    StatusTest(){
    };
    virtual ~StatusTest(){};
    virtual void SetUp() {
    };
    virtual void TearDown() {
    };
};

TEST_F(StatusTest, success_status) {
    std::ostringstream oss;

    gutil::Status st;
    ASSERT_TRUE(st.ok());
    ASSERT_EQ(0, st.error_code());
    ASSERT_STREQ("OK", st.error_cstr());
    ASSERT_EQ("OK", st.error_str());
    oss << st;
    ASSERT_EQ("OK", oss.str());

    gutil::Status st2(0, "dropped text");
    ASSERT_TRUE(st2.ok());
    ASSERT_EQ(0, st2.error_code());
    ASSERT_EQ("OK", st2.error_str());

    gutil::Status st3 = gutil::Status::OK();
    ASSERT_TRUE(st3.ok());
    ASSERT_STREQ("OK", st3.error_cstr());
}

#define MARSHAL_STR "cannot marshal"
#define TYPE_STR "test.SimpleMessage"

TEST_F(StatusTest, failed_status) {
    std::ostringstream oss;

    gutil::Status st1(EINVAL, MARSHAL_STR);
    ASSERT_FALSE(st1.ok());
    ASSERT_EQ(EINVAL, st1.error_code());
    ASSERT_STREQ(MARSHAL_STR, st1.error_cstr());
    ASSERT_EQ(MARSHAL_STR, st1.error_str());
    oss << st1;
    ASSERT_EQ(MARSHAL_STR, oss.str());

    gutil::Status st2(EINVAL, "%s %s", MARSHAL_STR, TYPE_STR);
    ASSERT_FALSE(st2.ok());
    ASSERT_STREQ(MARSHAL_STR " " TYPE_STR, st2.error_cstr());

    const std::string msg = "from std::string";
    gutil::Status st3(ENOMEM, msg);
    ASSERT_EQ(ENOMEM, st3.error_code());
    ASSERT_EQ(msg, st3.error_str());
}

#define VERYLONGERROR                                                   \
    "verylongverylongverylongverylongverylongverylongverylongverylong"  \
    "verylongverylongverylongverylongverylongverylongverylongverylong"  \
    "verylongverylongverylongverylongverylongverylongverylongverylong"  \
    "verylongverylongverylongverylongverylongverylongverylongverylong"  \
    "verylongverylongverylongverylongverylongverylongverylongverylong"  \
    " error"

TEST_F(StatusTest, reset) {
    gutil::Status st1(ENOMEM, MARSHAL_STR);
    ASSERT_EQ(0, st1.set_error(EINVAL, "%s%s", MARSHAL_STR, TYPE_STR));
    ASSERT_EQ(EINVAL, st1.error_code());
    ASSERT_STREQ(MARSHAL_STR TYPE_STR, st1.error_cstr());

    st1.reset();
    ASSERT_TRUE(st1.ok());
    ASSERT_STREQ("OK", st1.error_cstr());

    ASSERT_EQ(0, st1.set_error(ENOMEM, "%s", VERYLONGERROR));
    ASSERT_EQ(ENOMEM, st1.error_code());
    ASSERT_STREQ(VERYLONGERROR, st1.error_cstr());

    ASSERT_EQ(0, st1.set_error(0, "ignored"));
    ASSERT_TRUE(st1.ok());
}

TEST_F(StatusTest, copy_and_swap) {
    gutil::Status st1(ENOMEM, MARSHAL_STR);
    gutil::Status st2;
    st2 = st1;
    ASSERT_EQ(ENOMEM, st2.error_code());
    ASSERT_EQ(MARSHAL_STR, st2.error_str());

    gutil::Status st3;
    st3.swap(st1);
    ASSERT_TRUE(st1.ok());
    ASSERT_EQ(ENOMEM, st3.error_code());
    ASSERT_EQ(MARSHAL_STR, st3.error_str());
}
} // namespace
