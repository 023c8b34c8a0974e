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

#include <gtest/gtest.h>
#include "pbgate/http_status_code.h"

class HttpStatusTest : public testing::Test {
    void SetUp() {}
    void TearDown() {}
};

TEST_F(HttpStatusTest, reason_phrase) {
    ASSERT_STREQ("OK", pbgate::HttpReasonPhrase(
                     pbgate::HTTP_STATUS_OK));
    ASSERT_STREQ("Continue", pbgate::HttpReasonPhrase(
                     pbgate::HTTP_STATUS_CONTINUE));
    ASSERT_STREQ("Too Many Requests", pbgate::HttpReasonPhrase(
                     pbgate::HTTP_STATUS_TOO_MANY_REQUESTS));
    ASSERT_STREQ("HTTP Version Not Supported", pbgate::HttpReasonPhrase(
                     pbgate::HTTP_STATUS_VERSION_NOT_SUPPORTED));
    ASSERT_STREQ("Unknown status code (-2)", pbgate::HttpReasonPhrase(-2));
}

TEST_F(HttpStatusTest, grpc_to_http) {
    struct {
        pbgate::GrpcStatus grpc;
        int http;
    } const cases[] = {
        { pbgate::GRPC_OK,                  200 },
        { pbgate::GRPC_CANCELED,            408 },
        { pbgate::GRPC_UNKNOWN,             500 },
        { pbgate::GRPC_INVALIDARGUMENT,     400 },
        { pbgate::GRPC_DEADLINEEXCEEDED,    504 },
        { pbgate::GRPC_NOTFOUND,            404 },
        { pbgate::GRPC_ALREADYEXISTS,       409 },
        { pbgate::GRPC_PERMISSIONDENIED,    403 },
        { pbgate::GRPC_UNAUTHENTICATED,     401 },
        { pbgate::GRPC_RESOURCEEXHAUSTED,   429 },
        { pbgate::GRPC_FAILEDPRECONDITION,  400 },
        { pbgate::GRPC_ABORTED,             409 },
        { pbgate::GRPC_OUTOFRANGE,          400 },
        { pbgate::GRPC_UNIMPLEMENTED,       501 },
        { pbgate::GRPC_INTERNAL,            500 },
        { pbgate::GRPC_UNAVAILABLE,         503 },
        { pbgate::GRPC_DATALOSS,            500 },
    };
    for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
        EXPECT_EQ(cases[i].http, pbgate::GrpcStatusToHttpStatus(cases[i].grpc))
            << pbgate::GrpcStatusToString(cases[i].grpc);
        // Same input, same output.
        EXPECT_EQ(pbgate::GrpcStatusToHttpStatus(cases[i].grpc),
                  pbgate::GrpcStatusToHttpStatus(cases[i].grpc));
    }
}

TEST_F(HttpStatusTest, unknown_grpc_status) {
    ASSERT_EQ(500, pbgate::GrpcStatusToHttpStatus(pbgate::GRPC_MAX));
    // GrpcStatus is based on int, any int is a valid value of it.
    ASSERT_EQ(500, pbgate::GrpcStatusToHttpStatus((pbgate::GrpcStatus)999));
    ASSERT_EQ(500, pbgate::GrpcStatusToHttpStatus((pbgate::GrpcStatus)-1));
    ASSERT_FALSE(pbgate::IsValidGrpcStatus(pbgate::GRPC_MAX));
    ASSERT_TRUE(pbgate::IsValidGrpcStatus(pbgate::GRPC_UNAUTHENTICATED));
}
