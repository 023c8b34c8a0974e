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
#include "pbgate/errno.pb.h"
#include "pbgate/rpc_error.h"
#include "echo.pb.h"

namespace {

class RpcErrorTest : public testing::Test {
};

TEST_F(RpcErrorTest, default_is_ok) {
    pbgate::RpcError e;
    ASSERT_TRUE(e.ok());
    ASSERT_FALSE(e.has_grpc_status());
    ASSERT_EQ(pbgate::GRPC_OK, e.grpc_status());
    ASSERT_EQ("OK", e.ToString());

    pbgate::RpcError e2(gutil::Status::OK());
    ASSERT_TRUE(e2.ok());
}

TEST_F(RpcErrorTest, status_failure) {
    pbgate::RpcError e(pbgate::GRPC_NOTFOUND, "no such resource");
    ASSERT_FALSE(e.ok());
    ASSERT_TRUE(e.has_grpc_status());
    ASSERT_EQ(pbgate::GRPC_NOTFOUND, e.grpc_status());
    ASSERT_EQ(pbgate::GRPC_NOTFOUND, pbgate::CanonicalCode(e));
    ASSERT_EQ("GRPC_NOTFOUND: no such resource", e.ToString());
}

TEST_F(RpcErrorTest, plain_failure_is_internal) {
    pbgate::RpcError e(gutil::Status(pbgate::ETRANSPORT, "connection reset"));
    ASSERT_FALSE(e.ok());
    ASSERT_FALSE(e.has_grpc_status());
    ASSERT_EQ(pbgate::ETRANSPORT, e.error_code());
    ASSERT_EQ(pbgate::GRPC_INTERNAL, pbgate::CanonicalCode(e));
    ASSERT_EQ("connection reset", e.message());
    ASSERT_EQ("[2002] connection reset", e.ToString());
}

TEST_F(RpcErrorTest, logged_string_is_truncated) {
    pbgate::RpcError e(pbgate::GRPC_INTERNAL, std::string(100, 'x'));
    const std::string full = e.ToString();
    ASSERT_EQ(full, pbgate::ToLoggedString(e, 0));
    ASSERT_EQ(full, pbgate::ToLoggedString(e, 1000));
    ASSERT_EQ(full.substr(0, 10) + "...", pbgate::ToLoggedString(e, 10));
}

TEST_F(RpcErrorTest, error_body) {
    pbgate::RpcError e(pbgate::GRPC_OUTOFRANGE, "past the end");
    test::DebugInfo info;
    info.set_detail("offset=10");
    e.AddDetail(info);

    pbgate::ErrorBody body;
    pbgate::BuildErrorBody(e, &body);
    ASSERT_EQ("past the end", body.error());
    ASSERT_EQ((int)pbgate::GRPC_OUTOFRANGE, body.code());
    ASSERT_EQ(1, body.details_size());
    test::DebugInfo unpacked;
    ASSERT_TRUE(body.details(0).UnpackTo(&unpacked));
    ASSERT_EQ("offset=10", unpacked.detail());

    // Plain failures keep their text under INTERNAL.
    pbgate::RpcError plain(gutil::Status(pbgate::EENCODING, "bad utf8"));
    pbgate::BuildErrorBody(plain, &body);
    ASSERT_EQ("bad utf8", body.error());
    ASSERT_EQ((int)pbgate::GRPC_INTERNAL, body.code());
    ASSERT_EQ(0, body.details_size());
}

TEST_F(RpcErrorTest, stream_error) {
    pbgate::RpcError e(pbgate::GRPC_UNAVAILABLE, "backend down");
    pbgate::StreamError se;
    pbgate::BuildStreamError(e, &se);
    ASSERT_EQ((int)pbgate::GRPC_UNAVAILABLE, se.grpc_code());
    ASSERT_EQ(503, se.http_code());
    ASSERT_EQ("backend down", se.message());
    ASSERT_EQ("Service Unavailable", se.http_status());

    pbgate::RpcError plain(gutil::Status(pbgate::ETRANSPORT, "reset"));
    pbgate::BuildStreamError(plain, &se);
    ASSERT_EQ((int)pbgate::GRPC_INTERNAL, se.grpc_code());
    ASSERT_EQ(500, se.http_code());
    ASSERT_EQ("reset", se.message());
    ASSERT_EQ("Internal Server Error", se.http_status());
}

} // namespace
