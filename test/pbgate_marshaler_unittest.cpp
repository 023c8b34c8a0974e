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
#include "pbgate/json_marshaler.h"
#include "pbgate/marshaler_registry.h"
#include "pbgate/proto_marshaler.h"
#include "echo.pb.h"

namespace {

// Marshaler without the Delimited capability.
class PlainMarshaler : public pbgate::Marshaler {
public:
    gutil::Status Marshal(const pbgate::Envelope&, std::string* out) const override {
        out->assign("plain");
        return gutil::Status::OK();
    }
    gutil::Status Unmarshal(const std::string&,
                            google::protobuf::Message*) const override {
        return gutil::Status::OK();
    }
    std::string ContentType() const override { return "text/plain"; }
};

class DelimitedMarshaler : public PlainMarshaler, public pbgate::Delimited {
public:
    std::string Delimiter() const override { return "\r\n\r\n"; }
};

class MarshalerTest : public testing::Test {
};

TEST_F(MarshalerTest, delimiter_probe) {
    PlainMarshaler plain;
    DelimitedMarshaler delimited;
    pbgate::JsonMarshaler json;
    pbgate::ProtoMarshaler proto;
    ASSERT_EQ("\n", pbgate::GetDelimiter(plain));
    ASSERT_EQ("\r\n\r\n", pbgate::GetDelimiter(delimited));
    ASSERT_EQ("\n", pbgate::GetDelimiter(json));
    ASSERT_EQ("\n", pbgate::GetDelimiter(proto));
}

TEST_F(MarshalerTest, json_bare_and_wrapped) {
    pbgate::JsonMarshaler m;
    test::SimpleMessage msg;
    msg.set_id("One");
    std::string out;
    ASSERT_TRUE(m.Marshal(pbgate::Envelope(msg), &out).ok());
    ASSERT_EQ("{\"id\":\"One\"}", out);
    ASSERT_TRUE(m.Marshal(pbgate::Envelope(pbgate::RESULT_KEY, msg), &out).ok());
    ASSERT_EQ("{\"result\":{\"id\":\"One\"}}", out);
    ASSERT_EQ("application/json", m.ContentType());
}

TEST_F(MarshalerTest, json_options) {
    test::ColoredMessage msg;
    msg.set_display_name("dot");
    msg.set_color(test::COLOR_RED);
    std::string out;

    pbgate::JsonMarshaler camel;
    ASSERT_TRUE(camel.Marshal(pbgate::Envelope(msg), &out).ok());
    ASSERT_EQ("{\"displayName\":\"dot\",\"color\":\"COLOR_RED\"}", out);

    pbgate::JsonMarshalerOptions opt;
    opt.orig_name = true;
    opt.enums_as_ints = true;
    opt.emit_defaults = true;
    pbgate::JsonMarshaler orig(opt);
    ASSERT_TRUE(orig.Marshal(pbgate::Envelope(msg), &out).ok());
    ASSERT_EQ("{\"display_name\":\"dot\",\"color\":1,\"count\":0}", out);
}

TEST_F(MarshalerTest, json_unmarshal) {
    pbgate::JsonMarshaler m;
    test::SimpleMessage msg;
    ASSERT_TRUE(m.Unmarshal("{\"id\":\"Two\",\"unknown\":1}", &msg).ok());
    ASSERT_EQ("Two", msg.id());

    const gutil::Status st = m.Unmarshal("{\"id\":", &msg);
    ASSERT_FALSE(st.ok());
    ASSERT_EQ(pbgate::EENCODING, st.error_code());

    pbgate::JsonMarshalerOptions opt;
    opt.ignore_unknown_fields = false;
    pbgate::JsonMarshaler strict(opt);
    ASSERT_FALSE(strict.Unmarshal("{\"unknown\":1}", &msg).ok());
}

TEST_F(MarshalerTest, proto_cannot_wrap) {
    pbgate::ProtoMarshaler m;
    test::SimpleMessage msg;
    msg.set_id("One");
    std::string out;
    ASSERT_TRUE(m.Marshal(pbgate::Envelope(msg), &out).ok());
    test::SimpleMessage msg2;
    ASSERT_TRUE(m.Unmarshal(out, &msg2).ok());
    ASSERT_EQ("One", msg2.id());

    const gutil::Status st =
        m.Marshal(pbgate::Envelope(pbgate::ERROR_KEY, msg), &out);
    ASSERT_FALSE(st.ok());
    ASSERT_EQ(pbgate::EENCODING, st.error_code());
    ASSERT_EQ("application/octet-stream", m.ContentType());
}

TEST_F(MarshalerTest, registry_defaults_to_json) {
    pbgate::MarshalerRegistry reg;
    const pbgate::Marshaler* wildcard = reg.Find(pbgate::MIME_WILDCARD);
    ASSERT_TRUE(wildcard != NULL);
    ASSERT_EQ("application/json", wildcard->ContentType());
    ASSERT_TRUE(reg.Find("application/json") == NULL);

    pbgate::HttpHeader req;
    const pbgate::Marshaler* in = NULL;
    const pbgate::Marshaler* out = NULL;
    reg.ForRequest(req, &in, &out);
    ASSERT_EQ(wildcard, in);
    ASSERT_EQ(wildcard, out);
}

TEST_F(MarshalerTest, registry_select_by_mime) {
    pbgate::MarshalerRegistry reg;
    pbgate::ProtoMarshaler proto;
    PlainMarshaler plain;
    ASSERT_EQ(-1, reg.Add("", &proto));
    ASSERT_EQ(-1, reg.Add("application/x-protobuf", NULL));
    ASSERT_EQ(0, reg.Add("application/x-protobuf", &proto));
    ASSERT_EQ(0, reg.Add("text/plain", &plain));

    pbgate::HttpHeader req;
    req.set_content_type("application/x-protobuf; charset=binary");
    req.SetHeader("Accept", "text/html, text/plain;q=0.9");
    const pbgate::Marshaler* in = NULL;
    const pbgate::Marshaler* out = NULL;
    reg.ForRequest(req, &in, &out);
    ASSERT_EQ(&proto, in);
    ASSERT_EQ(&plain, out);

    // Outbound follows inbound without a matched Accept.
    req.SetHeader("Accept", "text/html");
    reg.ForRequest(req, &in, &out);
    ASSERT_EQ(&proto, in);
    ASSERT_EQ(&proto, out);
}

} // namespace
