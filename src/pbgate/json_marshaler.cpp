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

#include <gflags/gflags.h>
#include <google/protobuf/util/json_util.h>
#include "pbgate/errno.pb.h"
#include "pbgate/json_marshaler.h"


namespace pbgate {

DEFINE_bool(pbgate_json_emit_defaults, false,
            "Print fields with default values in json responses");
DEFINE_bool(pbgate_json_orig_name, false, "Use field names of .proto files "
            "instead of lowerCamelCase names in json responses");
DEFINE_bool(pbgate_json_enums_as_ints, false,
            "Print enums as numbers in json responses");
DEFINE_bool(pbgate_json_indent, false, "Indent json responses");

JsonMarshalerOptions::JsonMarshalerOptions()
    : emit_defaults(FLAGS_pbgate_json_emit_defaults)
    , orig_name(FLAGS_pbgate_json_orig_name)
    , enums_as_ints(FLAGS_pbgate_json_enums_as_ints)
    , indent(FLAGS_pbgate_json_indent)
    , ignore_unknown_fields(true) {
}

JsonMarshaler::JsonMarshaler() {}

JsonMarshaler::JsonMarshaler(const JsonMarshalerOptions& options)
    : _options(options) {
}

static void AppendQuoted(std::string* out, const std::string& key) {
    out->push_back('"');
    for (size_t i = 0; i < key.size(); ++i) {
        const char c = key[i];
        if (c == '"' || c == '\\') {
            out->push_back('\\');
        }
        out->push_back(c);
    }
    out->push_back('"');
}

gutil::Status JsonMarshaler::Marshal(const Envelope& value,
                                     std::string* out) const {
    google::protobuf::util::JsonPrintOptions opt;
    opt.add_whitespace = _options.indent;
    opt.always_print_primitive_fields = _options.emit_defaults;
    opt.always_print_enums_as_ints = _options.enums_as_ints;
    opt.preserve_proto_field_names = _options.orig_name;

    std::string json;
    const google::protobuf::util::Status st =
        google::protobuf::util::MessageToJsonString(value.message(), &json, opt);
    if (!st.ok()) {
        return gutil::Status(EENCODING, "Fail to convert %s to json: %s",
                             value.message().GetTypeName().c_str(),
                             st.ToString().c_str());
    }
    out->clear();
    if (!value.wrapped()) {
        out->swap(json);
        return gutil::Status::OK();
    }
    out->reserve(json.size() + value.key().size() + 5);
    out->push_back('{');
    AppendQuoted(out, value.key());
    out->push_back(':');
    out->append(json);
    out->push_back('}');
    return gutil::Status::OK();
}

gutil::Status JsonMarshaler::Unmarshal(const std::string& data,
                                       google::protobuf::Message* message) const {
    google::protobuf::util::JsonParseOptions opt;
    opt.ignore_unknown_fields = _options.ignore_unknown_fields;
    const google::protobuf::util::Status st =
        google::protobuf::util::JsonStringToMessage(data, message, opt);
    if (!st.ok()) {
        return gutil::Status(EENCODING, "Fail to parse json into %s: %s",
                             message->GetTypeName().c_str(),
                             st.ToString().c_str());
    }
    return gutil::Status::OK();
}

std::string JsonMarshaler::ContentType() const {
    return "application/json";
}

std::string JsonMarshaler::Delimiter() const {
    return "\n";
}

} // namespace pbgate
