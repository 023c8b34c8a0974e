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

#ifndef PBGATE_JSON_MARSHALER_H
#define PBGATE_JSON_MARSHALER_H

#include "pbgate/marshaler.h"


namespace pbgate {

struct JsonMarshalerOptions {
    // Defaults are read from -pbgate_json_* flags.
    JsonMarshalerOptions();

    // Print fields with default values (0, "", empty repeated...) which are
    // omitted by the proto3 json mapping.
    // Default: -pbgate_json_emit_defaults
    bool emit_defaults;

    // Use field names of the .proto file instead of lowerCamelCase.
    // Default: -pbgate_json_orig_name
    bool orig_name;

    // Print enums by numbers instead of names.
    // Default: -pbgate_json_enums_as_ints
    bool enums_as_ints;

    // Add spaces, line breaks and indentation.
    // Default: -pbgate_json_indent
    bool indent;

    // Skip unknown fields when parsing instead of failing.
    // Default: true
    bool ignore_unknown_fields;
};

// Marshal messages with the proto3 json mapping. A wrapped Envelope is
// printed as {"<key>":<message>}. Consecutive elements of a stream are
// separated by "\n".
class JsonMarshaler : public Marshaler, public Delimited {
public:
    JsonMarshaler();
    explicit JsonMarshaler(const JsonMarshalerOptions& options);

    gutil::Status Marshal(const Envelope& value,
                          std::string* out) const override;
    gutil::Status Unmarshal(const std::string& data,
                            google::protobuf::Message* message) const override;
    std::string ContentType() const override;
    std::string Delimiter() const override;

    const JsonMarshalerOptions& options() const { return _options; }

private:
    JsonMarshalerOptions _options;
};

} // namespace pbgate

#endif // PBGATE_JSON_MARSHALER_H
