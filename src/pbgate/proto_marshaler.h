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

#ifndef PBGATE_PROTO_MARSHALER_H
#define PBGATE_PROTO_MARSHALER_H

#include "pbgate/marshaler.h"


namespace pbgate {

// Marshal messages in the protobuf binary format. The format has no way to
// express a keyed container, thus a wrapped Envelope fails to marshal and
// streaming responses are not supported by this marshaler.
// Not Delimited.
class ProtoMarshaler : public Marshaler {
public:
    gutil::Status Marshal(const Envelope& value,
                          std::string* out) const override;
    gutil::Status Unmarshal(const std::string& data,
                            google::protobuf::Message* message) const override;
    std::string ContentType() const override;
};

} // namespace pbgate

#endif // PBGATE_PROTO_MARSHALER_H
