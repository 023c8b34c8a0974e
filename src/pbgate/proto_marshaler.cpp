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

#include "pbgate/errno.pb.h"
#include "pbgate/proto_marshaler.h"


namespace pbgate {

gutil::Status ProtoMarshaler::Marshal(const Envelope& value,
                                      std::string* out) const {
    if (value.wrapped()) {
        return gutil::Status(EENCODING, "Cannot wrap %s under `%s' in "
                             "protobuf binary format",
                             value.message().GetTypeName().c_str(),
                             value.key().c_str());
    }
    out->clear();
    if (!value.message().SerializeToString(out)) {
        return gutil::Status(EENCODING, "Fail to serialize %s",
                             value.message().GetTypeName().c_str());
    }
    return gutil::Status::OK();
}

gutil::Status ProtoMarshaler::Unmarshal(const std::string& data,
                                        google::protobuf::Message* message) const {
    if (!message->ParseFromString(data)) {
        return gutil::Status(EENCODING, "Fail to parse %s",
                             message->GetTypeName().c_str());
    }
    return gutil::Status::OK();
}

std::string ProtoMarshaler::ContentType() const {
    return "application/octet-stream";
}

} // namespace pbgate
