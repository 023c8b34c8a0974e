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
#include "pbgate/gateway_options.h"


namespace pbgate {

DEFINE_string(pbgate_metadata_header_prefix, "Grpc-Metadata-",
              "Prefix of http headers carrying metadata of rpc headers");
DEFINE_string(pbgate_metadata_trailer_prefix, "Grpc-Trailer-",
              "Prefix of http headers carrying metadata of rpc trailers");
DEFINE_int32(pbgate_max_logged_error_length, 256,
             "Error messages longer than this are truncated in logs");

GatewayOptions::GatewayOptions()
    : metadata_header_prefix(FLAGS_pbgate_metadata_header_prefix)
    , metadata_trailer_prefix(FLAGS_pbgate_metadata_trailer_prefix)
    , max_logged_error_length(FLAGS_pbgate_max_logged_error_length) {
}

} // namespace pbgate
