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

#ifndef PBGATE_MARSHALER_REGISTRY_H
#define PBGATE_MARSHALER_REGISTRY_H

#include <map>
#include <string>
#include "gutil/macros.h"
#include "pbgate/http_header.h"
#include "pbgate/marshaler.h"


namespace pbgate {

// Registers to this MIME type to be used when no registered type matches.
extern const char* const MIME_WILDCARD;   // "*"

// Marshalers selected by MIME types of requests.
class MarshalerRegistry {
public:
    // MIME_WILDCARD is mapped to a JsonMarshaler which prints original
    // field names of .proto.
    MarshalerRegistry();

    // Use `marshaler' for `mime', replacing the previous one. `marshaler'
    // is not owned and must outlive this registry.
    // Returns 0 on success, -1 when `mime' is empty or `marshaler' is NULL.
    int Add(const std::string& mime, const Marshaler* marshaler);

    // Marshaler registered for `mime' exactly, NULL if absent.
    const Marshaler* Find(const std::string& mime) const;

    // Pick the marshaler parsing `request' by its Content-Type and the one
    // printing the response by its Accept. Without a match, inbound is the
    // wildcard marshaler and outbound is same with inbound.
    void ForRequest(const HttpHeader& request,
                    const Marshaler** inbound,
                    const Marshaler** outbound) const;

private:
    DISALLOW_COPY_AND_ASSIGN(MarshalerRegistry);

    // Marshaler of the first media type in `value' which is registered.
    const Marshaler* Match(const std::string& value) const;

    typedef std::map<std::string, const Marshaler*> MimeMap;
    MimeMap _mime_map;
};

} // namespace pbgate

#endif // PBGATE_MARSHALER_REGISTRY_H
