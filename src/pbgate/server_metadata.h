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

#ifndef PBGATE_SERVER_METADATA_H
#define PBGATE_SERVER_METADATA_H

#include <stdint.h>
#include <map>
#include <string>
#include "pbgate/http_header.h"


namespace pbgate {

// Metadata of a rpc, keys are lowercase. A key may have several values.
typedef std::multimap<std::string, std::string> Metadata;

// Metadata sent by the rpc server along with its response.
struct ServerMetadata {
    Metadata header;
    Metadata trailer;
};

// Per-request context handed to the gateway by the dispatching code. It
// outlives the forwarding of the response and is not modified by the
// gateway.
class CallContext {
public:
    CallContext() : _server_metadata(NULL), _log_id(0) {}
    explicit CallContext(const ServerMetadata* md)
        : _server_metadata(md), _log_id(0) {}

    // Metadata to merge into the http response, NULL if there's none.
    // Not owned.
    const ServerMetadata* server_metadata() const { return _server_metadata; }
    void set_server_metadata(const ServerMetadata* md) { _server_metadata = md; }

    // Printed in logs to correlate them with the request, 0 means unset.
    uint64_t log_id() const { return _log_id; }
    void set_log_id(uint64_t log_id) { _log_id = log_id; }

private:
    const ServerMetadata* _server_metadata;
    uint64_t _log_id;
};

// Append every entry of `md' to `h' as header `prefix'+key. Values of the
// same key are joined by comma.
void AppendMetadataToHeader(const Metadata& md, const std::string& prefix,
                            HttpHeader* h);

} // namespace pbgate

#endif // PBGATE_SERVER_METADATA_H
