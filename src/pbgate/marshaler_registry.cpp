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

#include "gutil/logging.h"
#include "pbgate/json_marshaler.h"
#include "pbgate/marshaler_registry.h"


namespace pbgate {

const char* const MIME_WILDCARD = "*";

static const JsonMarshaler* NewDefaultMarshaler() {
    JsonMarshalerOptions opt;
    opt.orig_name = true;
    return new JsonMarshaler(opt);
}

// Never deleted, registries may be destroyed in any order.
static const Marshaler* GetDefaultMarshaler() {
    static const JsonMarshaler* s_default = NewDefaultMarshaler();
    return s_default;
}

// "text/html; q=0.9" -> "text/html"
static std::string StripMediaType(const std::string& s) {
    std::string::size_type end = s.find(';');
    if (end == std::string::npos) {
        end = s.size();
    }
    std::string::size_type begin = 0;
    while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) {
        ++begin;
    }
    while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) {
        --end;
    }
    return s.substr(begin, end - begin);
}

MarshalerRegistry::MarshalerRegistry() {
    _mime_map[MIME_WILDCARD] = GetDefaultMarshaler();
}

int MarshalerRegistry::Add(const std::string& mime,
                           const Marshaler* marshaler) {
    if (mime.empty()) {
        LOG(ERROR) << "Empty MIME type";
        return -1;
    }
    if (marshaler == NULL) {
        LOG(ERROR) << "NULL marshaler for " << mime;
        return -1;
    }
    _mime_map[mime] = marshaler;
    return 0;
}

const Marshaler* MarshalerRegistry::Find(const std::string& mime) const {
    MimeMap::const_iterator it = _mime_map.find(mime);
    if (it == _mime_map.end()) {
        return NULL;
    }
    return it->second;
}

const Marshaler* MarshalerRegistry::Match(const std::string& value) const {
    std::string::size_type pos = 0;
    while (pos <= value.size()) {
        std::string::size_type comma = value.find(',', pos);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        const std::string mime = StripMediaType(value.substr(pos, comma - pos));
        if (!mime.empty() && mime != MIME_WILDCARD) {
            const Marshaler* m = Find(mime);
            if (m != NULL) {
                return m;
            }
        }
        pos = comma + 1;
    }
    return NULL;
}

void MarshalerRegistry::ForRequest(const HttpHeader& request,
                                   const Marshaler** inbound,
                                   const Marshaler** outbound) const {
    const Marshaler* in = Match(request.content_type());
    const Marshaler* out = NULL;
    const std::string* accept = request.GetHeader("Accept");
    if (accept != NULL) {
        out = Match(*accept);
    }
    if (in == NULL) {
        in = Find(MIME_WILDCARD);
    }
    if (out == NULL) {
        out = in;
    }
    *inbound = in;
    *outbound = out;
}

} // namespace pbgate
