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

#include <strings.h>                  // strcasecmp
#include "pbgate/http_header.h"


namespace pbgate {

bool CaseIgnoredLess::operator()(const std::string& s1,
                                 const std::string& s2) const {
    return strcasecmp(s1.c_str(), s2.c_str()) < 0;
}

HttpHeader::HttpHeader()
    : _status_code(HTTP_STATUS_OK)
    , _version(1, 1) {
}

bool HttpHeader::IsContentType(const std::string& key) {
    return strcasecmp(key.c_str(), "content-type") == 0;
}

const std::string* HttpHeader::GetHeader(const char* key) const {
    return GetHeader(std::string(key));
}

const std::string* HttpHeader::GetHeader(const std::string& key) const {
    if (IsContentType(key)) {
        return _content_type.empty() ? NULL : &_content_type;
    }
    HeaderMap::const_iterator it = _headers.find(key);
    if (it == _headers.end()) {
        return NULL;
    }
    return &it->second;
}

void HttpHeader::SetHeader(const std::string& key,
                           const std::string& value) {
    GetOrAddHeader(key) = value;
}

void HttpHeader::RemoveHeader(const char* key) {
    if (IsContentType(key)) {
        _content_type.clear();
    } else {
        _headers.erase(key);
    }
}

void HttpHeader::AppendHeader(const std::string& key,
                              const std::string& value) {
    std::string& slot = GetOrAddHeader(key);
    if (slot.empty()) {
        slot = value;
    } else {
        slot.reserve(slot.size() + 1 + value.size());
        slot.push_back(',');
        slot.append(value);
    }
}

const char* HttpHeader::reason_phrase() const {
    return HttpReasonPhrase(_status_code);
}

std::string& HttpHeader::GetOrAddHeader(const std::string& key) {
    if (IsContentType(key)) {
        return _content_type;
    }
    return _headers[key];
}

} // namespace pbgate
