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

#ifndef  PBGATE_HTTP_HEADER_H
#define  PBGATE_HTTP_HEADER_H

#include <map>
#include <string>
#include <utility>
#include "pbgate/http_status_code.h"


namespace pbgate {

// Orders header names ignoring ascii case, see
//   https://www.w3.org/Protocols/rfc2616/rfc2616-sec4.html#sec4.2
struct CaseIgnoredLess {
    bool operator()(const std::string& s1, const std::string& s2) const;
};

// Non-body part of a HTTP message. Used both for the request handed to the
// gateway and for the response it writes.
class HttpHeader {
public:
    typedef std::map<std::string, std::string, CaseIgnoredLess> HeaderMap;
    typedef HeaderMap::const_iterator HeaderIterator;

    HttpHeader();

    // Get http version, 1.1 by default.
    int major_version() const { return _version.first; }
    int minor_version() const { return _version.second; }
    // Change the http version
    void set_version(int http_major, int http_minor)
    { _version = std::make_pair(http_major, http_minor); }

    // True if version of http is earlier than 1.1
    bool before_http_1_1() const
    { return (major_version() * 10000 +  minor_version()) <= 10000; }

    // Get/set "Content-Type".
    // possible values: "text/plain", "application/json" ...
    // NOTE: Equal to `GetHeader("Content-Type")', `SetHeader("Content-Type")'
    // (case-insensitive).
    const std::string& content_type() const { return _content_type; }
    void set_content_type(const std::string& type) { _content_type = type; }
    void set_content_type(const char* type) { _content_type = type; }

    // Get value of a header which is case-insensitive.
    // Namely, GetHeader("log-id"), GetHeader("Log-Id"), GetHeader("LOG-ID")
    // point to the same value.
    // Return pointer to the value, NULL on not found.
    // NOTE: If the key is "Content-Type", `GetHeader("Content-Type")'
    // (case-insensitive) is equal to `content_type()' and returns NULL when
    // the content type is empty.
    const std::string* GetHeader(const char* key) const;
    const std::string* GetHeader(const std::string& key) const;

    // Set value of a header.
    // NOTE: If the key is "Content-Type", `SetHeader("Content-Type", ...)'
    // (case-insensitive) is equal to `set_content_type(...)'.
    void SetHeader(const std::string& key, const std::string& value);

    // Remove all headers of key.
    void RemoveHeader(const char* key);
    void RemoveHeader(const std::string& key) { RemoveHeader(key.c_str()); }

    // Append value to a header. If the header already exists, separate
    // old value and new value with comma(,) according to:
    //   https://datatracker.ietf.org/doc/html/rfc2616#section-4.2
    void AppendHeader(const std::string& key, const std::string& value);

    // Get header iterators which are invalidated after calling SetHeader()
    // or AppendHeader(). "Content-Type" is not among them.
    HeaderIterator HeaderBegin() const { return _headers.begin(); }
    HeaderIterator HeaderEnd() const { return _headers.end(); }
    // #headers
    size_t HeaderCount() const { return _headers.size(); }

    // Get/set the path part of the request uri.
    const std::string& path() const { return _path; }
    void set_path(const std::string& path) { _path = path; }

    // Get/set status-code and reason-phrase. Notice that the const char*
    // returned by reason_phrase() will be invalidated after next call to
    // set_status_code().
    int status_code() const { return _status_code; }
    const char* reason_phrase() const;
    void set_status_code(int status_code) { _status_code = status_code; }

private:
    static bool IsContentType(const std::string& key);

    std::string& GetOrAddHeader(const std::string& key);

    HeaderMap _headers;
    int _status_code;
    std::string _path;
    std::string _content_type;
    std::pair<int, int> _version;
};

} // namespace pbgate


#endif  //PBGATE_HTTP_HEADER_H
