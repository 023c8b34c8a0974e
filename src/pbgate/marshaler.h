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

#ifndef PBGATE_MARSHALER_H
#define PBGATE_MARSHALER_H

#include <string>
#include <google/protobuf/message.h>
#include "gutil/status.h"


namespace pbgate {

// Keys of the containers wrapping the elements of a streaming response, a
// consumer tells a result chunk from an error chunk by the key alone.
extern const char* const RESULT_KEY;    // "result"
extern const char* const ERROR_KEY;     // "error"

// The delimiter used when a marshaler is not Delimited.
extern const char* const DEFAULT_DELIMITER;  // "\n"

// A value handed to a Marshaler: a message, optionally wrapped in a single
// keyed container, e.g. {"result": message}. The message is referenced, not
// copied.
class Envelope {
public:
    // A bare message.
    explicit Envelope(const google::protobuf::Message& message)
        : _message(&message) {}

    // `message' wrapped under `key'.
    Envelope(const std::string& key, const google::protobuf::Message& message)
        : _key(key), _message(&message) {}

    bool wrapped() const { return !_key.empty(); }
    const std::string& key() const { return _key; }
    const google::protobuf::Message& message() const { return *_message; }

private:
    std::string _key;
    const google::protobuf::Message* _message;
};

// Serialization strategy between messages and the bytes of http bodies.
// An instance is shared by concurrent requests, implementations must not
// keep per-call mutable state.
// Failures are reported with code EENCODING (errno.proto).
class Marshaler {
public:
    virtual ~Marshaler() {}

    // Serialize `value' into `out'.
    virtual gutil::Status Marshal(const Envelope& value,
                                  std::string* out) const = 0;

    // Parse `data' into `message'.
    virtual gutil::Status Unmarshal(const std::string& data,
                                    google::protobuf::Message* message) const = 0;

    // Content-Type of the serialized bytes. Empty if the marshaler can't
    // tell, callers fall back to a default then.
    virtual std::string ContentType() const = 0;
};

// Optional capability of a Marshaler: bytes separating consecutive elements
// of a streaming response. Probed per request with GetDelimiter().
class Delimited {
public:
    virtual ~Delimited() {}
    virtual std::string Delimiter() const = 0;
};

// Delimiter() of `marshaler' if it's Delimited, DEFAULT_DELIMITER otherwise.
std::string GetDelimiter(const Marshaler& marshaler);

} // namespace pbgate

#endif // PBGATE_MARSHALER_H
