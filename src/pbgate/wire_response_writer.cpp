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

#include <errno.h>
#include <strings.h>                    // strcasecmp
#include <unistd.h>                     // write
#include "gutil/logging.h"
#include "pbgate/wire_response_writer.h"


namespace pbgate {

#define PBGATE_CRLF "\r\n"

static char s_hex_map[] = { '0', '1', '2', '3', '4', '5', '6', '7', '8',
                            '9', 'A', 'B', 'C', 'D', 'E', 'F' };
inline char ToHex(size_t size/*0-15*/) { return s_hex_map[size]; }

inline void AppendChunkHead(std::string* buf, size_t size) {
    char tmp[32];
    int i = (int)sizeof(tmp);
    tmp[--i] = '\n';
    tmp[--i] = '\r';
    if (size == 0) {
        tmp[--i] = '0';
    } else {
        for (--i; i >= 0; --i) {
            const size_t new_size = (size >> 4);
            tmp[i] = ToHex(size - (new_size << 4));
            size = new_size;
            if (size == 0) {
                --i;
                break;
            }
        }
    }
    buf->append(tmp + i + 1, sizeof(tmp) - i - 1);
}

WireResponseWriter::WireResponseWriter(int fd)
    : _fd(fd)
    , _header_written(false)
    , _chunked(false)
    , _finished(false)
    , _error(0) {
}

WireResponseWriter::~WireResponseWriter() {
    if (!_finished && Finish() != 0) {
        PLOG(WARNING) << "Fail to finish response on fd=" << _fd;
    }
}

void WireResponseWriter::set_version(int http_major, int http_minor) {
    _header.set_version(http_major, http_minor);
}

void WireResponseWriter::AppendHead(bool with_content_length) {
    _buf.append("HTTP/");
    _buf.append(std::to_string(_header.major_version()));
    _buf.push_back('.');
    _buf.append(std::to_string(_header.minor_version()));
    _buf.push_back(' ');
    _buf.append(std::to_string(_header.status_code()));
    _buf.push_back(' ');
    _buf.append(_header.reason_phrase());
    _buf.append(PBGATE_CRLF);
    if (with_content_length) {
        // Never use "Content-Length" set by user.
        _buf.append("Content-Length: ");
        _buf.append(std::to_string(_body.size()));
        _buf.append(PBGATE_CRLF);
    }
    if (!_header.content_type().empty()) {
        _buf.append("Content-Type: ");
        _buf.append(_header.content_type());
        _buf.append(PBGATE_CRLF);
    }
    for (HttpHeader::HeaderIterator it = _header.HeaderBegin();
         it != _header.HeaderEnd(); ++it) {
        if (with_content_length &&
            (strcasecmp(it->first.c_str(), "Content-Length") == 0 ||
             strcasecmp(it->first.c_str(), "Transfer-Encoding") == 0)) {
            continue;
        }
        _buf.append(it->first);
        _buf.append(": ");
        _buf.append(it->second);
        _buf.append(PBGATE_CRLF);
    }
    _buf.append(PBGATE_CRLF);  // CRLF before content
}

void WireResponseWriter::WriteHeader(int status_code) {
    if (_header_written) {
        LOG(WARNING) << "Superfluous WriteHeader(" << status_code
                     << ") on fd=" << _fd;
        return;
    }
    _header_written = true;
    _header.set_status_code(status_code);
    const std::string* te = _header.GetHeader("Transfer-Encoding");
    if (te != NULL && strcasecmp(te->c_str(), "chunked") == 0) {
        if (_header.before_http_1_1()) {
            // Chunked-encoding is not understood, delimit the body with
            // Content-Length like any other response.
            _header.RemoveHeader("Transfer-Encoding");
        } else {
            _chunked = true;
            _header.RemoveHeader("Content-Length");
            AppendHead(false);
        }
    }
}

int WireResponseWriter::Write(const void* data, size_t n) {
    if (_error) {
        errno = _error;
        return -1;
    }
    if (_finished) {
        LOG(ERROR) << "Write to finished response on fd=" << _fd;
        errno = EINVAL;
        return -1;
    }
    if (!_header_written) {
        WriteHeader(HTTP_STATUS_OK);
    }
    if (n == 0) {
        // An empty chunk would end the body.
        return 0;
    }
    if (_chunked) {
        AppendChunkHead(&_buf, n);
        _buf.append(static_cast<const char*>(data), n);
        _buf.append(PBGATE_CRLF);
    } else {
        _body.append(static_cast<const char*>(data), n);
    }
    return 0;
}

int WireResponseWriter::Flush() {
    if (_error) {
        errno = _error;
        return -1;
    }
    if (!_header_written) {
        WriteHeader(HTTP_STATUS_OK);
    }
    if (!_chunked) {
        // Content-Length is unknown until Finish().
        return 0;
    }
    return FlushBuffer();
}

int WireResponseWriter::Finish() {
    if (_finished) {
        return 0;
    }
    if (!_header_written) {
        WriteHeader(HTTP_STATUS_OK);
    }
    _finished = true;
    if (_error) {
        errno = _error;
        return -1;
    }
    if (_chunked) {
        _buf.append("0" PBGATE_CRLF PBGATE_CRLF);
    } else {
        AppendHead(true);
        _buf.append(_body);
        _body.clear();
    }
    return FlushBuffer();
}

int WireResponseWriter::FlushBuffer() {
    size_t written = 0;
    while (written < _buf.size()) {
        const ssize_t nw = ::write(_fd, _buf.data() + written,
                                   _buf.size() - written);
        if (nw < 0) {
            if (errno == EINTR) {
                continue;
            }
            _error = errno;
            _buf.clear();
            return -1;
        }
        written += nw;
    }
    _buf.clear();
    return 0;
}

#undef PBGATE_CRLF

} // namespace pbgate
