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

#ifndef  PBGATE_HTTP_STATUS_CODE_H
#define  PBGATE_HTTP_STATUS_CODE_H

#include "pbgate/grpc_status.h"

namespace pbgate {

// Return the reason phrase of a given status_code.
// "Unknown status code (|status_code|)" will be returned if the status_code is
// unknown
// This function is thread-safe and NULL is never supposed to be returned
//
// NOTICE: the memory referenced by the pointer returned before might be reused
// when this function is called again, so please DON'T try to cache the return
// value into a container. Directly copy the memory instead.
const char *HttpReasonPhrase(int status_code);

// Translate a canonical rpc status into the http status reported to the
// client. Total and deterministic: codes without a dedicated mapping,
// including values outside GrpcStatus, give 500.
//
//   GRPC_OK                   200    GRPC_ABORTED              409
//   GRPC_CANCELED             408    GRPC_OUTOFRANGE           400
//   GRPC_UNKNOWN              500    GRPC_UNIMPLEMENTED        501
//   GRPC_INVALIDARGUMENT      400    GRPC_INTERNAL             500
//   GRPC_DEADLINEEXCEEDED     504    GRPC_UNAVAILABLE          503
//   GRPC_NOTFOUND             404    GRPC_DATALOSS             500
//   GRPC_ALREADYEXISTS        409    GRPC_UNAUTHENTICATED      401
//   GRPC_PERMISSIONDENIED     403    GRPC_RESOURCEEXHAUSTED    429
//   GRPC_FAILEDPRECONDITION   400
int GrpcStatusToHttpStatus(GrpcStatus grpc_status);

// Informational 1xx
static const int HTTP_STATUS_CONTINUE                        = 100;
static const int HTTP_STATUS_SWITCHING_PROTOCOLS             = 101;

// Successful 2xx
// 200 OK is also what a stream reports when it fails after its first chunk,
// the failure is then described in-band.
static const int HTTP_STATUS_OK                              = 200;
static const int HTTP_STATUS_CREATED                         = 201;
static const int HTTP_STATUS_ACCEPTED                        = 202;
static const int HTTP_STATUS_NON_AUTHORITATIVE_INFORMATION   = 203;
static const int HTTP_STATUS_NO_CONTENT                      = 204;
static const int HTTP_STATUS_RESET_CONTENT                   = 205;
static const int HTTP_STATUS_PARTIAL_CONTENT                 = 206;

// Redirection 3xx
static const int HTTP_STATUS_MULTIPLE_CHOICES                = 300;
static const int HTTP_STATUS_MOVE_PERMANENTLY                = 301;
static const int HTTP_STATUS_FOUND                           = 302;
static const int HTTP_STATUS_SEE_OTHER                       = 303;
static const int HTTP_STATUS_NOT_MODIFIED                    = 304;
static const int HTTP_STATUS_USE_PROXY                       = 305;
static const int HTTP_STATUS_TEMPORARY_REDIRECT              = 307;

// Client Error 4xx
static const int HTTP_STATUS_BAD_REQUEST                     = 400;
static const int HTTP_STATUS_UNAUTHORIZED                    = 401;
static const int HTTP_STATUS_PAYMENT_REQUIRED                = 402;
static const int HTTP_STATUS_FORBIDDEN                       = 403;
static const int HTTP_STATUS_NOT_FOUND                       = 404;
static const int HTTP_STATUS_METHOD_NOT_ALLOWED              = 405;
static const int HTTP_STATUS_NOT_ACCEPTABLE                  = 406;
static const int HTTP_STATUS_PROXY_AUTHENTICATION_REQUIRED   = 407;
static const int HTTP_STATUS_REQUEST_TIMEOUT                 = 408;
static const int HTTP_STATUS_CONFLICT                        = 409;
static const int HTTP_STATUS_GONE                            = 410;
static const int HTTP_STATUS_LENGTH_REQUIRED                 = 411;
static const int HTTP_STATUS_PRECONDITION_FAILED             = 412;
static const int HTTP_STATUS_REQUEST_ENTITY_TOO_LARGE        = 413;
static const int HTTP_STATUS_REQUEST_URI_TOO_LARG            = 414;
static const int HTTP_STATUS_UNSUPPORTED_MEDIA_TYPE          = 415;
static const int HTTP_STATUS_REQUEST_RANGE_NOT_SATISFIABLE   = 416;
static const int HTTP_STATUS_EXPECTATION_FAILED              = 417;
// RFC 6585
static const int HTTP_STATUS_TOO_MANY_REQUESTS               = 429;

// Server Error 5xx
static const int HTTP_STATUS_INTERNAL_SERVER_ERROR           = 500;
static const int HTTP_STATUS_NOT_IMPLEMENTED                 = 501;
static const int HTTP_STATUS_BAD_GATEWAY                     = 502;
static const int HTTP_STATUS_SERVICE_UNAVAILABLE             = 503;
static const int HTTP_STATUS_GATEWAY_TIMEOUT                 = 504;
static const int HTTP_STATUS_VERSION_NOT_SUPPORTED           = 505;

} // namespace pbgate

#endif  // PBGATE_HTTP_STATUS_CODE_H
