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

#ifndef GUTIL_MACROS_H
#define GUTIL_MACROS_H

#include <stddef.h>                         // size_t

#undef DISALLOW_COPY_AND_ASSIGN

// A macro to disallow the copy constructor and operator= functions
// This should be used in the private: declarations for a class
#define DISALLOW_COPY_AND_ASSIGN(TypeName)      \
    TypeName(const TypeName&) = delete;         \
    void operator=(const TypeName&) = delete

#undef arraysize
// The arraysize(arr) macro returns the # of elements in an array arr.
// It fails to compile when given a pointer by mistake.
namespace gutil {
template <typename T, size_t N>
char (&ArraySizeHelper(T (&array)[N]))[N];
}  // namespace gutil
#define arraysize(array) (sizeof(::gutil::ArraySizeHelper(array)))

#ifndef ARRAY_SIZE
# define ARRAY_SIZE(array) arraysize(array)
#endif

#if defined(__GNUC__)
# define GUTIL_PRINTF_FORMAT(format_param, dots_param) \
    __attribute__((__format__(__printf__, format_param, dots_param)))
#else
# define GUTIL_PRINTF_FORMAT(format_param, dots_param)
#endif

#endif  // GUTIL_MACROS_H
