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

#include "pbgate/marshaler.h"


namespace pbgate {

const char* const RESULT_KEY = "result";
const char* const ERROR_KEY = "error";
const char* const DEFAULT_DELIMITER = "\n";

std::string GetDelimiter(const Marshaler& marshaler) {
    const Delimited* d = dynamic_cast<const Delimited*>(&marshaler);
    if (d != NULL) {
        return d->Delimiter();
    }
    return DEFAULT_DELIMITER;
}

} // namespace pbgate
