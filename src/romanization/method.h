// Copyright 2010-2021, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.


#ifndef ROMANTOOLS_ROMANIZATION_METHOD_H_
#define ROMANTOOLS_ROMANIZATION_METHOD_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace romantools {

// Romanization systems known to the engine. Every method has its own
// validity table, a column in the conversion mapping and a strategy class.
enum class Method {
  kPinyin,     // Hanyu Pinyin.
  kWadeGiles,  // Wade-Giles.
};

inline constexpr int kNumMethods = 2;

// Accepts full names and shorthands, case-insensitively ("pinyin", "py",
// "wade-giles", "wg"). Returns InvalidArgumentError for unsupported methods.
absl::StatusOr<Method> ParseMethod(absl::string_view name);

// "py", "wg". Also the column names of the conversion mapping.
absl::string_view MethodShorthand(Method method);

// "Pinyin", "Wade-Giles".
absl::string_view MethodPrettyName(Method method);

// File name of the validity table under the data directory.
absl::string_view MethodTableFileName(Method method);

// All methods in registry order.
absl::Span<const Method> AllMethods();

}  // namespace romantools

#endif  // ROMANTOOLS_ROMANIZATION_METHOD_H_
