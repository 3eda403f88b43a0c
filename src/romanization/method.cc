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


#include "romanization/method.h"

#include <iterator>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace romantools {
namespace {

struct MethodInfo {
  Method method;
  absl::string_view shorthand;
  absl::string_view pretty_name;
  absl::string_view table_file_name;
  absl::string_view aliases[3];
};

constexpr MethodInfo kMethodInfo[] = {
    {Method::kPinyin, "py", "Pinyin", "pinyin_syllables.csv",
     {"pinyin", "hanyu-pinyin", "hanyupinyin"}},
    {Method::kWadeGiles, "wg", "Wade-Giles", "wade_giles_syllables.csv",
     {"wade-giles", "wadegiles", "wade_giles"}},
};
static_assert(std::size(kMethodInfo) == kNumMethods);

constexpr Method kAllMethods[] = {Method::kPinyin, Method::kWadeGiles};

const MethodInfo &GetInfo(Method method) {
  return kMethodInfo[static_cast<int>(method)];
}

}  // namespace

absl::StatusOr<Method> ParseMethod(absl::string_view name) {
  const std::string lower = absl::AsciiStrToLower(name);
  for (const MethodInfo &info : kMethodInfo) {
    if (lower == info.shorthand) {
      return info.method;
    }
    for (const absl::string_view alias : info.aliases) {
      if (lower == alias) {
        return info.method;
      }
    }
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported romanization method: ", name));
}

absl::string_view MethodShorthand(Method method) {
  return GetInfo(method).shorthand;
}

absl::string_view MethodPrettyName(Method method) {
  return GetInfo(method).pretty_name;
}

absl::string_view MethodTableFileName(Method method) {
  return GetInfo(method).table_file_name;
}

absl::Span<const Method> AllMethods() { return kAllMethods; }

}  // namespace romantools
