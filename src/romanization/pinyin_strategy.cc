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


#include "romanization/pinyin_strategy.h"

#include <string>
#include <string_view>

#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "base/util.h"
#include "romanization/char_class.h"

namespace romantools {
namespace romanization {

std::u32string PinyinStrategy::FindFinal(std::u32string_view text,
                                         std::u32string_view initial) const {
  return FindFinalByPhonotactics(text, initial);
}

bool PinyinStrategy::SplitsWordAt(char32_t c) const { return IsJoiner(c); }

std::string PinyinStrategy::SeparatorBetween(absl::string_view prev,
                                             absl::string_view next) const {
  if (prev.empty() || next.empty()) {
    return "";
  }
  const std::u32string prev32 = Util::Utf8ToUtf32(prev);
  const std::u32string next32 = Util::Utf8ToUtf32(next);
  if (!IsVowel(FoldChar(next32.front()))) {
    return "";
  }
  if (IsVowel(FoldChar(prev32.back())) || absl::EndsWithIgnoreCase(prev, "n") ||
      absl::EndsWithIgnoreCase(prev, "ng") ||
      absl::EndsWithIgnoreCase(prev, "er")) {
    return "'";
  }
  return "";
}

}  // namespace romanization
}  // namespace romantools
