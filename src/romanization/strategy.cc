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


#include "romanization/strategy.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/log/check.h"
#include "base/util.h"
#include "romanization/char_class.h"
#include "romanization/validity_table.h"

namespace romantools {
namespace romanization {
namespace {

std::string ToTableKey(std::u32string_view initial) {
  if (initial == kNoInitial) {
    return "";
  }
  return Util::Utf32ToUtf8(initial);
}

}  // namespace

RomanizationStrategy::RomanizationStrategy(const ValidityTable *table)
    : table_(table) {
  CHECK(table_);
}

std::u32string RomanizationStrategy::FindInitial(
    std::u32string_view text) const {
  for (size_t i = 0; i < text.size(); ++i) {
    const char32_t c = text[i];
    if (IsVowel(c)) {
      return i == 0 ? std::u32string(kNoInitial)
                    : std::u32string(text.substr(0, i));
    }
    if (i == 0) {
      continue;
    }
    if (c == kApostrophe) {
      return std::u32string(text.substr(0, InitialLengthAtApostrophe(i)));
    }
    if (c == kDash) {
      return std::u32string(text.substr(0, i));
    }
  }
  return std::u32string(text);
}

bool RomanizationStrategy::IsValidPair(std::u32string_view initial,
                                       std::u32string_view final_part) const {
  return table_->IsValid(ToTableKey(initial), Util::Utf32ToUtf8(final_part));
}

bool RomanizationStrategy::ValidateSyllable(
    std::u32string_view initial, std::u32string_view final_part) const {
  return !final_part.empty() && IsValidPair(initial, final_part);
}

std::u32string RomanizationStrategy::FindFinalByPhonotactics(
    std::u32string_view text, std::u32string_view initial) const {
  for (size_t i = 0; i < text.size(); ++i) {
    if (!IsVowel(text[i])) {
      return ConsonantCase(text, i, initial);
    }
    std::optional<std::u32string> result = VowelCase(text, i, initial);
    if (result.has_value()) {
      return *std::move(result);
    }
  }
  return std::u32string(text);
}

std::optional<std::u32string> RomanizationStrategy::VowelCase(
    std::u32string_view text, size_t pos, std::u32string_view initial) const {
  if (pos + 1 == text.size()) {
    return std::u32string(text);
  }
  // Keep extending while some valid final still starts with the vowels read
  // so far.
  const std::string prefix = Util::Utf32ToUtf8(text.substr(0, pos + 1));
  if (table_->HasValidFinalWithPrefix(ToTableKey(initial), prefix)) {
    return std::nullopt;
  }
  if (pos == 0) {
    return std::nullopt;
  }
  return std::u32string(text.substr(0, pos));
}

std::u32string RomanizationStrategy::ConsonantCase(
    std::u32string_view text, size_t pos, std::u32string_view initial) const {
  const size_t remaining = text.size() - pos - 1;
  const char32_t c = text[pos];

  // Retroflex "er" ends the final unless a vowel follows the r.
  if (pos > 0 && text[pos - 1] == U'e' && c == U'r' &&
      (remaining == 0 || !IsVowel(text[pos + 1]))) {
    return std::u32string(text.substr(0, pos + 1));
  }

  if (c == U'n') {
    if (remaining > 0 && text[pos + 1] == U'g') {
      // "ng" belongs to the final unless the g starts the next syllable.
      const bool keep_ng =
          remaining == 1 || (remaining >= 2 && !IsVowel(text[pos + 2])) ||
          !IsValidPair(initial, text.substr(0, pos + 1));
      return std::u32string(text.substr(0, keep_ng ? pos + 2 : pos + 1));
    }
    const bool keep_n = remaining == 0 || !IsVowel(text[pos + 1]) ||
                        !IsValidPair(initial, text.substr(0, pos));
    return std::u32string(text.substr(0, keep_n ? pos + 1 : pos));
  }

  return std::u32string(text.substr(0, pos));
}

}  // namespace romanization
}  // namespace romantools
