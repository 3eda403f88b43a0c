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


#include "romanization/wade_giles_strategy.h"

#include <cstddef>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include "base/util.h"
#include "romanization/char_class.h"
#include "romanization/strategy.h"

namespace romantools {
namespace romanization {

WadeGilesStrategy::WadeGilesStrategy(const ValidityTable *table)
    : RomanizationStrategy(table) {
  for (const std::string &initial : table->initials_longest_first()) {
    initials_longest_first_.push_back(Util::Utf8ToUtf32(initial));
  }
}

bool WadeGilesStrategy::SplitsWordAt(char32_t c) const { return IsDash(c); }

std::string WadeGilesStrategy::SeparatorBetween(absl::string_view prev,
                                                absl::string_view next) const {
  return "-";
}

bool WadeGilesStrategy::CanStartSyllable(std::u32string_view rest) const {
  if (rest.empty()) {
    return false;
  }
  // An apostrophe after a complete syllable starts a clitic ("tung's").
  if (rest.front() == kApostrophe) {
    return true;
  }
  if (rest.size() < 2) {
    return false;
  }
  if (IsVowel(rest.front())) {
    return true;
  }
  for (const std::u32string &initial : initials_longest_first_) {
    if (rest.starts_with(initial)) {
      return true;
    }
  }
  return false;
}

bool WadeGilesStrategy::IsCompleteSyllable(std::u32string_view text) const {
  for (const std::u32string &initial : initials_longest_first_) {
    if (text.starts_with(initial) &&
        ValidateSyllable(initial, text.substr(initial.size()))) {
      return true;
    }
  }
  return !text.empty() && IsVowel(text.front()) &&
         ValidateSyllable(kNoInitial, text);
}

std::u32string WadeGilesStrategy::FindFinal(
    std::u32string_view text, std::u32string_view initial) const {
  // An apostrophe after a vowel closes the syllable.
  const size_t apostrophe = text.find(kApostrophe);
  if (apostrophe != std::u32string_view::npos && apostrophe > 0 &&
      IsVowel(text[apostrophe - 1])) {
    return std::u32string(text.substr(0, apostrophe));
  }

  if (initial != kNoInitial) {
    // Longest valid final whose remainder can start the next syllable.
    for (size_t end = text.size(); end > 0; --end) {
      if (ValidateSyllable(initial, text.substr(0, end)) &&
          (end == text.size() || CanStartSyllable(text.substr(end)))) {
        return std::u32string(text.substr(0, end));
      }
    }
    return FindFinalByPhonotactics(text, initial);
  }

  // Vowel-initial: the shortest complete syllable that leaves a plausible
  // remainder, e.g. "an" in "anhui".
  for (size_t end = 2; end <= text.size(); ++end) {
    if (IsCompleteSyllable(text.substr(0, end)) &&
        (end == text.size() || CanStartSyllable(text.substr(end)))) {
      return std::u32string(text.substr(0, end));
    }
  }
  return std::u32string(text);
}

std::u32string WadeGilesStrategy::ConsonantCase(
    std::u32string_view text, size_t pos, std::u32string_view initial) const {
  const char32_t c = text[pos];
  if (pos > 0 && text[pos - 1] == U'e' && c == U'r') {
    const bool has_h = pos + 1 < text.size() && text[pos + 1] == U'h';
    return std::u32string(text.substr(0, has_h ? pos + 2 : pos + 1));
  }
  // Trailing h of "ih", "eh", "üeh".
  if (c == U'h' && pos > 0) {
    const std::u32string_view with_h = text.substr(0, pos + 1);
    return std::u32string(IsValidPair(initial, with_h) ? with_h
                                                       : text.substr(0, pos));
  }
  return RomanizationStrategy::ConsonantCase(text, pos, initial);
}

}  // namespace romanization
}  // namespace romantools
