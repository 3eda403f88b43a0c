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


#include "romanization/char_class.h"

#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include "base/util.h"

namespace romantools {
namespace romanization {
namespace {

constexpr std::u32string_view kVowels = U"aeiouüvêŭ";
constexpr std::u32string_view kApostrophes = U"'’‘ʼʻ`";
constexpr std::u32string_view kDashes = U"-–—";
constexpr std::u32string_view kAccentedLetters = U"üÜêÊŭŬ";

constexpr char32_t kCombiningDiaeresis = 0x0308;
constexpr char32_t kCombiningCircumflex = 0x0302;
constexpr char32_t kCombiningBreve = 0x0306;

constexpr absl::string_view kContractions[] = {"s", "d", "ll"};

bool Contains(std::u32string_view set, char32_t c) {
  return set.find(c) != std::u32string_view::npos;
}

// Returns the precomposed letter for `base` + `mark`, or 0.
char32_t Compose(char32_t base, char32_t mark) {
  switch (mark) {
    case kCombiningDiaeresis:
      return base == U'u' ? U'ü' : base == U'U' ? U'Ü' : 0;
    case kCombiningCircumflex:
      return base == U'e' ? U'ê' : base == U'E' ? U'Ê' : 0;
    case kCombiningBreve:
      return base == U'u' ? U'ŭ' : base == U'U' ? U'Ŭ' : 0;
    default:
      return 0;
  }
}

}  // namespace

bool IsVowel(char32_t c) { return Contains(kVowels, c); }

bool IsApostrophe(char32_t c) { return Contains(kApostrophes, c); }

bool IsDash(char32_t c) { return Contains(kDashes, c); }

bool IsRomanLetter(char32_t c) {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') ||
         Contains(kAccentedLetters, c);
}

char32_t FoldChar(char32_t c) {
  if (IsApostrophe(c)) {
    return kApostrophe;
  }
  if (IsDash(c)) {
    return kDash;
  }
  return Util::ToLower(c);
}

std::u32string FoldText(std::u32string_view text) {
  std::u32string folded(text.size(), 0);
  for (size_t i = 0; i < text.size(); ++i) {
    folded[i] = FoldChar(text[i]);
  }
  return folded;
}

std::u32string ComposeDiacritics(std::u32string_view text) {
  std::u32string composed;
  composed.reserve(text.size());
  for (const char32_t c : text) {
    if (!composed.empty()) {
      if (const char32_t merged = Compose(composed.back(), c); merged != 0) {
        composed.back() = merged;
        continue;
      }
    }
    composed.push_back(c);
  }
  return composed;
}

bool IsContraction(absl::string_view folded_syllable) {
  for (const absl::string_view contraction : kContractions) {
    if (folded_syllable == contraction) {
      return true;
    }
  }
  return false;
}

}  // namespace romanization
}  // namespace romantools
