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


#include "converter/word_reconstructor.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "base/util.h"
#include "converter/syllable_converter.h"
#include "romanization/char_class.h"
#include "romanization/method.h"
#include "romanization/strategy.h"
#include "segmenter/syllable.h"

namespace romantools {
namespace converter {

using ::romantools::segmenter::Syllable;
using ::romantools::segmenter::Word;

WordReconstructor::WordReconstructor(
    SyllableConverter *converter,
    const romanization::RomanizationStrategy *target,
    const absl::flat_hash_set<std::string> *stopwords)
    : converter_(converter), target_(target), stopwords_(stopwords) {
  CHECK(converter_);
  CHECK(target_);
  CHECK(stopwords_);
  CHECK(converter_->to() == target_->method());
}

bool WordReconstructor::HasTrailingContraction(const Word &word) {
  if (word.size() < 2) {
    return false;
  }
  for (size_t i = 0; i + 1 < word.size(); ++i) {
    if (!word[i].valid()) {
      return false;
    }
  }
  const Syllable &last = word.back();
  return !last.valid() && last.has_leading_apostrophe() &&
         romanization::IsContraction(last.full_syllable());
}

bool WordReconstructor::IsStopword(const Word &word,
                                   size_t num_syllables) const {
  std::string folded;
  for (size_t i = 0; i < num_syllables; ++i) {
    if (word[i].has_leading_apostrophe()) {
      folded.push_back('\'');
    } else if (word[i].has_leading_dash()) {
      folded.push_back('-');
    }
    folded.append(word[i].full_syllable());
  }
  return stopwords_->contains(folded);
}

bool WordReconstructor::IsConvertible(const Word &word) const {
  if (word.empty()) {
    return false;
  }
  bool all_valid = true;
  for (const Syllable &syllable : word) {
    all_valid = all_valid && syllable.valid();
  }
  if (all_valid) {
    return !IsStopword(word, word.size());
  }
  if (!HasTrailingContraction(word)) {
    return false;
  }
  // "he's" is left alone as well as "he".
  return !IsStopword(word, word.size()) && !IsStopword(word, word.size() - 1);
}

std::string WordReconstructor::Reconstruct(const Word &word, bool selective,
                                           std::vector<std::string> *errors) {
  if (selective && !IsConvertible(word)) {
    std::string raw;
    for (const Syllable &syllable : word) {
      absl::StrAppend(&raw, syllable.leading_symbol(), syllable.raw_text());
    }
    return raw;
  }

  const bool has_contraction = HasTrailingContraction(word);
  std::string result;
  std::string prev;  // Lower-cased previous output syllable.
  for (size_t i = 0; i < word.size(); ++i) {
    const Syllable &syllable = word[i];
    if (has_contraction && i + 1 == word.size()) {
      absl::StrAppend(&result, syllable.leading_symbol(), syllable.raw_text());
      break;
    }

    SyllableConverter::Result converted =
        converter_->Convert(syllable.full_syllable());
    if (errors != nullptr &&
        converted.status != SyllableConverter::Status::kConverted) {
      errors->push_back(absl::StrCat(
          converted.status == SyllableConverter::Status::kRare
              ? "Rare syllable"
              : "No conversion for",
          " \"", syllable.full_syllable(), "\" from ",
          MethodPrettyName(converter_->from()), " to ",
          MethodPrettyName(converter_->to())));
    }

    std::string text = std::move(converted.text);
    std::string lower = text;
    Util::LowerString(&lower);
    if (i > 0) {
      result.append(target_->SeparatorBetween(prev, lower));
    }
    if (syllable.is_all_uppercase()) {
      Util::UpperString(&text);
    } else if (syllable.is_title_case()) {
      Util::CapitalizeFirstChar(&text);
    }
    result.append(text);
    prev = std::move(lower);
  }
  return result;
}

}  // namespace converter
}  // namespace romantools
