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


#include "segmenter/syllable_parser.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "base/util.h"
#include "base/vlog.h"
#include "romanization/char_class.h"
#include "romanization/strategy.h"
#include "segmenter/syllable.h"
#include "segmenter/trace_observer.h"

namespace romantools {
namespace segmenter {
namespace {

using ::romantools::romanization::FoldText;
using ::romantools::romanization::IsRomanLetter;
using ::romantools::romanization::kApostrophe;
using ::romantools::romanization::kDash;
using ::romantools::romanization::kNoInitial;

}  // namespace

SyllableParser::SyllableParser(
    const romanization::RomanizationStrategy *strategy, size_t cache_size,
    TraceObserver *observer)
    : strategy_(strategy),
      observer_(observer != nullptr ? observer : NullTraceObserver::Get()),
      cache_(cache_size) {
  CHECK(strategy_);
}

Syllable SyllableParser::ParseSyllable(std::u32string_view raw) {
  const std::string key = Util::Utf32ToUtf8(raw);
  if (std::optional<Syllable> cached = cache_.Lookup(key);
      cached.has_value()) {
    return *std::move(cached);
  }
  Syllable syllable = Parse(raw);
  cache_.Insert(key, syllable);
  return syllable;
}

Word SyllableParser::ParseAll(std::u32string_view raw) {
  Word word;
  while (!raw.empty()) {
    Syllable syllable = ParseSyllable(raw);
    // Folding keeps lengths, so the folded remainder locates the rest of the
    // raw text.
    const size_t remainder_length = Util::CharsLen(syllable.remainder());
    DCHECK_LT(remainder_length, raw.size());
    raw = raw.substr(raw.size() - remainder_length);
    word.push_back(std::move(syllable));
  }
  return word;
}

Syllable SyllableParser::Parse(std::u32string_view raw) const {
  const Method method = strategy_->method();
  const std::u32string folded = FoldText(raw);
  Syllable syllable;

  size_t offset = 0;
  if (!folded.empty() && (folded[0] == kApostrophe || folded[0] == kDash)) {
    syllable.leading_symbol_ = Util::CodepointToUtf8(raw[0]);
    syllable.has_leading_apostrophe_ = folded[0] == kApostrophe;
    syllable.has_leading_dash_ = folded[0] == kDash;
    offset = 1;
  }
  const std::u32string_view body = std::u32string_view(folded).substr(offset);
  syllable.source_text_ = Util::Utf32ToUtf8(body);
  if (body.empty()) {
    syllable.diagnostics_.push_back(absl::StrCat(
        "Invalid final: nothing follows \"", syllable.leading_symbol_, "\""));
    observer_->OnSyllableValidated(method, syllable);
    return syllable;
  }

  std::u32string initial = strategy_->FindInitial(body);
  observer_->OnInitialFound(method, syllable.source_text_,
                            Util::Utf32ToUtf8(initial));
  std::u32string final_part;
  if (initial == kNoInitial) {
    final_part = strategy_->FindFinal(body, kNoInitial);
    initial.clear();
  } else {
    final_part = strategy_->FindFinal(body.substr(initial.size()), initial);
  }
  syllable.valid_ = strategy_->ValidateSyllable(
      initial.empty() ? kNoInitial : std::u32string_view(initial),
      final_part);

  std::u32string full = initial + final_part;
  if (full.empty()) {
    // Consume one character so that the caller always makes progress.
    full = body.substr(0, 1);
    final_part = full;
    syllable.valid_ = false;
  }
  syllable.initial_ = Util::Utf32ToUtf8(initial);
  syllable.final_ = Util::Utf32ToUtf8(final_part);
  syllable.full_syllable_ = Util::Utf32ToUtf8(full);
  syllable.remainder_ = Util::Utf32ToUtf8(body.substr(full.size()));
  observer_->OnFinalFound(method, syllable.source_text_, syllable.initial_,
                          syllable.final_);

  const std::u32string_view consumed = raw.substr(offset, full.size());
  syllable.raw_text_ = Util::Utf32ToUtf8(consumed);
  bool has_letter = false;
  bool has_cased = false;
  bool all_upper = true;
  bool title = true;
  for (const char32_t c : consumed) {
    if (!IsRomanLetter(c)) {
      continue;
    }
    const bool upper = Util::IsUpper(c);
    if (upper || Util::IsLower(c)) {
      has_cased = true;
    }
    if (Util::IsLower(c)) {
      all_upper = false;
    }
    if (!has_letter) {
      title = upper;
    } else if (upper) {
      title = false;
    }
    has_letter = true;
  }
  syllable.is_all_uppercase_ = has_cased && all_upper;
  syllable.is_title_case_ = has_letter && title;

  if (!syllable.valid_) {
    const romanization::ValidityTable &table = strategy_->table();
    if (!syllable.initial_.empty() && !table.HasInitial(syllable.initial_)) {
      syllable.diagnostics_.push_back(
          absl::StrCat("Invalid initial \"", syllable.initial_, "\" in \"",
                       syllable.source_text_, "\""));
    }
    if (syllable.final_.empty() || !table.HasFinal(syllable.final_)) {
      syllable.diagnostics_.push_back(
          absl::StrCat("Invalid final \"", syllable.final_, "\" in \"",
                       syllable.source_text_, "\""));
    }
    syllable.diagnostics_.push_back(absl::StrCat(
        "Invalid syllable \"", syllable.full_syllable_, "\" for ",
        MethodPrettyName(method)));
  }
  ROMANTOOLS_VLOG(2) << "Parsed \"" << syllable.source_text_ << "\" as \""
                     << syllable.full_syllable_ << "\" ("
                     << (syllable.valid_ ? "valid" : "invalid") << ")";
  observer_->OnSyllableValidated(method, syllable);
  return syllable;
}

}  // namespace segmenter
}  // namespace romantools
