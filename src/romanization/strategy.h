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


#ifndef ROMANTOOLS_ROMANIZATION_STRATEGY_H_
#define ROMANTOOLS_ROMANIZATION_STRATEGY_H_

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include "romanization/method.h"
#include "romanization/validity_table.h"

namespace romantools {
namespace romanization {

// Returned by FindInitial() for syllables that start with a vowel.
inline constexpr std::u32string_view kNoInitial = U"ø";

// Splits one folded syllable candidate into an initial and a final according
// to the phonotactics of a romanization method.
//
// All texts given to the strategy are folded (see FoldText()) and start with
// a letter. Strategies are stateless apart from the shared validity table and
// may be used from multiple threads.
class RomanizationStrategy {
 public:
  // `table` must outlive the strategy.
  explicit RomanizationStrategy(const ValidityTable *table);
  virtual ~RomanizationStrategy() = default;

  RomanizationStrategy(const RomanizationStrategy &) = delete;
  RomanizationStrategy &operator=(const RomanizationStrategy &) = delete;

  virtual Method method() const = 0;

  // Returns the leading consonant cluster of `text`, kNoInitial if `text`
  // starts with a vowel, or the whole text when it contains no vowel.
  std::u32string FindInitial(std::u32string_view text) const;

  // Returns the final that follows `initial`. `text` is the rest of the
  // candidate after the initial (the whole candidate for kNoInitial). May
  // return an empty string when no final can be identified.
  virtual std::u32string FindFinal(std::u32string_view text,
                                   std::u32string_view initial) const = 0;

  // True if the final is non-empty and the pair is listed in the table.
  // kNoInitial and the empty initial are equivalent.
  bool ValidateSyllable(std::u32string_view initial,
                        std::u32string_view final_part) const;

  // True if a word is split into syllable groups before `c`, a folded
  // joiner character.
  virtual bool SplitsWordAt(char32_t c) const = 0;

  // Separator placed between two syllables converted into this method.
  // Both arguments are lower-cased UTF-8 syllables.
  virtual std::string SeparatorBetween(absl::string_view prev,
                                       absl::string_view next) const = 0;

  const ValidityTable &table() const { return *table_; }

 protected:
  // Length of the initial when an apostrophe is found at `pos` (> 0) before
  // any vowel.
  virtual size_t InitialLengthAtApostrophe(size_t pos) const { return pos; }

  // Scans `text` from the left and ends the final at the first consonant
  // that cannot belong to it.
  std::u32string FindFinalByPhonotactics(std::u32string_view text,
                                         std::u32string_view initial) const;

  // Handles the vowel at `pos`. Returns std::nullopt to continue the scan.
  std::optional<std::u32string> VowelCase(std::u32string_view text,
                                          size_t pos,
                                          std::u32string_view initial) const;

  // Handles the first consonant at `pos`. Returns the final.
  virtual std::u32string ConsonantCase(std::u32string_view text, size_t pos,
                                       std::u32string_view initial) const;

  bool IsValidPair(std::u32string_view initial,
                   std::u32string_view final_part) const;

 private:
  const ValidityTable *table_;
};

}  // namespace romanization
}  // namespace romantools

#endif  // ROMANTOOLS_ROMANIZATION_STRATEGY_H_
