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


#ifndef ROMANTOOLS_ROMANIZATION_WADE_GILES_STRATEGY_H_
#define ROMANTOOLS_ROMANIZATION_WADE_GILES_STRATEGY_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/string_view.h"
#include "romanization/method.h"
#include "romanization/strategy.h"
#include "romanization/validity_table.h"

namespace romantools {
namespace romanization {

// Wade-Giles. The apostrophe marks aspiration and belongs to the initial
// ("ch'ang"), so only dashes separate syllable groups. Unseparated
// compounds ("hsinhua") are split by searching for a final whose remainder
// can still start a syllable.
class WadeGilesStrategy : public RomanizationStrategy {
 public:
  explicit WadeGilesStrategy(const ValidityTable *table);

  Method method() const override { return Method::kWadeGiles; }

  std::u32string FindFinal(std::u32string_view text,
                           std::u32string_view initial) const override;
  bool SplitsWordAt(char32_t c) const override;

  // Always "-".
  std::string SeparatorBetween(absl::string_view prev,
                               absl::string_view next) const override;

 protected:
  size_t InitialLengthAtApostrophe(size_t pos) const override {
    return pos + 1;
  }
  std::u32string ConsonantCase(std::u32string_view text, size_t pos,
                               std::u32string_view initial) const override;

 private:
  // True if `rest`, the text after a candidate final, can begin another
  // syllable.
  bool CanStartSyllable(std::u32string_view rest) const;

  // True if `text` is a complete valid syllable on its own.
  bool IsCompleteSyllable(std::u32string_view text) const;

  std::vector<std::u32string> initials_longest_first_;
};

}  // namespace romanization
}  // namespace romantools

#endif  // ROMANTOOLS_ROMANIZATION_WADE_GILES_STRATEGY_H_
