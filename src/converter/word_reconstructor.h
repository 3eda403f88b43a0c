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


#ifndef ROMANTOOLS_CONVERTER_WORD_RECONSTRUCTOR_H_
#define ROMANTOOLS_CONVERTER_WORD_RECONSTRUCTOR_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "converter/syllable_converter.h"
#include "romanization/strategy.h"
#include "segmenter/syllable.h"

namespace romantools {
namespace converter {

// Rebuilds a parsed word in the target method: converts the syllables,
// re-inserts the separators of the target method and restores the
// capitalization of the source.
class WordReconstructor {
 public:
  // `converter`, `target` and `stopwords` must outlive the reconstructor.
  // `target` is the strategy of converter->to().
  WordReconstructor(SyllableConverter *converter,
                    const romanization::RomanizationStrategy *target,
                    const absl::flat_hash_set<std::string> *stopwords);

  WordReconstructor(const WordReconstructor &) = delete;
  WordReconstructor &operator=(const WordReconstructor &) = delete;

  // True if every syllable is valid, or only a trailing contraction after an
  // apostrophe ("Mao's") is not. Stopwords are never convertible.
  bool IsConvertible(const segmenter::Word &word) const;

  // Returns the converted word. In selective mode words that are not
  // convertible are returned as they were written. Otherwise every syllable
  // is converted and failures are marked in the output. Conversion problems
  // are appended to `errors` when it is not nullptr.
  std::string Reconstruct(const segmenter::Word &word, bool selective,
                          std::vector<std::string> *errors);

 private:
  // True if the last syllable is a contraction exempt from validation.
  static bool HasTrailingContraction(const segmenter::Word &word);
  bool IsStopword(const segmenter::Word &word, size_t num_syllables) const;

  SyllableConverter *converter_;
  const romanization::RomanizationStrategy *target_;
  const absl::flat_hash_set<std::string> *stopwords_;
};

}  // namespace converter
}  // namespace romantools

#endif  // ROMANTOOLS_CONVERTER_WORD_RECONSTRUCTOR_H_
