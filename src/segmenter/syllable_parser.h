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


#ifndef ROMANTOOLS_SEGMENTER_SYLLABLE_PARSER_H_
#define ROMANTOOLS_SEGMENTER_SYLLABLE_PARSER_H_

#include <cstddef>
#include <string>
#include <string_view>

#include "romanization/method.h"
#include "romanization/strategy.h"
#include "segmenter/syllable.h"
#include "segmenter/trace_observer.h"
#include "storage/memo_cache.h"

namespace romantools {
namespace segmenter {

// Splits a letter run into syllables with the strategy of one method.
//
// Results are memoized per raw segment in a bounded cache, so a parser may be
// shared by threads working on independent texts.
class SyllableParser {
 public:
  // `strategy` must outlive the parser. `observer` may be nullptr.
  SyllableParser(const romanization::RomanizationStrategy *strategy,
                 size_t cache_size, TraceObserver *observer);

  SyllableParser(const SyllableParser &) = delete;
  SyllableParser &operator=(const SyllableParser &) = delete;

  // Parses the first syllable of `raw`, an original-case segment that starts
  // with a letter or a single joiner character. Always consumes at least one
  // character of a non-empty segment.
  Syllable ParseSyllable(std::u32string_view raw);

  // Parses `raw` until it is consumed.
  Word ParseAll(std::u32string_view raw);

  Method method() const { return strategy_->method(); }
  const romanization::RomanizationStrategy &strategy() const {
    return *strategy_;
  }
  TraceObserver *observer() const { return observer_; }
  const storage::MemoCache<std::string, Syllable> &cache() const {
    return cache_;
  }

 private:
  Syllable Parse(std::u32string_view raw) const;

  const romanization::RomanizationStrategy *strategy_;
  TraceObserver *observer_;
  storage::MemoCache<std::string, Syllable> cache_;
};

}  // namespace segmenter
}  // namespace romantools

#endif  // ROMANTOOLS_SEGMENTER_SYLLABLE_PARSER_H_
