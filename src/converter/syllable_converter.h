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


#ifndef ROMANTOOLS_CONVERTER_SYLLABLE_CONVERTER_H_
#define ROMANTOOLS_CONVERTER_SYLLABLE_CONVERTER_H_

#include <cstddef>
#include <string>

#include "absl/strings/string_view.h"
#include "converter/conversion_table.h"
#include "romanization/method.h"
#include "segmenter/trace_observer.h"
#include "storage/memo_cache.h"

namespace romantools {
namespace converter {

// Converts single syllables from one method to another through the
// conversion table, memoizing the results.
class SyllableConverter {
 public:
  static constexpr absl::string_view kMissingMarker = "(!)";
  static constexpr absl::string_view kRareMarker = "(!rare!)";

  enum class Status {
    kConverted,
    // Unknown syllable. The text is the source with kMissingMarker.
    kMissing,
    // Intentionally absent spelling. The text is the source with
    // kRareMarker.
    kRare,
  };

  struct Result {
    std::string text;
    Status status = Status::kConverted;
  };

  // `table` must outlive the converter. `observer` may be nullptr.
  SyllableConverter(const ConversionTable *table, Method from, Method to,
                    size_t cache_size, segmenter::TraceObserver *observer);

  SyllableConverter(const SyllableConverter &) = delete;
  SyllableConverter &operator=(const SyllableConverter &) = delete;

  // `syllable` is a case-folded full syllable. Capitalization is left to the
  // caller.
  Result Convert(absl::string_view syllable);

  Method from() const { return from_; }
  Method to() const { return to_; }
  const storage::MemoCache<std::string, Result> &cache() const {
    return cache_;
  }

 private:
  Result Lookup(absl::string_view syllable) const;

  const ConversionTable *table_;
  const Method from_;
  const Method to_;
  segmenter::TraceObserver *observer_;
  storage::MemoCache<std::string, Result> cache_;
};

}  // namespace converter
}  // namespace romantools

#endif  // ROMANTOOLS_CONVERTER_SYLLABLE_CONVERTER_H_
