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


#include "converter/syllable_converter.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/vlog.h"
#include "converter/conversion_table.h"
#include "romanization/method.h"
#include "segmenter/trace_observer.h"

namespace romantools {
namespace converter {

SyllableConverter::SyllableConverter(const ConversionTable *table,
                                     Method from, Method to,
                                     size_t cache_size,
                                     segmenter::TraceObserver *observer)
    : table_(table),
      from_(from),
      to_(to),
      observer_(observer != nullptr ? observer
                                    : segmenter::NullTraceObserver::Get()),
      cache_(cache_size) {
  CHECK(table_);
}

SyllableConverter::Result SyllableConverter::Convert(
    absl::string_view syllable) {
  const std::string key(syllable);
  if (std::optional<Result> cached = cache_.Lookup(key); cached.has_value()) {
    observer_->OnSyllableConverted(from_, to_, syllable, cached->text, true);
    return *std::move(cached);
  }
  Result result = Lookup(syllable);
  observer_->OnSyllableConverted(from_, to_, syllable, result.text, false);
  cache_.Insert(key, result);
  return result;
}

SyllableConverter::Result SyllableConverter::Lookup(
    absl::string_view syllable) const {
  const std::optional<ConversionTable::Entry> entry =
      table_->Lookup(from_, to_, syllable);
  if (!entry.has_value()) {
    ROMANTOOLS_VLOG(1) << "No " << MethodShorthand(to_) << " spelling for "
                       << MethodShorthand(from_) << " \"" << syllable << "\"";
    return Result{absl::StrCat(syllable, kMissingMarker), Status::kMissing};
  }
  if (entry->rare) {
    return Result{absl::StrCat(syllable, kRareMarker), Status::kRare};
  }
  return Result{entry->target, Status::kConverted};
}

}  // namespace converter
}  // namespace romantools
