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


#ifndef ROMANTOOLS_CONVERTER_CONVERSION_TABLE_H_
#define ROMANTOOLS_CONVERTER_CONVERSION_TABLE_H_

#include <array>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "romanization/method.h"

namespace romantools {
namespace converter {

// Syllable spellings of every method, one row per syllable.
//
// The CSV header names the method columns by shorthand ("py", "wg") plus an
// optional "meta" column. "meta" is "rare" for rows whose target spelling is
// intentionally absent. When a spelling appears in several rows of a column
// (alternative spellings), the first row wins.
class ConversionTable {
 public:
  struct Entry {
    // Spelling in the target method. Empty if `rare`.
    std::string target;
    bool rare = false;
  };

  ConversionTable() = default;
  ConversionTable(const ConversionTable &) = delete;
  ConversionTable &operator=(const ConversionTable &) = delete;
  ConversionTable(ConversionTable &&) = default;
  ConversionTable &operator=(ConversionTable &&) = default;

  static absl::StatusOr<ConversionTable> LoadFromStream(std::istream *is);
  static absl::StatusOr<ConversionTable> LoadFromString(absl::string_view csv);

  // Looks up the lower-cased `syllable` in the `from` column. Returns
  // std::nullopt when the syllable is unknown or its row has no spelling for
  // `to` without being marked as rare.
  std::optional<Entry> Lookup(Method from, Method to,
                              absl::string_view syllable) const;

  size_t size() const { return rows_.size(); }

 private:
  struct Row {
    std::array<std::string, kNumMethods> spellings;
    bool rare = false;
  };

  std::vector<Row> rows_;
  // Per method, spelling -> index of the first row holding it.
  std::array<absl::flat_hash_map<std::string, int>, kNumMethods> index_;
};

}  // namespace converter
}  // namespace romantools

#endif  // ROMANTOOLS_CONVERTER_CONVERSION_TABLE_H_
