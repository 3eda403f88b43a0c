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


#ifndef ROMANTOOLS_ROMANIZATION_VALIDITY_TABLE_H_
#define ROMANTOOLS_ROMANIZATION_VALIDITY_TABLE_H_

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace romantools {
namespace romanization {

// Boolean matrix of the (initial, final) pairs permitted by one romanization
// method. Immutable after construction, so one instance is shared by every
// parser of the method.
//
// The CSV form has the finals in row 0 and the initials in column 0. The
// initial kNoInitial stands for vowel-initial syllables. Cells are "1" for a
// valid pair and "0" otherwise.
class ValidityTable {
 public:
  static constexpr absl::string_view kNoInitial = "ø";

  ValidityTable(std::vector<std::string> initials,
                std::vector<std::string> finals, std::vector<bool> matrix);

  ValidityTable(const ValidityTable &) = delete;
  ValidityTable &operator=(const ValidityTable &) = delete;
  ValidityTable(ValidityTable &&) = default;
  ValidityTable &operator=(ValidityTable &&) = default;

  // Parses the CSV form. Returns DataLossError for malformed tables.
  static absl::StatusOr<ValidityTable> LoadFromStream(std::istream *is);
  static absl::StatusOr<ValidityTable> LoadFromString(absl::string_view csv);

  // Returns true if the pair is permitted. An empty initial is looked up as
  // kNoInitial. Unknown initials or finals are never valid.
  bool IsValid(absl::string_view initial, absl::string_view final_part) const;

  // Returns true if some final starting with `prefix` forms a valid pair with
  // `initial`.
  bool HasValidFinalWithPrefix(absl::string_view initial,
                               absl::string_view prefix) const;

  bool HasInitial(absl::string_view initial) const;
  bool HasFinal(absl::string_view final_part) const;

  // In table order, kNoInitial included.
  const std::vector<std::string> &initials() const { return initials_; }
  const std::vector<std::string> &finals() const { return finals_; }

  // Initials other than kNoInitial, longest first. Ties keep table order.
  const std::vector<std::string> &initials_longest_first() const {
    return initials_longest_first_;
  }

 private:
  // Returns -1 when not found.
  int InitialIndex(absl::string_view initial) const;
  int FinalIndex(absl::string_view final_part) const;

  std::vector<std::string> initials_;
  std::vector<std::string> finals_;
  std::vector<std::string> initials_longest_first_;
  absl::flat_hash_map<std::string, int> initial_index_;
  absl::flat_hash_map<std::string, int> final_index_;
  // Row-major, |initials_| x |finals_|.
  std::vector<bool> matrix_;
};

}  // namespace romanization
}  // namespace romantools

#endif  // ROMANTOOLS_ROMANIZATION_VALIDITY_TABLE_H_
