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


#include "romanization/validity_table.h"

#include <algorithm>
#include <cstddef>
#include <istream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/util.h"
#include "base/vlog.h"

namespace romantools {
namespace romanization {

ValidityTable::ValidityTable(std::vector<std::string> initials,
                             std::vector<std::string> finals,
                             std::vector<bool> matrix)
    : initials_(std::move(initials)),
      finals_(std::move(finals)),
      matrix_(std::move(matrix)) {
  CHECK_EQ(matrix_.size(), initials_.size() * finals_.size());
  for (int i = 0; i < static_cast<int>(initials_.size()); ++i) {
    initial_index_.emplace(initials_[i], i);
    if (initials_[i] != kNoInitial) {
      initials_longest_first_.push_back(initials_[i]);
    }
  }
  for (int i = 0; i < static_cast<int>(finals_.size()); ++i) {
    final_index_.emplace(finals_[i], i);
  }
  // Initials are compared in code points; "ch'" is longer than "ch".
  std::stable_sort(initials_longest_first_.begin(),
                   initials_longest_first_.end(),
                   [](const std::string &lhs, const std::string &rhs) {
                     return Util::CharsLen(lhs) > Util::CharsLen(rhs);
                   });
}

absl::StatusOr<ValidityTable> ValidityTable::LoadFromString(
    absl::string_view csv) {
  std::istringstream is{std::string(csv)};
  return LoadFromStream(&is);
}

absl::StatusOr<ValidityTable> ValidityTable::LoadFromStream(std::istream *is) {
  DCHECK(is);
  std::vector<std::string> initials;
  std::vector<std::string> finals;
  std::vector<bool> matrix;
  bool header_seen = false;
  int line_number = 0;

  std::string line;
  std::vector<std::string> fields;
  while (std::getline(*is, line)) {
    ++line_number;
    Util::ChopReturns(&line);
    if (line_number == 1) {
      line = std::string(Util::StripUtf8Bom(line));
    }
    if (line.empty() || line[0] == '#') {
      continue;
    }
    Util::SplitCSV(line, &fields);
    for (std::string &field : fields) {
      field = std::string(absl::StripAsciiWhitespace(field));
    }

    if (!header_seen) {
      header_seen = true;
      for (size_t i = 1; i < fields.size(); ++i) {
        if (fields[i].empty()) {
          return absl::DataLossError(
              absl::StrCat("Empty final in the header, column ", i));
        }
        if (std::find(finals.begin(), finals.end(), fields[i]) !=
            finals.end()) {
          return absl::DataLossError(
              absl::StrCat("Duplicate final in the header: ", fields[i]));
        }
        finals.push_back(fields[i]);
      }
      if (finals.empty()) {
        return absl::DataLossError("The header has no finals");
      }
      continue;
    }

    if (fields.size() != finals.size() + 1) {
      return absl::DataLossError(absl::StrCat(
          "Format error at line ", line_number, ": expected ",
          finals.size() + 1, " fields but got ", fields.size()));
    }
    const std::string &initial = fields[0];
    if (initial.empty() ||
        std::find(initials.begin(), initials.end(), initial) !=
            initials.end()) {
      return absl::DataLossError(absl::StrCat(
          "Empty or duplicate initial at line ", line_number, ": ", initial));
    }
    initials.push_back(initial);
    for (size_t i = 1; i < fields.size(); ++i) {
      if (fields[i] != "0" && fields[i] != "1") {
        return absl::DataLossError(absl::StrCat("Invalid cell at line ",
                                                line_number, ": ", fields[i]));
      }
      matrix.push_back(fields[i] == "1");
    }
  }

  if (!header_seen) {
    return absl::DataLossError("Empty validity table");
  }
  if (std::find(initials.begin(), initials.end(), kNoInitial) ==
      initials.end()) {
    return absl::DataLossError(
        absl::StrCat("The table has no row for the no-initial marker ",
                     kNoInitial));
  }
  ROMANTOOLS_VLOG(1) << "Loaded validity table: " << initials.size()
                     << " initials x " << finals.size() << " finals";
  return ValidityTable(std::move(initials), std::move(finals),
                       std::move(matrix));
}

int ValidityTable::InitialIndex(absl::string_view initial) const {
  if (initial.empty()) {
    initial = kNoInitial;
  }
  const auto it = initial_index_.find(initial);
  return it == initial_index_.end() ? -1 : it->second;
}

int ValidityTable::FinalIndex(absl::string_view final_part) const {
  const auto it = final_index_.find(final_part);
  return it == final_index_.end() ? -1 : it->second;
}

bool ValidityTable::IsValid(absl::string_view initial,
                            absl::string_view final_part) const {
  const int row = InitialIndex(initial);
  const int column = FinalIndex(final_part);
  if (row < 0 || column < 0) {
    return false;
  }
  return matrix_[row * finals_.size() + column];
}

bool ValidityTable::HasValidFinalWithPrefix(absl::string_view initial,
                                            absl::string_view prefix) const {
  const int row = InitialIndex(initial);
  if (row < 0) {
    return false;
  }
  for (size_t column = 0; column < finals_.size(); ++column) {
    if (matrix_[row * finals_.size() + column] &&
        absl::StartsWith(finals_[column], prefix)) {
      return true;
    }
  }
  return false;
}

bool ValidityTable::HasInitial(absl::string_view initial) const {
  return InitialIndex(initial) >= 0;
}

bool ValidityTable::HasFinal(absl::string_view final_part) const {
  return FinalIndex(final_part) >= 0;
}

}  // namespace romanization
}  // namespace romantools
