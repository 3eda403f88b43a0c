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


#include "converter/conversion_table.h"

#include <array>
#include <cstddef>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/util.h"
#include "base/vlog.h"
#include "romanization/method.h"

namespace romantools {
namespace converter {
namespace {

constexpr absl::string_view kMetaColumn = "meta";
constexpr absl::string_view kRare = "rare";

}  // namespace

absl::StatusOr<ConversionTable> ConversionTable::LoadFromString(
    absl::string_view csv) {
  std::istringstream is{std::string(csv)};
  return LoadFromStream(&is);
}

absl::StatusOr<ConversionTable> ConversionTable::LoadFromStream(
    std::istream *is) {
  DCHECK(is);
  ConversionTable table;
  // Column index of each method and of "meta", -1 if absent.
  std::array<int, kNumMethods> method_column;
  method_column.fill(-1);
  int meta_column = -1;
  size_t num_columns = 0;
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
      num_columns = fields.size();
      for (int column = 0; column < static_cast<int>(fields.size());
           ++column) {
        if (fields[column] == kMetaColumn) {
          meta_column = column;
          continue;
        }
        for (const Method method : AllMethods()) {
          if (fields[column] == MethodShorthand(method)) {
            method_column[static_cast<int>(method)] = column;
          }
        }
      }
      for (const Method method : AllMethods()) {
        if (method_column[static_cast<int>(method)] < 0) {
          return absl::DataLossError(absl::StrCat(
              "Conversion table has no column for ", MethodShorthand(method)));
        }
      }
      continue;
    }

    // The trailing meta cell may be omitted.
    if (fields.size() != num_columns &&
        !(meta_column == num_columns - 1 && fields.size() == num_columns - 1)) {
      return absl::DataLossError(absl::StrCat(
          "Format error at line ", line_number, ": expected ", num_columns,
          " fields but got ", fields.size()));
    }
    Row row;
    for (const Method method : AllMethods()) {
      row.spellings[static_cast<int>(method)] =
          fields[method_column[static_cast<int>(method)]];
    }
    row.rare = meta_column >= 0 && meta_column < fields.size() &&
               fields[meta_column] == kRare;
    const int row_index = static_cast<int>(table.rows_.size());
    for (const Method method : AllMethods()) {
      const std::string &spelling = row.spellings[static_cast<int>(method)];
      if (!spelling.empty()) {
        // emplace keeps the first row for alternative spellings.
        table.index_[static_cast<int>(method)].emplace(spelling, row_index);
      }
    }
    table.rows_.push_back(std::move(row));
  }

  if (!header_seen) {
    return absl::DataLossError("Empty conversion table");
  }
  ROMANTOOLS_VLOG(1) << "Loaded conversion table: " << table.rows_.size()
                     << " rows";
  return table;
}

std::optional<ConversionTable::Entry> ConversionTable::Lookup(
    Method from, Method to, absl::string_view syllable) const {
  const auto &index = index_[static_cast<int>(from)];
  const auto it = index.find(syllable);
  if (it == index.end()) {
    return std::nullopt;
  }
  const Row &row = rows_[it->second];
  const std::string &target = row.spellings[static_cast<int>(to)];
  if (!target.empty()) {
    return Entry{target, false};
  }
  if (row.rare) {
    return Entry{"", true};
  }
  return std::nullopt;
}

}  // namespace converter
}  // namespace romantools
