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

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "base/file_stream.h"
#include "base/file_util.h"
#include "base/util.h"
#include "romanization/method.h"
#include "testing/gmock.h"
#include "testing/gunit.h"
#include "testing/romantest.h"

namespace romantools {
namespace converter {
namespace {

using ::testing::Field;
using ::testing::Optional;

constexpr Method kPy = Method::kPinyin;
constexpr Method kWg = Method::kWadeGiles;

constexpr char kSmallTable[] =
    "py,wg,meta\n"
    "zhong,chung,\n"
    "si,ssŭ,\n"
    "si,ssu,\n"
    "den,,rare\n"
    "lü,lü\n"
    "lv,lü,\n";

TEST(ConversionTableTest, Lookup) {
  absl::StatusOr<ConversionTable> table =
      ConversionTable::LoadFromString(kSmallTable);
  ASSERT_TRUE(table.ok()) << table.status();
  EXPECT_EQ(table->size(), 6);

  EXPECT_THAT(table->Lookup(kPy, kWg, "zhong"),
              Optional(Field(&ConversionTable::Entry::target, "chung")));
  EXPECT_THAT(table->Lookup(kWg, kPy, "chung"),
              Optional(Field(&ConversionTable::Entry::target, "zhong")));
  EXPECT_EQ(table->Lookup(kPy, kWg, "zhang"), std::nullopt);
  // Lookup is case-sensitive; callers pass lower-cased syllables.
  EXPECT_EQ(table->Lookup(kPy, kWg, "Zhong"), std::nullopt);
}

TEST(ConversionTableTest, FirstRowWins) {
  absl::StatusOr<ConversionTable> table =
      ConversionTable::LoadFromString(kSmallTable);
  ASSERT_TRUE(table.ok());
  EXPECT_THAT(table->Lookup(kPy, kWg, "si"),
              Optional(Field(&ConversionTable::Entry::target, "ssŭ")));
  EXPECT_THAT(table->Lookup(kWg, kPy, "ssu"),
              Optional(Field(&ConversionTable::Entry::target, "si")));
  EXPECT_THAT(table->Lookup(kWg, kPy, "lü"),
              Optional(Field(&ConversionTable::Entry::target, "lü")));
  EXPECT_THAT(table->Lookup(kPy, kWg, "lv"),
              Optional(Field(&ConversionTable::Entry::target, "lü")));
}

TEST(ConversionTableTest, SameMethodNormalizes) {
  absl::StatusOr<ConversionTable> table =
      ConversionTable::LoadFromString(kSmallTable);
  ASSERT_TRUE(table.ok());
  EXPECT_THAT(table->Lookup(kWg, kWg, "ssu"),
              Optional(Field(&ConversionTable::Entry::target, "ssu")));
}

TEST(ConversionTableTest, Rare) {
  absl::StatusOr<ConversionTable> table =
      ConversionTable::LoadFromString(kSmallTable);
  ASSERT_TRUE(table.ok());
  const std::optional<ConversionTable::Entry> entry =
      table->Lookup(kPy, kWg, "den");
  ASSERT_TRUE(entry.has_value());
  EXPECT_TRUE(entry->rare);
  EXPECT_TRUE(entry->target.empty());
}

TEST(ConversionTableTest, MalformedTables) {
  EXPECT_TRUE(absl::IsDataLoss(ConversionTable::LoadFromString("").status()));
  EXPECT_TRUE(absl::IsDataLoss(
      ConversionTable::LoadFromString("py,meta\nzhong,\n").status()));
  EXPECT_TRUE(absl::IsDataLoss(
      ConversionTable::LoadFromString("py,wg,meta\nzhong\n").status()));
}

TEST(ConversionTableTest, ShippedTable) {
  InputFileStream ifs(FileUtil::JoinPath(
      testing::GetRomanizationDataDirOrDie(), "conversion_mapping.csv"));
  absl::StatusOr<ConversionTable> table = ConversionTable::LoadFromStream(&ifs);
  ASSERT_TRUE(table.ok()) << table.status();
  EXPECT_THAT(table->Lookup(kPy, kWg, "jiu"),
              Optional(Field(&ConversionTable::Entry::target, "chiu")));
  EXPECT_THAT(table->Lookup(kPy, kWg, "qu"),
              Optional(Field(&ConversionTable::Entry::target, "ch'ü")));
  EXPECT_THAT(table->Lookup(kWg, kPy, "jih"),
              Optional(Field(&ConversionTable::Entry::target, "ri")));
  EXPECT_THAT(table->Lookup(kWg, kPy, "erh"),
              Optional(Field(&ConversionTable::Entry::target, "er")));
  EXPECT_THAT(table->Lookup(kPy, kWg, "dia"),
              Optional(Field(&ConversionTable::Entry::rare, true)));
}

// Alternative Pinyin spellings ("lv", "nue") normalize to their ü forms.
bool IsAlternativePinyin(absl::string_view py) {
  return absl::StrContains(py, "v") ||
         ((absl::StartsWith(py, "l") || absl::StartsWith(py, "n")) &&
          absl::EndsWith(py, "ue"));
}

TEST(ConversionTableTest, PinyinRoundTripThroughWadeGiles) {
  const std::string path = FileUtil::JoinPath(
      testing::GetRomanizationDataDirOrDie(), "conversion_mapping.csv");
  absl::StatusOr<ConversionTable> table = ConversionTable::LoadFromString(
      FileUtil::GetContents(path).value());
  ASSERT_TRUE(table.ok()) << table.status();

  std::string line;
  std::vector<std::string> fields;
  int num_checked = 0;
  InputFileStream ifs(path);
  std::getline(ifs, line);  // Header.
  while (std::getline(ifs, line)) {
    Util::ChopReturns(&line);
    Util::SplitCSV(line, &fields);
    const std::string py(absl::StripAsciiWhitespace(fields[0]));
    if (py.empty() || IsAlternativePinyin(py)) {
      continue;
    }
    const std::optional<ConversionTable::Entry> wg =
        table->Lookup(kPy, kWg, py);
    if (!wg.has_value() || wg->rare) {
      continue;
    }
    ++num_checked;
    EXPECT_THAT(table->Lookup(kWg, kPy, wg->target),
                Optional(Field(&ConversionTable::Entry::target, py)))
        << py << " -> " << wg->target;
  }
  EXPECT_GT(num_checked, 400);
}

}  // namespace
}  // namespace converter
}  // namespace romantools
