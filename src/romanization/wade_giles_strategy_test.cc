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


#include "romanization/wade_giles_strategy.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "base/file_stream.h"
#include "base/file_util.h"
#include "base/util.h"
#include "romanization/strategy.h"
#include "romanization/strategy_factory.h"
#include "romanization/validity_table.h"
#include "testing/gunit.h"
#include "testing/romantest.h"

namespace romantools {
namespace romanization {
namespace {

class WadeGilesStrategyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    InputFileStream ifs(FileUtil::JoinPath(
        testing::GetRomanizationDataDirOrDie(), "wade_giles_syllables.csv"));
    absl::StatusOr<ValidityTable> table = ValidityTable::LoadFromStream(&ifs);
    ASSERT_TRUE(table.ok()) << table.status();
    table_ = std::make_unique<ValidityTable>(*std::move(table));
    strategy_ = CreateStrategy(Method::kWadeGiles, table_.get());
  }

  std::string Split(absl::string_view text) const {
    const std::u32string text32 = Util::Utf8ToUtf32(text);
    const std::u32string initial = strategy_->FindInitial(text32);
    const std::u32string_view rest =
        initial == kNoInitial ? std::u32string_view(text32)
                              : std::u32string_view(text32).substr(
                                    initial.size());
    const std::u32string final_part = strategy_->FindFinal(rest, initial);
    return Util::Utf32ToUtf8(initial) + "|" + Util::Utf32ToUtf8(final_part);
  }

  std::unique_ptr<ValidityTable> table_;
  std::unique_ptr<RomanizationStrategy> strategy_;
};

TEST_F(WadeGilesStrategyTest, Method) {
  EXPECT_EQ(strategy_->method(), Method::kWadeGiles);
}

TEST_F(WadeGilesStrategyTest, AspiratedInitials) {
  EXPECT_EQ(strategy_->FindInitial(U"ch'ang"), U"ch'");
  EXPECT_EQ(strategy_->FindInitial(U"tz'u"), U"tz'");
  EXPECT_EQ(strategy_->FindInitial(U"p'ing"), U"p'");
  EXPECT_EQ(strategy_->FindInitial(U"chang"), U"ch");
  EXPECT_EQ(Split("ch'angan"), "ch'|ang");
  EXPECT_EQ(Split("tz'u"), "tz'|u");
}

TEST_F(WadeGilesStrategyTest, TrailingH) {
  EXPECT_EQ(Split("shih"), "sh|ih");
  EXPECT_EQ(Split("jih"), "j|ih");
  EXPECT_EQ(Split("hsieh"), "hs|ieh");
  EXPECT_EQ(Split("yüeh"), "y|üeh");
  EXPECT_EQ(Split("erh"), "ø|erh");
}

TEST_F(WadeGilesStrategyTest, CompoundBoundary) {
  EXPECT_EQ(Split("hsinhua"), "hs|in");
  EXPECT_EQ(Split("linp'ing"), "l|in");
  EXPECT_EQ(Split("anhui"), "ø|an");
  EXPECT_EQ(Split("chung"), "ch|ung");
  EXPECT_EQ(Split("kuo"), "k|uo");
  EXPECT_EQ(Split("ssu"), "ss|u");
  EXPECT_EQ(Split("ên"), "ø|ên");
}

TEST_F(WadeGilesStrategyTest, ApostropheAfterSyllable) {
  EXPECT_EQ(Split("tung's"), "t|ung");
  EXPECT_EQ(Split("tse"), "ts|e");
}

TEST_F(WadeGilesStrategyTest, NoVowel) {
  EXPECT_EQ(Split("xyz"), "xyz|");
  EXPECT_FALSE(strategy_->ValidateSyllable(U"xyz", U""));
}

TEST_F(WadeGilesStrategyTest, EveryValidPairSplitsBack) {
  int num_valid = 0;
  for (const std::string &initial : table_->initials()) {
    for (const std::string &final_part : table_->finals()) {
      if (!table_->IsValid(initial, final_part)) {
        continue;
      }
      ++num_valid;
      const std::string text =
          (initial == ValidityTable::kNoInitial ? "" : initial) + final_part;
      EXPECT_EQ(Split(text), initial + "|" + final_part) << text;
      EXPECT_TRUE(strategy_->ValidateSyllable(Util::Utf8ToUtf32(initial),
                                              Util::Utf8ToUtf32(final_part)))
          << text;
    }
  }
  EXPECT_GT(num_valid, 400);
}

TEST_F(WadeGilesStrategyTest, VowelInitialWithoutDecomposition) {
  // No length of "aqqq" is a complete syllable, so the text stays whole.
  EXPECT_EQ(Split("aqqq"), "ø|aqqq");
  EXPECT_FALSE(strategy_->ValidateSyllable(kNoInitial, U"aqqq"));
}

TEST_F(WadeGilesStrategyTest, SplitsWordAt) {
  EXPECT_TRUE(strategy_->SplitsWordAt(U'-'));
  EXPECT_FALSE(strategy_->SplitsWordAt(U'\''));
}

TEST_F(WadeGilesStrategyTest, SeparatorBetween) {
  EXPECT_EQ(strategy_->SeparatorBetween("chung", "kuo"), "-");
  EXPECT_EQ(strategy_->SeparatorBetween("hsi", "an"), "-");
}

}  // namespace
}  // namespace romanization
}  // namespace romantools
