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


#include "segmenter/text_chunker.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/strings/str_join.h"
#include "data_manager/data_manager.h"
#include "romanization/method.h"
#include "romanization/strategy.h"
#include "romanization/strategy_factory.h"
#include "segmenter/syllable.h"
#include "segmenter/syllable_parser.h"
#include "testing/gmock.h"
#include "testing/gunit.h"
#include "testing/romantest.h"

namespace romantools {
namespace segmenter {
namespace {

using ::testing::ElementsAre;

// Renders chunks as "[zhong guo]" for words and "<, >" for literals.
std::vector<std::string> Render(const std::vector<Chunk> &chunks) {
  std::vector<std::string> result;
  for (const Chunk &chunk : chunks) {
    if (chunk.is_literal()) {
      result.push_back("<" + chunk.literal() + ">");
      continue;
    }
    std::vector<std::string> syllables;
    for (const Syllable &syllable : chunk.word()) {
      syllables.push_back(syllable.full_syllable());
    }
    result.push_back("[" + absl::StrJoin(syllables, " ") + "]");
  }
  return result;
}

class TextChunkerTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    DataManager::DMStatusOr data_manager = DataManager::CreateFromDirectory(
        testing::GetRomanizationDataDirOrDie());
    CHECK_OK(data_manager.status());
    data_manager_ = std::move(data_manager).value().release();
  }

  static void TearDownTestSuite() {
    delete data_manager_;
    data_manager_ = nullptr;
  }

  void SetUp() override {
    for (const Method method : AllMethods()) {
      const int index = static_cast<int>(method);
      strategies_[index] = romanization::CreateStrategy(
          method, &data_manager_->GetValidityTable(method));
      parsers_[index] = std::make_unique<SyllableParser>(
          strategies_[index].get(), 1000, nullptr);
    }
  }

  std::vector<std::string> Split(Method method, absl::string_view text,
                                 bool keep_literals) {
    TextChunker chunker(parsers_[static_cast<int>(method)].get());
    return Render(chunker.Split(text, keep_literals));
  }

  static const DataManager *data_manager_;
  std::unique_ptr<romanization::RomanizationStrategy> strategies_[kNumMethods];
  std::unique_ptr<SyllableParser> parsers_[kNumMethods];
};

const DataManager *TextChunkerTest::data_manager_ = nullptr;

TEST_F(TextChunkerTest, Pinyin) {
  EXPECT_THAT(Split(Method::kPinyin, "Zhongguo ti'an tianqi", false),
              ElementsAre("[zhong guo]", "[ti an]", "[tian qi]"));
  EXPECT_THAT(Split(Method::kPinyin, "Zhongguo ti'an tianqi", true),
              ElementsAre("[zhong guo]", "< >", "[ti an]", "< >",
                          "[tian qi]"));
  EXPECT_THAT(Split(Method::kPinyin, "changan", false),
              ElementsAre("[chan gan]"));
}

TEST_F(TextChunkerTest, Literals) {
  EXPECT_THAT(Split(Method::kPinyin, "hello, world! 中国 Xi'an", true),
              ElementsAre("[he llo]", "<, >", "[wo rld]", "<! 中国 >",
                          "[xi an]"));
  EXPECT_THAT(Split(Method::kPinyin, "hello, world! 中国 Xi'an", false),
              ElementsAre("[he llo]", "[wo rld]", "[xi an]"));
  EXPECT_THAT(Split(Method::kPinyin, "", true), ElementsAre());
  EXPECT_THAT(Split(Method::kPinyin, "123 ...", true),
              ElementsAre("<123 ...>"));
}

TEST_F(TextChunkerTest, JoinersBetweenLetters) {
  // A joiner belongs to the run only when a letter follows it.
  EXPECT_THAT(Split(Method::kPinyin, "rock-'n'-roll", true),
              ElementsAre("[ro ck]", "<-'>", "[n]", "<'->", "[ro ll]"));
  EXPECT_THAT(Split(Method::kPinyin, "'Xi'", true),
              ElementsAre("<'>", "[xi]", "<'>"));
}

TEST_F(TextChunkerTest, WadeGiles) {
  EXPECT_THAT(Split(Method::kWadeGiles, "Ch'ang-an, Mao Tse-tung's", true),
              ElementsAre("[ch'ang an]", "<, >", "[mao]", "< >",
                          "[tse tung s]"));
  EXPECT_THAT(Split(Method::kWadeGiles, "ch'angan linp'ing", false),
              ElementsAre("[ch'ang an]", "[lin p'ing]"));
}

TEST_F(TextChunkerTest, ComposesDiacritics) {
  EXPECT_THAT(Split(Method::kPinyin, "nu\u0308e", false),
              ElementsAre("[n\u00FCe]"));
  EXPECT_THAT(Split(Method::kWadeGiles, "yu\u0308eh", false),
              ElementsAre("[y\u00FCeh]"));
}

TEST_F(TextChunkerTest, RawText) {
  TextChunker chunker(parsers_[static_cast<int>(Method::kPinyin)].get());
  const std::vector<Chunk> chunks = chunker.Split("Xi’an, 2024", true);
  ASSERT_EQ(chunks.size(), 2);
  EXPECT_TRUE(chunks[0].is_word());
  EXPECT_EQ(chunks[0].RawText(), "Xi’an");
  EXPECT_EQ(chunks[1].RawText(), ", 2024");
}

}  // namespace
}  // namespace segmenter
}  // namespace romantools
