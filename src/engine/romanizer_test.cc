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


#include "engine/romanizer.h"

#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "config/config_handler.h"
#include "data_manager/data_manager.h"
#include "protocol/config.pb.h"
#include "romanization/method.h"
#include "testing/gmock.h"
#include "testing/gunit.h"
#include "testing/romantest.h"

namespace romantools {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::VariantWith;

constexpr Method kPy = Method::kPinyin;
constexpr Method kWg = Method::kWadeGiles;

class RomanizerTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    DataManager::DMStatusOr data_manager = DataManager::CreateFromDirectory(
        testing::GetRomanizationDataDirOrDie());
    CHECK_OK(data_manager.status());
    data_manager_ =
        new std::shared_ptr<const DataManager>(*std::move(data_manager));
  }

  static void TearDownTestSuite() {
    delete data_manager_;
    data_manager_ = nullptr;
  }

  static std::unique_ptr<Romanizer> CreateRomanizer(bool skip_errors,
                                                    bool report_errors) {
    config::Config config = config::ConfigHandler::DefaultConfig();
    config.set_skip_errors(skip_errors);
    config.set_report_errors(report_errors);
    return std::make_unique<Romanizer>(*data_manager_, config);
  }

  static std::shared_ptr<const DataManager> *data_manager_;
};

std::shared_ptr<const DataManager> *RomanizerTest::data_manager_ = nullptr;

TEST_F(RomanizerTest, Segment) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  absl::StatusOr<std::vector<SegmentChunk>> chunks =
      romanizer->Segment("Zhongguo ti'an tianqi", kPy);
  ASSERT_TRUE(chunks.ok()) << chunks.status();
  using Syllables = std::vector<std::string>;
  EXPECT_THAT(*chunks,
              ElementsAre(VariantWith<Syllables>(ElementsAre("zhong", "guo")),
                          VariantWith<Syllables>(ElementsAre("ti", "an")),
                          VariantWith<Syllables>(ElementsAre("tian", "qi"))));

  chunks = romanizer->Segment("changan", kPy);
  ASSERT_TRUE(chunks.ok());
  EXPECT_THAT(*chunks, ElementsAre(VariantWith<Syllables>(
                           ElementsAre("chan", "gan"))));

  chunks = romanizer->Segment("Ch'ang-an", kWg);
  ASSERT_TRUE(chunks.ok());
  EXPECT_THAT(*chunks, ElementsAre(VariantWith<Syllables>(
                           ElementsAre("ch'ang", "an"))));
}

TEST_F(RomanizerTest, SegmentKeepsLiteralsWithSkipErrors) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(true, false);
  absl::StatusOr<std::vector<SegmentChunk>> chunks =
      romanizer->Segment("hello world", kPy);
  ASSERT_TRUE(chunks.ok());
  using Syllables = std::vector<std::string>;
  EXPECT_THAT(*chunks,
              ElementsAre(VariantWith<Syllables>(ElementsAre("he", "llo")),
                          VariantWith<std::string>(" "),
                          VariantWith<Syllables>(ElementsAre("wo", "rld"))));
}

TEST_F(RomanizerTest, Validate) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  EXPECT_EQ(romanizer->Validate("Zhongguo", kPy).value(), true);
  EXPECT_EQ(romanizer->Validate("hello", kPy).value(), false);
  EXPECT_EQ(romanizer->Validate("Mao Tse-tung", kWg).value(), true);
  EXPECT_EQ(romanizer->Validate("Mao Tse-tung", kPy).value(), false);
}

TEST_F(RomanizerTest, ValidatePerWord) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  absl::StatusOr<std::vector<WordValidation>> result =
      romanizer->ValidatePerWord("Zhongguo hello", kPy);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result->size(), 2);
  EXPECT_EQ((*result)[0].word, "zhongguo");
  EXPECT_THAT((*result)[0].syllables, ElementsAre("zhong", "guo"));
  EXPECT_THAT((*result)[0].valid, ElementsAre(true, true));
  EXPECT_EQ((*result)[1].word, "hello");
  EXPECT_THAT((*result)[1].syllables, ElementsAre("he", "llo"));
  EXPECT_THAT((*result)[1].valid, ElementsAre(true, false));
}

TEST_F(RomanizerTest, Convert) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  EXPECT_EQ(romanizer->Convert("ni hao chang'an yuan", kPy, kWg).value(),
            "ni hao ch'ang-an yüan");
  EXPECT_EQ(romanizer->Convert("Zhongguo", kPy, kWg).value(), "Chung-kuo");
  EXPECT_EQ(romanizer->Convert("Xi'an Pinyin BEIJING xian", kPy, kWg).value(),
            "Hsi-an P'in-yin PEI-CHING hsien");
  EXPECT_EQ(romanizer->Convert("Ch'ang-an", kWg, kPy).value(), "Chang'an");
  EXPECT_EQ(romanizer->Convert("Chung-kuo", kWg, kPy).value(), "Zhongguo");
  // Literals are dropped and every word is converted.
  EXPECT_EQ(romanizer->Convert("Zhongguo, hello!", kPy, kWg).value(),
            "Chung-kuo ho-llo(!)");
  EXPECT_EQ(romanizer->Convert("den xyz", kPy, kWg).value(),
            "den(!rare!) xyz(!)");
}

TEST_F(RomanizerTest, ConvertWithSkipErrors) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(true, false);
  EXPECT_EQ(romanizer->Convert("Zhongguo, hello!", kPy, kWg).value(),
            "Chung-kuo, hello!");
}

TEST_F(RomanizerTest, CherryPick) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  EXPECT_EQ(romanizer->CherryPick("Welcome to Zhongguo", kPy, kWg).value(),
            "Welcome to Chung-kuo");
  EXPECT_EQ(romanizer->CherryPick("This is Zhongguo.", kPy, kWg).value(),
            "This is Chung-kuo.");
  EXPECT_EQ(
      romanizer
          ->CherryPick("I like Tang poems and Chan Buddhism, Bai Juyi too.",
                       kPy, kWg)
          .value(),
      "I like T'ang poems and Ch'an Buddhism, Pai Chü-i too.");
  EXPECT_EQ(romanizer->CherryPick("Mao Zedong's army", kPy, kWg).value(),
            "Mao Tse-tung's army");
  EXPECT_EQ(romanizer->CherryPick("Mao Tse-tung's army", kWg, kPy).value(),
            "Mao Zedong's army");
}

TEST_F(RomanizerTest, CherryPickPassesThroughOtherText) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  for (const char *text :
       {"", "   ", "Hello, world!\n", "He's here: 中国 (2024) -- ok?",
        "rock-'n'-roll", "e-mail"}) {
    EXPECT_EQ(romanizer->CherryPick(text, kPy, kWg).value(), text);
  }
}

TEST_F(RomanizerTest, CountSyllables) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  EXPECT_THAT(romanizer->CountSyllables("Zhongguo hello tianqi", kPy).value(),
              ElementsAre(2, 0, 2));
  EXPECT_THAT(romanizer->CountSyllables("", kPy).value(), IsEmpty());
}

TEST_F(RomanizerTest, DetectMethod) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  EXPECT_THAT(romanizer->DetectMethod("Zhongguo").value(), ElementsAre(kPy));
  EXPECT_THAT(romanizer->DetectMethod("Mao Tse-tung").value(),
              ElementsAre(kWg));
  EXPECT_THAT(romanizer->DetectMethod("ni hao").value(),
              ElementsAre(kPy, kWg));
  EXPECT_THAT(romanizer->DetectMethod("hello").value(), IsEmpty());
  EXPECT_THAT(romanizer->DetectMethod("").value(), IsEmpty());
}

TEST_F(RomanizerTest, DetectMethodPerWord) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  absl::StatusOr<std::vector<WordMethods>> result =
      romanizer->DetectMethodPerWord("Beijing  Hsinhua\thello");
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result->size(), 3);
  EXPECT_EQ((*result)[0].word, "Beijing");
  EXPECT_THAT((*result)[0].methods, ElementsAre(kPy));
  EXPECT_EQ((*result)[1].word, "Hsinhua");
  EXPECT_THAT((*result)[1].methods, ElementsAre(kWg));
  EXPECT_EQ((*result)[2].word, "hello");
  EXPECT_THAT((*result)[2].methods, IsEmpty());
}

TEST_F(RomanizerTest, ReportErrors) {
  std::vector<std::string> errors;
  std::unique_ptr<Romanizer> quiet = CreateRomanizer(false, false);
  ASSERT_TRUE(quiet->Convert("hello", kPy, kWg, &errors).ok());
  EXPECT_THAT(errors, IsEmpty());

  std::unique_ptr<Romanizer> reporting = CreateRomanizer(false, true);
  ASSERT_TRUE(reporting->Validate("hello", kPy, &errors).ok());
  EXPECT_THAT(errors, Not(IsEmpty()));

  errors.clear();
  ASSERT_TRUE(reporting->Convert("den", kPy, kWg, &errors).ok());
  EXPECT_EQ(errors.size(), 1);

  errors.clear();
  ASSERT_TRUE(reporting->Validate("Zhongguo", kPy, &errors).ok());
  EXPECT_THAT(errors, IsEmpty());

  // A null sink is accepted.
  EXPECT_TRUE(reporting->Validate("hello", kPy).ok());
}

TEST_F(RomanizerTest, InvalidUtf8) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  const std::string text = "zhong\xFFguo";
  EXPECT_TRUE(absl::IsInvalidArgument(romanizer->Segment(text, kPy).status()));
  EXPECT_TRUE(
      absl::IsInvalidArgument(romanizer->Convert(text, kPy, kWg).status()));
  EXPECT_TRUE(absl::IsInvalidArgument(romanizer->DetectMethod(text).status()));
}

TEST_F(RomanizerTest, SameMethod) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  EXPECT_EQ(romanizer->Convert("Xi'an", kPy, kPy).value(), "Xi'an");
  EXPECT_EQ(romanizer->CherryPick("Mao Tse-tung", kWg, kWg).value(),
            "Mao Tse-tung");
}

TEST_F(RomanizerTest, Create) {
  config::Config config = config::ConfigHandler::DefaultConfig();
  absl::StatusOr<std::unique_ptr<Romanizer>> romanizer =
      Romanizer::Create(config, testing::GetRomanizationDataDirOrDie());
  ASSERT_TRUE(romanizer.ok()) << romanizer.status();
  EXPECT_EQ((*romanizer)->Convert("Zhongguo", kPy, kWg).value(), "Chung-kuo");

  config.set_data_dir("/nonexistent/romantools/data");
  EXPECT_TRUE(absl::IsNotFound(
      Romanizer::Create(config, testing::GetRomanizationDataDirOrDie())
          .status()));
}

TEST_F(RomanizerTest, RoundTripConversion) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  for (const char *text :
       {"Zhongguo", "Beijing", "Xi'an", "Chang'an", "tianqi", "Mao Zedong",
        "Bai Juyi", "Guangzhou", "Qinghua", "Sichuan", "Er"}) {
    const std::string wg = romanizer->Convert(text, kPy, kWg).value();
    EXPECT_EQ(romanizer->Convert(wg, kWg, kPy).value(), text) << wg;
  }
}

TEST_F(RomanizerTest, VowelInitialWithoutDecomposition) {
  std::unique_ptr<Romanizer> romanizer = CreateRomanizer(false, false);
  absl::StatusOr<std::vector<SegmentChunk>> chunks =
      romanizer->Segment("aqqq", kWg);
  ASSERT_TRUE(chunks.ok());
  using Syllables = std::vector<std::string>;
  EXPECT_THAT(*chunks,
              ElementsAre(VariantWith<Syllables>(ElementsAre("aqqq"))));
  EXPECT_EQ(romanizer->Validate("aqqq", kWg).value(), false);
}

TEST_F(RomanizerTest, NonPositiveCacheSizes) {
  for (const int size : {0, -5}) {
    config::Config config;
    config.set_syllable_cache_size(size);
    config.set_conversion_cache_size(size);
    absl::StatusOr<std::unique_ptr<Romanizer>> romanizer =
        Romanizer::Create(config, testing::GetRomanizationDataDirOrDie());
    ASSERT_TRUE(romanizer.ok()) << romanizer.status();
    EXPECT_EQ((*romanizer)->Validate("zhongguo", kPy).value(), true);
    EXPECT_EQ((*romanizer)->Convert("Zhongguo", kPy, kWg).value(),
              "Chung-kuo");
    // Served from the one-entry caches.
    EXPECT_EQ((*romanizer)->Convert("Zhongguo", kPy, kWg).value(),
              "Chung-kuo");
  }
}

TEST_F(RomanizerTest, SharedBetweenThreads) {
  config::Config config = config::ConfigHandler::DefaultConfig();
  config.set_syllable_cache_size(8);
  config.set_conversion_cache_size(8);
  Romanizer romanizer(*data_manager_, config);

  std::vector<std::thread> threads;
  std::vector<std::string> results(4);
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&romanizer, &results, i] {
      for (int j = 0; j < 50; ++j) {
        results[i] = romanizer
                         .CherryPick("Welcome to Zhongguo, Beijing and Xi'an",
                                     kPy, kWg)
                         .value();
      }
    });
  }
  for (std::thread &thread : threads) {
    thread.join();
  }
  for (const std::string &result : results) {
    EXPECT_EQ(result, "Welcome to Chung-kuo, Pei-ching and Hsi-an");
  }
}

}  // namespace
}  // namespace romantools
