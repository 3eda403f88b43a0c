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

#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "converter/conversion_table.h"
#include "romanization/method.h"
#include "segmenter/syllable.h"
#include "segmenter/trace_observer.h"
#include "testing/gmock.h"
#include "testing/gunit.h"

namespace romantools {
namespace converter {
namespace {

using ::testing::_;
using ::testing::StrictMock;

constexpr char kTable[] =
    "py,wg,meta\n"
    "zhong,chung,\n"
    "guo,kuo,\n"
    "den,,rare\n";

class MockTraceObserver : public segmenter::NullTraceObserver {
 public:
  MOCK_METHOD(void, OnSyllableConverted,
              (Method from, Method to, absl::string_view source,
               absl::string_view result, bool cache_hit),
              (override));
};

class SyllableConverterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<ConversionTable> table =
        ConversionTable::LoadFromString(kTable);
    ASSERT_TRUE(table.ok()) << table.status();
    table_ = *std::move(table);
  }

  ConversionTable table_;
};

TEST_F(SyllableConverterTest, Convert) {
  SyllableConverter converter(&table_, Method::kPinyin, Method::kWadeGiles,
                              10, nullptr);
  EXPECT_EQ(converter.from(), Method::kPinyin);
  EXPECT_EQ(converter.to(), Method::kWadeGiles);

  SyllableConverter::Result result = converter.Convert("zhong");
  EXPECT_EQ(result.text, "chung");
  EXPECT_EQ(result.status, SyllableConverter::Status::kConverted);

  result = converter.Convert("xyz");
  EXPECT_EQ(result.text, "xyz(!)");
  EXPECT_EQ(result.status, SyllableConverter::Status::kMissing);

  result = converter.Convert("den");
  EXPECT_EQ(result.text, "den(!rare!)");
  EXPECT_EQ(result.status, SyllableConverter::Status::kRare);
}

TEST_F(SyllableConverterTest, Reverse) {
  SyllableConverter converter(&table_, Method::kWadeGiles, Method::kPinyin,
                              10, nullptr);
  EXPECT_EQ(converter.Convert("kuo").text, "guo");
  EXPECT_EQ(converter.Convert("guo").text, "guo(!)");
}

TEST_F(SyllableConverterTest, Cache) {
  StrictMock<MockTraceObserver> observer;
  {
    ::testing::InSequence seq;
    EXPECT_CALL(observer, OnSyllableConverted(Method::kPinyin,
                                              Method::kWadeGiles, "guo",
                                              "kuo", false));
    EXPECT_CALL(observer, OnSyllableConverted(Method::kPinyin,
                                              Method::kWadeGiles, "guo",
                                              "kuo", true));
    EXPECT_CALL(observer, OnSyllableConverted(_, _, "zhong", "chung", false));
    EXPECT_CALL(observer, OnSyllableConverted(_, _, "guo", "kuo", false));
  }

  SyllableConverter converter(&table_, Method::kPinyin, Method::kWadeGiles, 1,
                              &observer);
  converter.Convert("guo");
  converter.Convert("guo");
  EXPECT_EQ(converter.cache().hits(), 1);
  // The capacity is 1, so "zhong" evicts "guo".
  converter.Convert("zhong");
  converter.Convert("guo");
  EXPECT_EQ(converter.cache().Size(), 1);
}

}  // namespace
}  // namespace converter
}  // namespace romantools
