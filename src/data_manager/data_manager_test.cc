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


#include "data_manager/data_manager.h"

#include <memory>
#include <string>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "base/file_util.h"
#include "romanization/method.h"
#include "testing/googletest.h"
#include "testing/gunit.h"
#include "testing/romantest.h"

namespace romantools {
namespace {

TEST(DataManagerTest, CreateFromDirectory) {
  DataManager::DMStatusOr data_manager =
      DataManager::CreateFromDirectory(testing::GetRomanizationDataDirOrDie());
  ASSERT_TRUE(data_manager.ok()) << data_manager.status();
  const DataManager &dm = **data_manager;

  EXPECT_TRUE(dm.GetValidityTable(Method::kPinyin).IsValid("zh", "ong"));
  EXPECT_TRUE(dm.GetValidityTable(Method::kWadeGiles).IsValid("ch'", "ang"));
  EXPECT_FALSE(dm.GetValidityTable(Method::kWadeGiles).IsValid("zh", "ong"));
  EXPECT_GT(dm.conversion_table().size(), 400);
  EXPECT_TRUE(dm.stopwords().contains("like"));
  EXPECT_TRUE(dm.stopwords().contains("he"));
  EXPECT_FALSE(dm.stopwords().contains("zhong"));
  EXPECT_FALSE(dm.stopwords().contains("chan"));
}

TEST(DataManagerTest, MissingDirectory) {
  const std::string dir = FileUtil::JoinPath(
      absl::GetFlag(FLAGS_test_tmpdir), "data_manager_no_such_dir");
  EXPECT_TRUE(
      absl::IsNotFound(DataManager::CreateFromDirectory(dir).status()));
}

class BrokenDataTest : public ::testing::Test {
 protected:
  // Copies the shipped data set into a scratch directory.
  void SetUp() override {
    dir_ = FileUtil::JoinPath(absl::GetFlag(FLAGS_test_tmpdir),
                              "data_manager_test");
    ASSERT_TRUE(FileUtil::CreateDirectory(dir_).ok());
    const std::string src = testing::GetRomanizationDataDirOrDie();
    for (const absl::string_view name :
         {MethodTableFileName(Method::kPinyin),
          MethodTableFileName(Method::kWadeGiles),
          DataManager::kConversionTableFileName,
          DataManager::kStopwordsFileName}) {
      absl::StatusOr<std::string> contents =
          FileUtil::GetContents(FileUtil::JoinPath(src, name));
      ASSERT_TRUE(contents.ok()) << contents.status();
      ASSERT_TRUE(
          FileUtil::SetContents(FileUtil::JoinPath(dir_, name), *contents)
              .ok());
    }
  }

  void Overwrite(absl::string_view name, absl::string_view contents) {
    ASSERT_TRUE(
        FileUtil::SetContents(FileUtil::JoinPath(dir_, name), contents).ok());
  }

  std::string dir_;
};

TEST_F(BrokenDataTest, Copy) {
  EXPECT_TRUE(DataManager::CreateFromDirectory(dir_).ok());
}

TEST_F(BrokenDataTest, RaggedValidityTable) {
  Overwrite(MethodTableFileName(Method::kWadeGiles), ",a,o\nø,1,1\nch,1\n");
  EXPECT_TRUE(
      absl::IsDataLoss(DataManager::CreateFromDirectory(dir_).status()));
}

TEST_F(BrokenDataTest, NoSentinelRow) {
  Overwrite(MethodTableFileName(Method::kPinyin), ",a,o\nb,1,1\n");
  EXPECT_TRUE(
      absl::IsDataLoss(DataManager::CreateFromDirectory(dir_).status()));
}

TEST_F(BrokenDataTest, ConversionTableWithoutColumn) {
  Overwrite(DataManager::kConversionTableFileName, "py,meta\nzhong,\n");
  EXPECT_TRUE(
      absl::IsDataLoss(DataManager::CreateFromDirectory(dir_).status()));
}

TEST_F(BrokenDataTest, Stopwords) {
  Overwrite(DataManager::kStopwordsFileName, "# comment\nThe\n\n  of  \r\n");
  DataManager::DMStatusOr data_manager =
      DataManager::CreateFromDirectory(dir_);
  ASSERT_TRUE(data_manager.ok()) << data_manager.status();
  EXPECT_EQ((*data_manager)->stopwords().size(), 2);
  EXPECT_TRUE((*data_manager)->stopwords().contains("the"));
  EXPECT_TRUE((*data_manager)->stopwords().contains("of"));
}

}  // namespace
}  // namespace romantools
