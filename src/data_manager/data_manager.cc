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
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/file_stream.h"
#include "base/file_util.h"
#include "base/util.h"
#include "converter/conversion_table.h"
#include "romanization/method.h"
#include "romanization/validity_table.h"

namespace romantools {
namespace {

absl::Status OpenDataFile(const std::string &dir, absl::string_view name,
                          InputFileStream *ifs, std::string *path) {
  *path = FileUtil::JoinPath(dir, name);
  if (absl::Status s = FileUtil::FileExists(*path); !s.ok()) {
    return absl::NotFoundError(
        absl::StrCat("Missing table data: ", *path, ": ", s.message()));
  }
  ifs->open(*path);
  if (!ifs->is_open()) {
    return absl::NotFoundError(absl::StrCat("Cannot open ", *path));
  }
  return absl::OkStatus();
}

// Annotates a parse error with the file it came from.
absl::Status WithPath(const absl::Status &status, const std::string &path) {
  return absl::Status(status.code(),
                      absl::StrCat(path, ": ", status.message()));
}

}  // namespace

DataManager::DMStatusOr DataManager::CreateFromDirectory(
    const std::string &dir) {
  auto data_manager = std::make_unique<DataManager>();
  absl::Status status = data_manager->InitFromDirectory(dir);
  if (!status.ok()) {
    LOG(ERROR) << status;
    return status;
  }
  return data_manager;
}

absl::Status DataManager::InitFromDirectory(const std::string &dir) {
  if (absl::Status s = FileUtil::DirectoryExists(dir); !s.ok()) {
    return absl::NotFoundError(
        absl::StrCat("Data directory not found: ", dir, ": ", s.message()));
  }
  data_dir_ = dir;

  std::string path;
  for (const Method method : AllMethods()) {
    InputFileStream ifs;
    if (absl::Status s = OpenDataFile(dir, MethodTableFileName(method), &ifs,
                                      &path);
        !s.ok()) {
      return s;
    }
    absl::StatusOr<romanization::ValidityTable> table =
        romanization::ValidityTable::LoadFromStream(&ifs);
    if (!table.ok()) {
      return WithPath(table.status(), path);
    }
    validity_tables_[static_cast<int>(method)] =
        std::make_unique<romanization::ValidityTable>(*std::move(table));
  }

  {
    InputFileStream ifs;
    if (absl::Status s =
            OpenDataFile(dir, kConversionTableFileName, &ifs, &path);
        !s.ok()) {
      return s;
    }
    absl::StatusOr<converter::ConversionTable> table =
        converter::ConversionTable::LoadFromStream(&ifs);
    if (!table.ok()) {
      return WithPath(table.status(), path);
    }
    conversion_table_ = *std::move(table);
  }

  {
    InputFileStream ifs;
    if (absl::Status s = OpenDataFile(dir, kStopwordsFileName, &ifs, &path);
        !s.ok()) {
      return s;
    }
    std::string line;
    while (std::getline(ifs, line)) {
      Util::ChopReturns(&line);
      const absl::string_view word = absl::StripAsciiWhitespace(line);
      if (word.empty() || word[0] == '#') {
        continue;
      }
      std::string lower(word);
      Util::LowerString(&lower);
      stopwords_.insert(std::move(lower));
    }
  }

  LOG(INFO) << "Loaded romanization data from " << dir << " ("
            << conversion_table_.size() << " conversion rows, "
            << stopwords_.size() << " stopwords)";
  return absl::OkStatus();
}

}  // namespace romantools
