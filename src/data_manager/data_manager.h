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


#ifndef ROMANTOOLS_DATA_MANAGER_DATA_MANAGER_H_
#define ROMANTOOLS_DATA_MANAGER_DATA_MANAGER_H_

#include <array>
#include <memory>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "converter/conversion_table.h"
#include "romanization/method.h"
#include "romanization/validity_table.h"

namespace romantools {

// Loads the romanization data set (validity tables of every method, the
// conversion mapping and the stopword list) from a directory and holds it
// read-only. One instance is shared by every engine of a process.
class DataManager {
 public:
  static constexpr absl::string_view kConversionTableFileName =
      "conversion_mapping.csv";
  static constexpr absl::string_view kStopwordsFileName = "stopwords.txt";

  // Creates an instance of *const* DataManager from a data directory or
  // returns error status on failure.
  using DMStatusOr = absl::StatusOr<std::unique_ptr<const DataManager>>;

  static DMStatusOr CreateFromDirectory(const std::string &dir);

  DataManager(const DataManager &) = delete;
  DataManager &operator=(const DataManager &) = delete;
  virtual ~DataManager() = default;

  const romanization::ValidityTable &GetValidityTable(Method method) const {
    return *validity_tables_[static_cast<int>(method)];
  }
  const converter::ConversionTable &conversion_table() const {
    return conversion_table_;
  }
  // Lower-cased words.
  const absl::flat_hash_set<std::string> &stopwords() const {
    return stopwords_;
  }
  const std::string &data_dir() const { return data_dir_; }

 protected:
  DataManager() = default;
  friend std::unique_ptr<DataManager> std::make_unique<DataManager>();

  absl::Status InitFromDirectory(const std::string &dir);

 private:
  std::string data_dir_;
  std::array<std::unique_ptr<romanization::ValidityTable>, kNumMethods>
      validity_tables_;
  converter::ConversionTable conversion_table_;
  absl::flat_hash_set<std::string> stopwords_;
};

}  // namespace romantools

#endif  // ROMANTOOLS_DATA_MANAGER_DATA_MANAGER_H_
