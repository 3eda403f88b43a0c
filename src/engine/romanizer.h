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


#ifndef ROMANTOOLS_ENGINE_ROMANIZER_H_
#define ROMANTOOLS_ENGINE_ROMANIZER_H_

#include <array>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "converter/syllable_converter.h"
#include "data_manager/data_manager.h"
#include "protocol/config.pb.h"
#include "romanization/method.h"
#include "romanization/strategy.h"
#include "segmenter/syllable_parser.h"
#include "segmenter/text_chunker.h"
#include "segmenter/trace_observer.h"

namespace romantools {

// Syllable spellings of a word, or a literal span kept with skip_errors.
using SegmentChunk = std::variant<std::vector<std::string>, std::string>;

struct WordValidation {
  // Concatenated syllables.
  std::string word;
  std::vector<std::string> syllables;
  // Validity of each syllable.
  std::vector<bool> valid;
};

struct WordMethods {
  std::string word;
  std::vector<Method> methods;
};

// Entry point of the romanization engine. Implements the actions on top of
// the shared data set: segmentation, validation, conversion, selective
// conversion, syllable counting and method detection.
//
// One instance may be shared by threads. Parsers and converters are created
// on first use and keep bounded caches. Every action returns
// InvalidArgumentError for text that is not valid UTF-8.
//
// When `report_errors` is set in the config, diagnostics of an action are
// appended to `errors` if it is not nullptr.
class Romanizer {
 public:
  // `observer` may be nullptr. A LoggingTraceObserver is used when the config
  // enables tracing and no observer is given.
  Romanizer(std::shared_ptr<const DataManager> data_manager,
            const config::Config &config,
            segmenter::TraceObserver *observer = nullptr);

  // Loads the data set from config.data_dir(), or `default_data_dir` if it is
  // empty.
  static absl::StatusOr<std::unique_ptr<Romanizer>> Create(
      const config::Config &config, const std::string &default_data_dir);

  Romanizer(const Romanizer &) = delete;
  Romanizer &operator=(const Romanizer &) = delete;

  absl::StatusOr<std::vector<SegmentChunk>> Segment(
      absl::string_view text, Method method,
      std::vector<std::string> *errors = nullptr);

  // True if every syllable of the text is valid.
  absl::StatusOr<bool> Validate(absl::string_view text, Method method,
                                std::vector<std::string> *errors = nullptr);
  absl::StatusOr<std::vector<WordValidation>> ValidatePerWord(
      absl::string_view text, Method method,
      std::vector<std::string> *errors = nullptr);

  // Without skip_errors every word is converted and the words are joined
  // with single spaces. With skip_errors only convertible words are
  // converted and everything else is kept as written.
  absl::StatusOr<std::string> Convert(
      absl::string_view text, Method from, Method to,
      std::vector<std::string> *errors = nullptr);

  // Convert() with skip_errors forced on.
  absl::StatusOr<std::string> CherryPick(
      absl::string_view text, Method from, Method to,
      std::vector<std::string> *errors = nullptr);

  // Number of syllables of each word, 0 for words with an invalid syllable.
  absl::StatusOr<std::vector<int>> CountSyllables(
      absl::string_view text, Method method,
      std::vector<std::string> *errors = nullptr);

  // Methods under which the whole text parses into valid syllables.
  absl::StatusOr<std::vector<Method>> DetectMethod(absl::string_view text);
  // Same for each whitespace-separated word.
  absl::StatusOr<std::vector<WordMethods>> DetectMethodPerWord(
      absl::string_view text);

  const config::Config &config() const { return config_; }
  const DataManager &data_manager() const { return *data_manager_; }

 private:
  absl::StatusOr<std::vector<segmenter::Chunk>> Split(
      absl::string_view text, Method method, bool keep_literals,
      std::vector<std::string> *errors);
  absl::StatusOr<std::string> ConvertInternal(absl::string_view text,
                                              Method from, Method to,
                                              bool selective,
                                              std::vector<std::string> *errors);
  bool IsValidFor(absl::string_view text, Method method);

  segmenter::SyllableParser *GetParser(Method method);
  converter::SyllableConverter *GetConverter(Method from, Method to);
  const romanization::RomanizationStrategy *GetStrategy(Method method);

  // Returns `errors` when diagnostics are to be reported, nullptr otherwise.
  std::vector<std::string> *ErrorSink(std::vector<std::string> *errors) const;

  const std::shared_ptr<const DataManager> data_manager_;
  const config::Config config_;
  std::unique_ptr<segmenter::TraceObserver> owned_observer_;
  segmenter::TraceObserver *observer_;

  absl::Mutex mutex_;
  std::array<std::unique_ptr<romanization::RomanizationStrategy>, kNumMethods>
      strategies_ ABSL_GUARDED_BY(mutex_);
  std::array<std::unique_ptr<segmenter::SyllableParser>, kNumMethods>
      parsers_ ABSL_GUARDED_BY(mutex_);
  std::array<std::unique_ptr<converter::SyllableConverter>,
             kNumMethods * kNumMethods>
      converters_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace romantools

#endif  // ROMANTOOLS_ENGINE_ROMANIZER_H_
