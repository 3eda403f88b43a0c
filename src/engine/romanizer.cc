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

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "base/util.h"
#include "base/vlog.h"
#include "converter/syllable_converter.h"
#include "converter/word_reconstructor.h"
#include "data_manager/data_manager.h"
#include "protocol/config.pb.h"
#include "romanization/method.h"
#include "romanization/strategy.h"
#include "romanization/strategy_factory.h"
#include "segmenter/syllable.h"
#include "segmenter/syllable_parser.h"
#include "segmenter/text_chunker.h"
#include "segmenter/trace_observer.h"

namespace romantools {

using ::romantools::segmenter::Chunk;
using ::romantools::segmenter::Syllable;

namespace {

// Configs built without ConfigHandler::NormalizeConfig may hold sizes below 1.
size_t CacheSize(int configured) {
  return static_cast<size_t>(std::max(1, configured));
}

}  // namespace

Romanizer::Romanizer(std::shared_ptr<const DataManager> data_manager,
                     const config::Config &config,
                     segmenter::TraceObserver *observer)
    : data_manager_(std::move(data_manager)),
      config_(config),
      observer_(observer) {
  if (observer_ == nullptr) {
    if (config_.trace()) {
      owned_observer_ = std::make_unique<segmenter::LoggingTraceObserver>();
      observer_ = owned_observer_.get();
    } else {
      observer_ = segmenter::NullTraceObserver::Get();
    }
  }
}

absl::StatusOr<std::unique_ptr<Romanizer>> Romanizer::Create(
    const config::Config &config, const std::string &default_data_dir) {
  const std::string &dir =
      config.data_dir().empty() ? default_data_dir : config.data_dir();
  absl::StatusOr<std::unique_ptr<const DataManager>> data_manager =
      DataManager::CreateFromDirectory(dir);
  if (!data_manager.ok()) {
    return data_manager.status();
  }
  return std::make_unique<Romanizer>(
      std::shared_ptr<const DataManager>(*std::move(data_manager)), config);
}

std::vector<std::string> *Romanizer::ErrorSink(
    std::vector<std::string> *errors) const {
  return config_.report_errors() ? errors : nullptr;
}

const romanization::RomanizationStrategy *Romanizer::GetStrategy(
    Method method) {
  absl::MutexLock lock(&mutex_);
  std::unique_ptr<romanization::RomanizationStrategy> &strategy =
      strategies_[static_cast<int>(method)];
  if (strategy == nullptr) {
    strategy = romanization::CreateStrategy(
        method, &data_manager_->GetValidityTable(method));
  }
  return strategy.get();
}

segmenter::SyllableParser *Romanizer::GetParser(Method method) {
  const romanization::RomanizationStrategy *strategy = GetStrategy(method);
  absl::MutexLock lock(&mutex_);
  std::unique_ptr<segmenter::SyllableParser> &parser =
      parsers_[static_cast<int>(method)];
  if (parser == nullptr) {
    ROMANTOOLS_VLOG(1) << "Creating the syllable parser for "
                       << MethodPrettyName(method);
    parser = std::make_unique<segmenter::SyllableParser>(
        strategy, CacheSize(config_.syllable_cache_size()), observer_);
  }
  return parser.get();
}

converter::SyllableConverter *Romanizer::GetConverter(Method from,
                                                      Method to) {
  absl::MutexLock lock(&mutex_);
  std::unique_ptr<converter::SyllableConverter> &converter =
      converters_[static_cast<int>(from) * kNumMethods + static_cast<int>(to)];
  if (converter == nullptr) {
    converter = std::make_unique<converter::SyllableConverter>(
        &data_manager_->conversion_table(), from, to,
        CacheSize(config_.conversion_cache_size()), observer_);
  }
  return converter.get();
}

absl::StatusOr<std::vector<Chunk>> Romanizer::Split(
    absl::string_view text, Method method, bool keep_literals,
    std::vector<std::string> *errors) {
  if (!Util::IsValidUtf8(text)) {
    return absl::InvalidArgumentError("Input is not valid UTF-8");
  }
  segmenter::TextChunker chunker(GetParser(method));
  std::vector<Chunk> chunks = chunker.Split(text, keep_literals);
  if (errors != nullptr) {
    for (const Chunk &chunk : chunks) {
      if (!chunk.is_word()) {
        continue;
      }
      for (const Syllable &syllable : chunk.word()) {
        errors->insert(errors->end(), syllable.diagnostics().begin(),
                       syllable.diagnostics().end());
      }
    }
  }
  return chunks;
}

absl::StatusOr<std::vector<SegmentChunk>> Romanizer::Segment(
    absl::string_view text, Method method, std::vector<std::string> *errors) {
  absl::StatusOr<std::vector<Chunk>> chunks =
      Split(text, method, config_.skip_errors(), ErrorSink(errors));
  if (!chunks.ok()) {
    return chunks.status();
  }
  std::vector<SegmentChunk> result;
  result.reserve(chunks->size());
  for (const Chunk &chunk : *chunks) {
    if (chunk.is_literal()) {
      result.emplace_back(chunk.literal());
      continue;
    }
    std::vector<std::string> syllables;
    for (const Syllable &syllable : chunk.word()) {
      syllables.push_back(syllable.full_syllable());
    }
    result.emplace_back(std::move(syllables));
  }
  return result;
}

absl::StatusOr<bool> Romanizer::Validate(absl::string_view text,
                                         Method method,
                                         std::vector<std::string> *errors) {
  absl::StatusOr<std::vector<Chunk>> chunks =
      Split(text, method, false, ErrorSink(errors));
  if (!chunks.ok()) {
    return chunks.status();
  }
  for (const Chunk &chunk : *chunks) {
    for (const Syllable &syllable : chunk.word()) {
      if (!syllable.valid()) {
        return false;
      }
    }
  }
  return true;
}

absl::StatusOr<std::vector<WordValidation>> Romanizer::ValidatePerWord(
    absl::string_view text, Method method, std::vector<std::string> *errors) {
  absl::StatusOr<std::vector<Chunk>> chunks =
      Split(text, method, false, ErrorSink(errors));
  if (!chunks.ok()) {
    return chunks.status();
  }
  std::vector<WordValidation> result;
  for (const Chunk &chunk : *chunks) {
    WordValidation &validation = result.emplace_back();
    for (const Syllable &syllable : chunk.word()) {
      validation.word.append(syllable.full_syllable());
      validation.syllables.push_back(syllable.full_syllable());
      validation.valid.push_back(syllable.valid());
    }
  }
  return result;
}

absl::StatusOr<std::string> Romanizer::Convert(
    absl::string_view text, Method from, Method to,
    std::vector<std::string> *errors) {
  return ConvertInternal(text, from, to, config_.skip_errors(), errors);
}

absl::StatusOr<std::string> Romanizer::CherryPick(
    absl::string_view text, Method from, Method to,
    std::vector<std::string> *errors) {
  return ConvertInternal(text, from, to, true, errors);
}

absl::StatusOr<std::string> Romanizer::ConvertInternal(
    absl::string_view text, Method from, Method to, bool selective,
    std::vector<std::string> *errors) {
  errors = ErrorSink(errors);
  absl::StatusOr<std::vector<Chunk>> chunks =
      Split(text, from, selective, errors);
  if (!chunks.ok()) {
    return chunks.status();
  }
  converter::WordReconstructor reconstructor(
      GetConverter(from, to), GetStrategy(to), &data_manager_->stopwords());
  std::vector<std::string> pieces;
  pieces.reserve(chunks->size());
  for (const Chunk &chunk : *chunks) {
    if (chunk.is_literal()) {
      pieces.push_back(chunk.literal());
    } else {
      pieces.push_back(reconstructor.Reconstruct(chunk.word(), selective,
                                                 errors));
    }
  }
  // Selective conversion keeps the literals, so the pieces cover the input.
  return absl::StrJoin(pieces, selective ? "" : " ");
}

absl::StatusOr<std::vector<int>> Romanizer::CountSyllables(
    absl::string_view text, Method method, std::vector<std::string> *errors) {
  absl::StatusOr<std::vector<Chunk>> chunks =
      Split(text, method, false, ErrorSink(errors));
  if (!chunks.ok()) {
    return chunks.status();
  }
  std::vector<int> counts;
  for (const Chunk &chunk : *chunks) {
    const segmenter::Word &word = chunk.word();
    bool valid = true;
    for (const Syllable &syllable : word) {
      valid = valid && syllable.valid();
    }
    counts.push_back(valid ? static_cast<int>(word.size()) : 0);
  }
  return counts;
}

bool Romanizer::IsValidFor(absl::string_view text, Method method) {
  segmenter::TextChunker chunker(GetParser(method));
  size_t num_syllables = 0;
  for (const Chunk &chunk : chunker.Split(text, false)) {
    for (const Syllable &syllable : chunk.word()) {
      if (!syllable.valid()) {
        return false;
      }
      ++num_syllables;
    }
  }
  return num_syllables > 0;
}

absl::StatusOr<std::vector<Method>> Romanizer::DetectMethod(
    absl::string_view text) {
  if (!Util::IsValidUtf8(text)) {
    return absl::InvalidArgumentError("Input is not valid UTF-8");
  }
  std::vector<Method> methods;
  for (const Method method : AllMethods()) {
    if (IsValidFor(text, method)) {
      methods.push_back(method);
    }
  }
  return methods;
}

absl::StatusOr<std::vector<WordMethods>> Romanizer::DetectMethodPerWord(
    absl::string_view text) {
  if (!Util::IsValidUtf8(text)) {
    return absl::InvalidArgumentError("Input is not valid UTF-8");
  }
  std::vector<WordMethods> result;
  for (const absl::string_view word : absl::StrSplit(
           text, absl::ByAnyChar(" \t\n\v\f\r"), absl::SkipEmpty())) {
    WordMethods &word_methods = result.emplace_back();
    word_methods.word = std::string(word);
    for (const Method method : AllMethods()) {
      if (IsValidFor(word, method)) {
        word_methods.methods.push_back(method);
      }
    }
  }
  return result;
}

}  // namespace romantools
