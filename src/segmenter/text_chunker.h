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


#ifndef ROMANTOOLS_SEGMENTER_TEXT_CHUNKER_H_
#define ROMANTOOLS_SEGMENTER_TEXT_CHUNKER_H_

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/string_view.h"
#include "segmenter/syllable.h"
#include "segmenter/syllable_parser.h"

namespace romantools {
namespace segmenter {

// Either the syllables of one letter run or a literal span of other text
// (spaces, punctuation, digits, non-Latin script).
class Chunk {
 public:
  explicit Chunk(Word word) : value_(std::move(word)) {}
  explicit Chunk(std::string literal) : value_(std::move(literal)) {}

  bool is_word() const { return std::holds_alternative<Word>(value_); }
  bool is_literal() const {
    return std::holds_alternative<std::string>(value_);
  }

  // Must be called only when is_word() is true.
  const Word &word() const { return std::get<Word>(value_); }
  // Must be called only when is_literal() is true.
  const std::string &literal() const { return std::get<std::string>(value_); }

  // The input this chunk was built from.
  std::string RawText() const;

 private:
  std::variant<Word, std::string> value_;
};

// Splits text into chunks for the method of `parser`.
//
// The coarse pass separates letter runs, which may contain apostrophes or
// dashes between letters, from everything else. The fine pass cuts every run
// before the joiners that the method treats as syllable separators, and each
// piece is parsed to completion. All syllables of a run form one Word.
class TextChunker {
 public:
  // `parser` must outlive the chunker.
  explicit TextChunker(SyllableParser *parser) : parser_(parser) {}

  TextChunker(const TextChunker &) = delete;
  TextChunker &operator=(const TextChunker &) = delete;

  // `text` must be valid UTF-8. Literal chunks are dropped unless
  // `keep_literals` is true.
  std::vector<Chunk> Split(absl::string_view text, bool keep_literals) const;

 private:
  Word ParseRun(std::u32string_view run) const;

  SyllableParser *parser_;
};

}  // namespace segmenter
}  // namespace romantools

#endif  // ROMANTOOLS_SEGMENTER_TEXT_CHUNKER_H_
