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

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/util.h"
#include "romanization/char_class.h"
#include "segmenter/syllable.h"
#include "segmenter/trace_observer.h"

namespace romantools {
namespace segmenter {
namespace {

using ::romantools::romanization::ComposeDiacritics;
using ::romantools::romanization::FoldChar;
using ::romantools::romanization::IsJoiner;
using ::romantools::romanization::IsRomanLetter;

// Returns the end of the letter run starting at `begin`. A joiner belongs to
// the run only when a letter follows it.
size_t FindRunEnd(std::u32string_view text, size_t begin) {
  size_t pos = begin;
  while (pos < text.size()) {
    if (IsRomanLetter(text[pos])) {
      ++pos;
    } else if (IsJoiner(text[pos]) && pos + 1 < text.size() &&
               IsRomanLetter(text[pos + 1])) {
      pos += 2;
    } else {
      break;
    }
  }
  return pos;
}

}  // namespace

std::string Chunk::RawText() const {
  if (is_literal()) {
    return literal();
  }
  std::string raw;
  for (const Syllable &syllable : word()) {
    absl::StrAppend(&raw, syllable.leading_symbol(), syllable.raw_text());
  }
  return raw;
}

std::vector<Chunk> TextChunker::Split(absl::string_view text,
                                      bool keep_literals) const {
  const std::u32string composed = ComposeDiacritics(Util::Utf8ToUtf32(text));
  const std::u32string_view input(composed);
  std::vector<Chunk> chunks;

  size_t pos = 0;
  while (pos < input.size()) {
    if (IsRomanLetter(input[pos])) {
      const size_t end = FindRunEnd(input, pos);
      chunks.emplace_back(ParseRun(input.substr(pos, end - pos)));
      pos = end;
      continue;
    }
    size_t end = pos;
    while (end < input.size() && !IsRomanLetter(input[end])) {
      ++end;
    }
    if (keep_literals) {
      chunks.emplace_back(Util::Utf32ToUtf8(input.substr(pos, end - pos)));
    }
    pos = end;
  }
  return chunks;
}

Word TextChunker::ParseRun(std::u32string_view run) const {
  const romanization::RomanizationStrategy &strategy = parser_->strategy();
  Word word;
  size_t piece_begin = 0;
  for (size_t i = 1; i <= run.size(); ++i) {
    if (i < run.size() &&
        !(IsJoiner(run[i]) && strategy.SplitsWordAt(FoldChar(run[i])))) {
      continue;
    }
    // The separator stays at the front of the next piece.
    for (Syllable &syllable :
         parser_->ParseAll(run.substr(piece_begin, i - piece_begin))) {
      word.push_back(std::move(syllable));
    }
    piece_begin = i;
  }
  parser_->observer()->OnWordAssembled(parser_->method(), word);
  return word;
}

}  // namespace segmenter
}  // namespace romantools
