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


#ifndef ROMANTOOLS_SEGMENTER_SYLLABLE_H_
#define ROMANTOOLS_SEGMENTER_SYLLABLE_H_

#include <string>
#include <vector>

namespace romantools {
namespace segmenter {

class SyllableParser;

// One syllable parsed from a raw segment of a word. Immutable once the
// parser has built it.
class Syllable {
 public:
  Syllable() = default;

  // Case-folded text the syllable was parsed from, without the leading
  // symbol.
  const std::string &source_text() const { return source_text_; }
  // Consumed input in its original spelling and case, without the leading
  // symbol.
  const std::string &raw_text() const { return raw_text_; }
  // Empty for vowel-initial syllables.
  const std::string &initial() const { return initial_; }
  const std::string &final_part() const { return final_; }
  // initial() + final_part(), case-folded.
  const std::string &full_syllable() const { return full_syllable_; }
  // Case-folded part of source_text() left for the next syllable.
  const std::string &remainder() const { return remainder_; }

  bool valid() const { return valid_; }

  // Original apostrophe or dash stripped from the front of the segment.
  const std::string &leading_symbol() const { return leading_symbol_; }
  bool has_leading_apostrophe() const { return has_leading_apostrophe_; }
  bool has_leading_dash() const { return has_leading_dash_; }
  bool has_leading_symbol() const {
    return has_leading_apostrophe_ || has_leading_dash_;
  }

  bool is_all_uppercase() const { return is_all_uppercase_; }
  bool is_title_case() const { return is_title_case_; }

  // Why the syllable is invalid. Empty for valid syllables.
  const std::vector<std::string> &diagnostics() const { return diagnostics_; }

 private:
  friend class SyllableParser;

  std::string source_text_;
  std::string raw_text_;
  std::string initial_;
  std::string final_;
  std::string full_syllable_;
  std::string remainder_;
  std::string leading_symbol_;
  std::vector<std::string> diagnostics_;
  bool valid_ = false;
  bool has_leading_apostrophe_ = false;
  bool has_leading_dash_ = false;
  bool is_all_uppercase_ = false;
  bool is_title_case_ = false;
};

// Syllables of one letter run, in input order.
using Word = std::vector<Syllable>;

}  // namespace segmenter
}  // namespace romantools

#endif  // ROMANTOOLS_SEGMENTER_SYLLABLE_H_
