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


#ifndef ROMANTOOLS_BASE_UTIL_H_
#define ROMANTOOLS_BASE_UTIL_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/string_view.h"

namespace romantools {

class Util {
 public:
  Util() = delete;
  ~Util() = delete;

  // Splits a line of comma separated values. Double-quoted fields may
  // contain commas and escaped ("") quotes.
  static void SplitCSV(absl::string_view input,
                       std::vector<std::string> *output);

  // Case mapping for ASCII and the accented Latin letters used by the
  // romanization systems (ü, ê, ŭ). Other characters are kept as is.
  static char32_t ToLower(char32_t c);
  static char32_t ToUpper(char32_t c);
  static bool IsUpper(char32_t c) { return ToLower(c) != c; }
  static bool IsLower(char32_t c) { return ToUpper(c) != c; }

  static void LowerString(std::string *str);
  static void UpperString(std::string *str);

  // Transforms only the first character to the upper case. ex. "ch'ang" =>
  // "Ch'ang", "aBc" => "ABc".
  static void CapitalizeFirstChar(std::string *str);

  // Returns the lengths of [src, src+size] encoded in UTF8.
  static size_t CharsLen(absl::string_view str);

  // Converts a UTF-8 string to UTF-32.
  static std::u32string Utf8ToUtf32(absl::string_view str);
  // Converts a UTF-32 string to UTF-8.
  static std::string Utf32ToUtf8(std::u32string_view str);

  // Converts a UCS4 code point to UTF8 string.
  static std::string CodepointToUtf8(char32_t c);

  // Converts a UCS4 code point to UTF8 string and appends it to |output|, i.e.,
  // |output| is not cleared.
  static void CodepointToUtf8Append(char32_t c, std::string *output);

  // Returns true if |s| is split into |first_char32| + |rest|.
  // You can pass nullptr to |first_char32| and/or |rest| to ignore the matched
  // value.
  // Returns false if an invalid UTF-8 sequence is prefixed.
  static bool SplitFirstChar32(absl::string_view s, char32_t *first_char32,
                               absl::string_view *rest);

  // Returns true if |s| is a valid UTF8.
  static bool IsValidUtf8(absl::string_view s);

  // Strip a heading UTF-8 BOM (binary order mark) sequence (= \xef\xbb\xbf).
  static absl::string_view StripUtf8Bom(absl::string_view line);

  // Chop the return characters (i.e. '\n' and '\r') at the end of the
  // given line.
  static bool ChopReturns(std::string *line);
};

}  // namespace romantools

#endif  // ROMANTOOLS_BASE_UTIL_H_
