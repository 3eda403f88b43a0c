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


#include "base/util.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace romantools {
namespace {

bool IsUtf8TrailingByte(uint8_t c) { return (c & 0xc0) == 0x80; }

// Upper/lower pairs outside of ASCII which appear in the romanization tables.
struct CasePair {
  char32_t upper;
  char32_t lower;
};

constexpr CasePair kLatinCasePairs[] = {
    {0x00CA, 0x00EA},  // Ê ê
    {0x00DC, 0x00FC},  // Ü ü
    {0x016C, 0x016D},  // Ŭ ŭ
};

}  // namespace

void Util::SplitCSV(absl::string_view input, std::vector<std::string> *output) {
  output->clear();
  std::string field;
  bool in_quote = false;
  for (size_t i = 0; i < input.size(); ++i) {
    const char c = input[i];
    if (in_quote) {
      if (c == '"') {
        if (i + 1 < input.size() && input[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quote = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }
    if (c == '"') {
      in_quote = true;
    } else if (c == ',') {
      output->push_back(std::move(field));
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  output->push_back(std::move(field));
}

char32_t Util::ToLower(char32_t c) {
  if ('A' <= c && c <= 'Z') {
    return c + ('a' - 'A');
  }
  for (const CasePair &pair : kLatinCasePairs) {
    if (c == pair.upper) {
      return pair.lower;
    }
  }
  return c;
}

char32_t Util::ToUpper(char32_t c) {
  if ('a' <= c && c <= 'z') {
    return c - ('a' - 'A');
  }
  for (const CasePair &pair : kLatinCasePairs) {
    if (c == pair.lower) {
      return pair.upper;
    }
  }
  return c;
}

void Util::LowerString(std::string *str) {
  std::u32string codepoints = Utf8ToUtf32(*str);
  std::transform(codepoints.begin(), codepoints.end(), codepoints.begin(),
                 &Util::ToLower);
  *str = Utf32ToUtf8(codepoints);
}

void Util::UpperString(std::string *str) {
  std::u32string codepoints = Utf8ToUtf32(*str);
  std::transform(codepoints.begin(), codepoints.end(), codepoints.begin(),
                 &Util::ToUpper);
  *str = Utf32ToUtf8(codepoints);
}

void Util::CapitalizeFirstChar(std::string *str) {
  char32_t first = 0;
  absl::string_view rest;
  if (!SplitFirstChar32(*str, &first, &rest)) {
    return;
  }
  std::string result = CodepointToUtf8(ToUpper(first));
  absl::StrAppend(&result, rest);
  *str = std::move(result);
}

size_t Util::CharsLen(absl::string_view str) {
  size_t length = 0;
  while (!str.empty()) {
    if (!SplitFirstChar32(str, nullptr, &str)) {
      // Counts the broken byte as one character and moves on.
      str.remove_prefix(1);
    }
    ++length;
  }
  return length;
}

std::u32string Util::Utf8ToUtf32(absl::string_view str) {
  std::u32string codepoints;
  char32_t codepoint;
  while (Util::SplitFirstChar32(str, &codepoint, &str)) {
    codepoints.push_back(codepoint);
  }
  return codepoints;
}

std::string Util::Utf32ToUtf8(const std::u32string_view str) {
  std::string output;
  for (const char32_t codepoint : str) {
    CodepointToUtf8Append(codepoint, &output);
  }
  return output;
}

std::string Util::CodepointToUtf8(char32_t c) {
  std::string output;
  CodepointToUtf8Append(c, &output);
  return output;
}

void Util::CodepointToUtf8Append(char32_t c, std::string *output) {
  if (c < 0x80) {
    output->push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    output->push_back(static_cast<char>(0xC0 | (c >> 6)));
    output->push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    output->push_back(static_cast<char>(0xE0 | (c >> 12)));
    output->push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    output->push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    output->push_back(static_cast<char>(0xF0 | ((c >> 18) & 0x07)));
    output->push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    output->push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    output->push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

bool Util::SplitFirstChar32(absl::string_view s, char32_t *first_char32,
                            absl::string_view *rest) {
  char32_t dummy_char32 = 0;
  if (first_char32 == nullptr) {
    first_char32 = &dummy_char32;
  }
  absl::string_view dummy_rest;
  if (rest == nullptr) {
    rest = &dummy_rest;
  }

  *first_char32 = 0;
  *rest = absl::string_view();

  if (s.empty()) {
    return false;
  }

  const uint8_t leading_byte = static_cast<uint8_t>(s[0]);
  if (leading_byte < 0x80) {
    *first_char32 = leading_byte;
    *rest = absl::ClippedSubstr(s, 1);
    return true;
  }

  size_t len = 0;
  char32_t result = 0;
  char32_t min_value = 0;
  if ((leading_byte & 0xe0) == 0xc0) {
    len = 2;
    min_value = 0x0080;
    result = (leading_byte & 0x1f);
  } else if ((leading_byte & 0xf0) == 0xe0) {
    len = 3;
    min_value = 0x0800;
    result = (leading_byte & 0x0f);
  } else if ((leading_byte & 0xf8) == 0xf0) {
    len = 4;
    min_value = 0x010000;
    result = (leading_byte & 0x07);
  } else {
    // Trailing byte at the head, or a sequence longer than UCS4.
    return false;
  }

  if (s.size() < len) {
    return false;
  }
  for (size_t i = 1; i < len; ++i) {
    const uint8_t c = static_cast<uint8_t>(s[i]);
    if (!IsUtf8TrailingByte(c)) {
      return false;
    }
    result = (result << 6) | (c & 0x3f);
  }
  if (result < min_value || result > 0x10FFFF) {
    // redundant UTF-8 sequence found.
    return false;
  }
  *first_char32 = result;
  *rest = absl::ClippedSubstr(s, len);
  return true;
}

bool Util::IsValidUtf8(absl::string_view s) {
  while (!s.empty()) {
    if (!SplitFirstChar32(s, nullptr, &s)) {
      return false;
    }
  }
  return true;
}

absl::string_view Util::StripUtf8Bom(absl::string_view line) {
  static constexpr char kUtf8Bom[] = "\xef\xbb\xbf";
  return absl::StripPrefix(line, kUtf8Bom);
}

bool Util::ChopReturns(std::string *line) {
  const std::string::size_type line_end = line->find_last_not_of("\r\n");
  if (line_end + 1 != line->size()) {
    line->erase(line_end + 1);
    return true;
  }
  return false;
}

}  // namespace romantools
