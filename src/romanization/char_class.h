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


// Character classes shared by the romanization strategies, the syllable
// parser and the text chunker. Classification works on UTF-32 code points.

#ifndef ROMANTOOLS_ROMANIZATION_CHAR_CLASS_H_
#define ROMANTOOLS_ROMANIZATION_CHAR_CLASS_H_

#include <string>
#include <string_view>

#include "absl/strings/string_view.h"

namespace romantools {
namespace romanization {

// Canonical forms that every apostrophe and dash variant folds to.
inline constexpr char32_t kApostrophe = U'\'';
inline constexpr char32_t kDash = U'-';

// Vowels of both systems, in folded (lower) case: a e i o u ü v ê ŭ.
bool IsVowel(char32_t c);

// ' ’ ‘ ʼ ʻ `
bool IsApostrophe(char32_t c);

// - – —
bool IsDash(char32_t c);

// Apostrophe or dash.
inline bool IsJoiner(char32_t c) { return IsApostrophe(c) || IsDash(c); }

// ASCII letters and ü Ü ê Ê ŭ Ŭ.
bool IsRomanLetter(char32_t c);

// Lower-cases letters and maps joiner variants to kApostrophe / kDash.
// Never changes the length of the text.
char32_t FoldChar(char32_t c);
std::u32string FoldText(std::u32string_view text);

// Composes u/e + combining diacritics into ü, ê and ŭ so that decomposed
// input is classified as letters.
std::u32string ComposeDiacritics(std::u32string_view text);

// Trailing clitics (e.g. the "s" of "Mao's") which are exempt from syllable
// validation when they follow an apostrophe.
bool IsContraction(absl::string_view folded_syllable);

}  // namespace romanization
}  // namespace romantools

#endif  // ROMANTOOLS_ROMANIZATION_CHAR_CLASS_H_
