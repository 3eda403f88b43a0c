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


// Command-line front end of the romanization engine.
//
// Usage:
//   romantools segment "Zhongguo ti'an tianqi" --method=py
//   romantools convert "Mao Tse-tung" --from=wg --to=py
//   romantools detect_method "Hsinhua" --per_word

#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "base/init_romantools.h"
#include "config/config_handler.h"
#include "engine/romanizer.h"
#include "protocol/config.pb.h"
#include "romanization/method.h"

ABSL_FLAG(std::string, method, "py", "romanization method of the input");
ABSL_FLAG(std::string, from, "py", "source method of convert/cherry_pick");
ABSL_FLAG(std::string, to, "wg", "target method of convert/cherry_pick");
ABSL_FLAG(bool, per_word, false,
          "validator/detect_method: report each word separately");
ABSL_FLAG(bool, skip_errors, false, "pass invalid text through unchanged");
ABSL_FLAG(bool, report_errors, false, "print diagnostics after the result");
ABSL_FLAG(bool, trace, false, "log every parsing and conversion step");
ABSL_FLAG(std::string, data_dir, "", "directory of the romanization data");
ABSL_FLAG(std::string, config, "", "text-format config file");
ABSL_FLAG(bool, list_methods, false, "print the supported methods and exit");

// Set by the build files to the shipped data directory.
#ifndef ROMANTOOLS_DATA_DIR
#define ROMANTOOLS_DATA_DIR "data/romanization"
#endif  // ROMANTOOLS_DATA_DIR

namespace romantools {
namespace {

std::string Quote(absl::string_view str) {
  return absl::StrCat(
      "'", absl::StrReplaceAll(str, {{"\\", "\\\\"}, {"'", "\\'"}}), "'");
}

std::string Bool(bool value) { return value ? "True" : "False"; }

std::string QuoteList(const std::vector<std::string> &list) {
  return absl::StrCat("[",
                      absl::StrJoin(list, ", ",
                                    [](std::string *out, const std::string &s) {
                                      out->append(Quote(s));
                                    }),
                      "]");
}

std::string MethodList(const std::vector<Method> &methods) {
  std::vector<std::string> names;
  for (const Method method : methods) {
    names.emplace_back(MethodShorthand(method));
  }
  return QuoteList(names);
}

std::string FormatSegments(const std::vector<SegmentChunk> &chunks) {
  std::vector<std::string> items;
  for (const SegmentChunk &chunk : chunks) {
    if (const auto *syllables = std::get_if<std::vector<std::string>>(&chunk)) {
      items.push_back(QuoteList(*syllables));
    } else {
      items.push_back(Quote(std::get<std::string>(chunk)));
    }
  }
  return absl::StrCat("[", absl::StrJoin(items, ", "), "]");
}

std::string FormatWordValidations(const std::vector<WordValidation> &words) {
  std::vector<std::string> items;
  for (const WordValidation &word : words) {
    std::vector<std::string> valid;
    for (const bool v : word.valid) {
      valid.push_back(Bool(v));
    }
    items.push_back(absl::StrCat("{'word': ", Quote(word.word),
                                 ", 'syllables': ", QuoteList(word.syllables),
                                 ", 'valid': [", absl::StrJoin(valid, ", "),
                                 "]}"));
  }
  return absl::StrCat("[", absl::StrJoin(items, ", "), "]");
}

std::string FormatWordMethods(const std::vector<WordMethods> &words) {
  std::vector<std::string> items;
  for (const WordMethods &word : words) {
    items.push_back(absl::StrCat("{'word': ", Quote(word.word),
                                 ", 'methods': ", MethodList(word.methods),
                                 "}"));
  }
  return absl::StrCat("[", absl::StrJoin(items, ", "), "]");
}

absl::StatusOr<Method> GetMethodFlag(const absl::Flag<std::string> &flag) {
  return ParseMethod(absl::GetFlag(flag));
}

absl::StatusOr<config::Config> BuildConfig() {
  if (!absl::GetFlag(FLAGS_config).empty()) {
    if (absl::Status s =
            config::ConfigHandler::LoadFromFile(absl::GetFlag(FLAGS_config));
        !s.ok()) {
      return s;
    }
  }
  config::Config config = config::ConfigHandler::GetCopiedConfig();
  if (absl::GetFlag(FLAGS_skip_errors)) {
    config.set_skip_errors(true);
  }
  if (absl::GetFlag(FLAGS_report_errors)) {
    config.set_report_errors(true);
  }
  if (absl::GetFlag(FLAGS_trace)) {
    config.set_trace(true);
  }
  if (!absl::GetFlag(FLAGS_data_dir).empty()) {
    config.set_data_dir(absl::GetFlag(FLAGS_data_dir));
  }
  return config;
}

// Runs `action` on `text` and returns the formatted result.
absl::StatusOr<std::string> Run(Romanizer *romanizer, absl::string_view action,
                                absl::string_view text,
                                std::vector<std::string> *errors) {
  const bool per_word = absl::GetFlag(FLAGS_per_word);
  if (action == "convert" || action == "cherry_pick" ||
      action == "cherry-pick") {
    absl::StatusOr<Method> from = GetMethodFlag(FLAGS_from);
    if (!from.ok()) {
      return from.status();
    }
    absl::StatusOr<Method> to = GetMethodFlag(FLAGS_to);
    if (!to.ok()) {
      return to.status();
    }
    if (action == "convert") {
      return romanizer->Convert(text, *from, *to, errors);
    }
    return romanizer->CherryPick(text, *from, *to, errors);
  }
  if (action == "detect_method" || action == "detect-method") {
    if (per_word) {
      absl::StatusOr<std::vector<WordMethods>> words =
          romanizer->DetectMethodPerWord(text);
      if (!words.ok()) {
        return words.status();
      }
      return FormatWordMethods(*words);
    }
    absl::StatusOr<std::vector<Method>> methods =
        romanizer->DetectMethod(text);
    if (!methods.ok()) {
      return methods.status();
    }
    return MethodList(*methods);
  }

  absl::StatusOr<Method> method = GetMethodFlag(FLAGS_method);
  if (!method.ok()) {
    return method.status();
  }
  if (action == "segment") {
    absl::StatusOr<std::vector<SegmentChunk>> chunks =
        romanizer->Segment(text, *method, errors);
    if (!chunks.ok()) {
      return chunks.status();
    }
    return FormatSegments(*chunks);
  }
  if (action == "validator") {
    if (per_word) {
      absl::StatusOr<std::vector<WordValidation>> words =
          romanizer->ValidatePerWord(text, *method, errors);
      if (!words.ok()) {
        return words.status();
      }
      return FormatWordValidations(*words);
    }
    absl::StatusOr<bool> valid = romanizer->Validate(text, *method, errors);
    if (!valid.ok()) {
      return valid.status();
    }
    return Bool(*valid);
  }
  if (action == "syllable_count" || action == "syllable-count") {
    absl::StatusOr<std::vector<int>> counts =
        romanizer->CountSyllables(text, *method, errors);
    if (!counts.ok()) {
      return counts.status();
    }
    return absl::StrCat("[", absl::StrJoin(*counts, ", "), "]");
  }
  return absl::InvalidArgumentError(absl::StrCat("Unknown action: ", action));
}

}  // namespace
}  // namespace romantools

int main(int argc, char **argv) {
  const std::vector<std::string> args = romantools::InitRomantools(argc, argv);

  if (absl::GetFlag(FLAGS_list_methods)) {
    for (const romantools::Method method : romantools::AllMethods()) {
      std::cout << romantools::MethodShorthand(method) << "\t"
                << romantools::MethodPrettyName(method) << std::endl;
    }
    return 0;
  }
  if (args.size() != 3) {
    std::cerr << "Usage: " << args[0] << " <action> <text> [flags]"
              << std::endl;
    return 2;
  }

  absl::StatusOr<romantools::config::Config> config =
      romantools::BuildConfig();
  if (!config.ok()) {
    LOG(ERROR) << "Failed to load the config: " << config.status();
    return 1;
  }
  absl::StatusOr<std::unique_ptr<romantools::Romanizer>> romanizer =
      romantools::Romanizer::Create(*config, ROMANTOOLS_DATA_DIR);
  if (!romanizer.ok()) {
    LOG(ERROR) << "Failed to load the romanization data: "
               << romanizer.status();
    return 1;
  }

  std::vector<std::string> errors;
  absl::StatusOr<std::string> result =
      romantools::Run(romanizer->get(), args[1], args[2], &errors);
  if (!result.ok()) {
    LOG(ERROR) << result.status();
    return 1;
  }
  std::cout << *result << std::endl;
  for (const std::string &error : errors) {
    std::cout << error << std::endl;
  }
  return 0;
}
