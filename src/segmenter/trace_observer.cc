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


#include "segmenter/trace_observer.h"

#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "romanization/method.h"
#include "segmenter/syllable.h"

namespace romantools {
namespace segmenter {

TraceObserver *NullTraceObserver::Get() {
  static NullTraceObserver *observer = new NullTraceObserver();
  return observer;
}

void LoggingTraceObserver::OnInitialFound(Method method,
                                          absl::string_view text,
                                          absl::string_view initial) {
  LOG(INFO) << "[" << MethodShorthand(method) << "] initial of \"" << text
            << "\": \"" << initial << "\"";
}

void LoggingTraceObserver::OnFinalFound(Method method, absl::string_view text,
                                        absl::string_view initial,
                                        absl::string_view final_part) {
  LOG(INFO) << "[" << MethodShorthand(method) << "] final of \"" << text
            << "\" after \"" << initial << "\": \"" << final_part << "\"";
}

void LoggingTraceObserver::OnSyllableValidated(Method method,
                                               const Syllable &syllable) {
  LOG(INFO) << "[" << MethodShorthand(method) << "] syllable \""
            << syllable.full_syllable() << "\" is "
            << (syllable.valid() ? "valid" : "invalid") << ", remainder \""
            << syllable.remainder() << "\"";
}

void LoggingTraceObserver::OnWordAssembled(Method method,
                                           absl::Span<const Syllable> word) {
  std::vector<absl::string_view> syllables;
  for (const Syllable &syllable : word) {
    syllables.push_back(syllable.full_syllable());
  }
  LOG(INFO) << "[" << MethodShorthand(method) << "] word ["
            << absl::StrJoin(syllables, ", ") << "]";
}

void LoggingTraceObserver::OnSyllableConverted(Method from, Method to,
                                               absl::string_view source,
                                               absl::string_view result,
                                               bool cache_hit) {
  LOG(INFO) << "[" << MethodShorthand(from) << "->" << MethodShorthand(to)
            << "] \"" << source << "\" -> \"" << result << "\""
            << (cache_hit ? " (cached)" : "");
}

}  // namespace segmenter
}  // namespace romantools
