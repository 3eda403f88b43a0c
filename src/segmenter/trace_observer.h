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


#ifndef ROMANTOOLS_SEGMENTER_TRACE_OBSERVER_H_
#define ROMANTOOLS_SEGMENTER_TRACE_OBSERVER_H_

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "romanization/method.h"
#include "segmenter/syllable.h"

namespace romantools {
namespace segmenter {

// Receives the intermediate steps of parsing and conversion. Observers are
// called synchronously from the thread running the action and must be
// thread-safe when an engine is shared.
class TraceObserver {
 public:
  virtual ~TraceObserver() = default;

  virtual void OnInitialFound(Method method, absl::string_view text,
                              absl::string_view initial) = 0;
  virtual void OnFinalFound(Method method, absl::string_view text,
                            absl::string_view initial,
                            absl::string_view final_part) = 0;
  virtual void OnSyllableValidated(Method method,
                                   const Syllable &syllable) = 0;
  virtual void OnWordAssembled(Method method,
                               absl::Span<const Syllable> word) = 0;
  virtual void OnSyllableConverted(Method from, Method to,
                                   absl::string_view source,
                                   absl::string_view result,
                                   bool cache_hit) = 0;
};

// Ignores every event.
class NullTraceObserver : public TraceObserver {
 public:
  void OnInitialFound(Method method, absl::string_view text,
                      absl::string_view initial) override {}
  void OnFinalFound(Method method, absl::string_view text,
                    absl::string_view initial,
                    absl::string_view final_part) override {}
  void OnSyllableValidated(Method method, const Syllable &syllable) override {}
  void OnWordAssembled(Method method,
                       absl::Span<const Syllable> word) override {}
  void OnSyllableConverted(Method from, Method to, absl::string_view source,
                           absl::string_view result, bool cache_hit) override {
  }

  // Shared instance used when no observer is given.
  static TraceObserver *Get();
};

// Writes every event to LOG(INFO).
class LoggingTraceObserver : public TraceObserver {
 public:
  void OnInitialFound(Method method, absl::string_view text,
                      absl::string_view initial) override;
  void OnFinalFound(Method method, absl::string_view text,
                    absl::string_view initial,
                    absl::string_view final_part) override;
  void OnSyllableValidated(Method method, const Syllable &syllable) override;
  void OnWordAssembled(Method method,
                       absl::Span<const Syllable> word) override;
  void OnSyllableConverted(Method from, Method to, absl::string_view source,
                           absl::string_view result, bool cache_hit) override;
};

}  // namespace segmenter
}  // namespace romantools

#endif  // ROMANTOOLS_SEGMENTER_TRACE_OBSERVER_H_
