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


#include "base/init_romantools.h"

#include <ios>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/log/log_entry.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "base/file_stream.h"
#include "base/file_util.h"

ABSL_FLAG(std::string, log_dir, "",
          "Directory for <program>.log. Log messages only go to stderr when "
          "empty.");

namespace romantools {
namespace {

// Appends every log entry to one file.
class FileLogSink : public absl::LogSink {
 public:
  explicit FileLogSink(const std::string &path)
      : stream_(path, std::ios_base::out | std::ios_base::app) {}

  void Send(const absl::LogEntry &entry) override {
    absl::MutexLock lock(&mutex_);
    stream_ << entry.text_message_with_prefix_and_newline();
  }

  void Flush() override {
    absl::MutexLock lock(&mutex_);
    stream_.flush();
  }

 private:
  absl::Mutex mutex_;
  OutputFileStream stream_ ABSL_GUARDED_BY(mutex_);
};

void AddLogFile(const std::string &program_name) {
  const std::string log_dir = absl::GetFlag(FLAGS_log_dir);
  if (log_dir.empty()) {
    return;
  }
  if (absl::Status s = FileUtil::CreateDirectory(log_dir); !s.ok()) {
    LOG(ERROR) << "Cannot create " << log_dir << ": " << s;
    return;
  }
  const std::string path = FileUtil::JoinPath(
      log_dir, absl::StrCat(FileUtil::Basename(program_name), ".log"));
  // Sinks must outlive every logging call, so this one is never deleted.
  absl::AddLogSink(new FileLogSink(path));
}

}  // namespace

std::vector<std::string> InitRomantools(int argc, char **argv) {
  const std::vector<char *> positional = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  AddLogFile(argc > 0 ? argv[0] : "romantools");
  return std::vector<std::string>(positional.begin(), positional.end());
}

}  // namespace romantools
