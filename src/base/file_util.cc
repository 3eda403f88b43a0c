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


#include "base/file_util.h"

#include <sys/stat.h>

#include <cerrno>
#include <ios>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "base/file_stream.h"

namespace romantools {
namespace {

constexpr char kPathSeparator = '/';

absl::Status LastErrno(absl::string_view what, absl::string_view path) {
  const int err = errno;
  return absl::ErrnoToStatus(err, absl::StrCat(what, " ", path));
}

absl::StatusOr<mode_t> FileMode(const std::string &path) {
  struct stat info;
  if (::stat(path.c_str(), &info) != 0) {
    return LastErrno("Cannot stat", path);
  }
  return info.st_mode;
}

}  // namespace

absl::Status FileUtil::CreateDirectory(const std::string &path) {
  if (DirectoryExists(path).ok()) {
    return absl::OkStatus();
  }
  if (::mkdir(path.c_str(), 0700) != 0) {
    return LastErrno("Cannot create directory", path);
  }
  return absl::OkStatus();
}

absl::Status FileUtil::FileExists(const std::string &filename) {
  return FileMode(filename).status();
}

absl::Status FileUtil::DirectoryExists(const std::string &dirname) {
  absl::StatusOr<mode_t> mode = FileMode(dirname);
  if (!mode.ok()) {
    return mode.status();
  }
  if (!S_ISDIR(*mode)) {
    return absl::NotFoundError(absl::StrCat(dirname, " is not a directory"));
  }
  return absl::OkStatus();
}

std::string FileUtil::JoinPath(
    absl::Span<const absl::string_view> components) {
  std::string path;
  for (absl::string_view component : components) {
    if (component.empty()) {
      continue;
    }
    if (!path.empty() && path.back() != kPathSeparator) {
      path.push_back(kPathSeparator);
    }
    path.append(component.data(), component.size());
  }
  return path;
}

std::string FileUtil::Basename(const std::string &filename) {
  const size_t pos = filename.rfind(kPathSeparator);
  return pos == std::string::npos ? filename : filename.substr(pos + 1);
}

absl::StatusOr<std::string> FileUtil::GetContents(
    const std::string &filename, std::ios_base::openmode mode) {
  InputFileStream ifs(filename, mode);
  if (!ifs) {
    return LastErrno("Cannot open", filename);
  }
  std::ostringstream contents;
  contents << ifs.rdbuf();
  if (ifs.bad()) {
    return LastErrno("Cannot read", filename);
  }
  return contents.str();
}

absl::Status FileUtil::SetContents(const std::string &filename,
                                   absl::string_view content,
                                   std::ios_base::openmode mode) {
  OutputFileStream ofs(filename, mode);
  if (!ofs) {
    return LastErrno("Cannot open", filename);
  }
  ofs.write(content.data(), content.size());
  ofs.close();
  if (ofs.fail()) {
    return LastErrno("Cannot write", filename);
  }
  return absl::OkStatus();
}

}  // namespace romantools
