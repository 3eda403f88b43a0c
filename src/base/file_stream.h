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


#ifndef ROMANTOOLS_BASE_FILE_STREAM_H_
#define ROMANTOOLS_BASE_FILE_STREAM_H_

#include <fstream>
#include <ios>
#include <string>

namespace romantools {

// Thin wrappers of std::ifstream / std::ofstream. File names are UTF-8 on
// every supported platform.
class InputFileStream : public std::ifstream {
 public:
  InputFileStream() = default;
  explicit InputFileStream(const std::string &filename,
                           std::ios_base::openmode mode = std::ios_base::in);

  void open(const std::string &filename,
            std::ios_base::openmode mode = std::ios_base::in);

 private:
  virtual void UnusedKeyMethod();
};

class OutputFileStream : public std::ofstream {
 public:
  OutputFileStream() = default;
  explicit OutputFileStream(const std::string &filename,
                            std::ios_base::openmode mode = std::ios_base::out);

  void open(const std::string &filename,
            std::ios_base::openmode mode = std::ios_base::out);

 private:
  virtual void UnusedKeyMethod();
};

}  // namespace romantools

#endif  // ROMANTOOLS_BASE_FILE_STREAM_H_
