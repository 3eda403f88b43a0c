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


// Handler of romantools configuration.

#ifndef ROMANTOOLS_CONFIG_CONFIG_HANDLER_H_
#define ROMANTOOLS_CONFIG_CONFIG_HANDLER_H_

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "protocol/config.pb.h"

namespace romantools {
namespace config {

// This is pure static class.  All public static methods are thread-safe.
class ConfigHandler {
 public:
  ConfigHandler() = delete;
  ConfigHandler(const ConfigHandler &) = delete;
  ConfigHandler &operator=(const ConfigHandler &) = delete;

  // Returns a copy of the current config.
  static Config GetCopiedConfig();

  // Returns current const Config as a shared_ptr. The returned config stays
  // valid even if another thread replaces the current config.
  static std::shared_ptr<const Config> GetSharedConfig();

  // Sets config. The config is normalized before it is stored.
  static void SetConfig(const Config &config);

  // Gets default config value.
  static void GetDefaultConfig(Config *config);
  static const Config &DefaultConfig();

  // Loads a text-format config file and makes it current. On error the
  // current config is left unchanged.
  static absl::Status LoadFromFile(const std::string &filename);

  // Reloads the file given to the last successful LoadFromFile(). Falls back
  // to the default config if the file became unreadable.
  static void Reload();

  // Parses a text-format config into `config`.
  static absl::Status ParseTextConfig(absl::string_view text, Config *config);

  // Clamps out-of-range values and mirrors the verbose level to vlog.
  static void NormalizeConfig(Config *config);

  // Get config file name.
  static std::string GetConfigFileNameForTesting();
};

}  // namespace config
}  // namespace romantools

#endif  // ROMANTOOLS_CONFIG_CONFIG_HANDLER_H_
