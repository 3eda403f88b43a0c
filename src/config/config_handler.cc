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
#include "config/config_handler.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "base/file_util.h"
#include "base/vlog.h"
#include "google/protobuf/text_format.h"
#include "protocol/config.pb.h"

namespace romantools {
namespace config {
namespace {

class ConfigHandlerImpl final {
 public:
  ConfigHandlerImpl()
      : config_(std::make_shared<Config>()),
        default_config_(std::make_shared<Config>()) {}

  std::shared_ptr<const Config> GetSharedConfig() const
      ABSL_LOCKS_EXCLUDED(mutex_);
  const Config &DefaultConfig() const { return *default_config_; }

  void SetConfig(const Config &config) ABSL_LOCKS_EXCLUDED(mutex_);
  absl::Status LoadFromFile(const std::string &filename)
      ABSL_LOCKS_EXCLUDED(mutex_);
  void Reload() ABSL_LOCKS_EXCLUDED(mutex_);

  std::string GetConfigFileName() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  void SetConfigInternal(std::shared_ptr<Config> config)
      ABSL_LOCKS_EXCLUDED(mutex_);

  std::string filename_ ABSL_GUARDED_BY(mutex_);
  std::shared_ptr<const Config> config_ ABSL_GUARDED_BY(mutex_);
  const std::shared_ptr<const Config> default_config_;
  mutable absl::Mutex mutex_;
};

ConfigHandlerImpl *GetConfigHandlerImpl() {
  static ConfigHandlerImpl *impl = new ConfigHandlerImpl();
  return impl;
}

absl::StatusOr<Config> ReadConfigFile(const std::string &filename) {
  absl::StatusOr<std::string> contents = FileUtil::GetContents(filename);
  if (!contents.ok()) {
    return contents.status();
  }
  Config config;
  if (absl::Status s = ConfigHandler::ParseTextConfig(*contents, &config);
      !s.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat(filename, " is broken: ", s.message()));
  }
  return config;
}

std::shared_ptr<const Config> ConfigHandlerImpl::GetSharedConfig() const {
  absl::ReaderMutexLock lock(&mutex_);
  return config_;
}

void ConfigHandlerImpl::SetConfigInternal(std::shared_ptr<Config> config) {
  ConfigHandler::NormalizeConfig(config.get());
  absl::MutexLock lock(&mutex_);
  config_ = std::move(config);
}

void ConfigHandlerImpl::SetConfig(const Config &config) {
  ROMANTOOLS_VLOG(1) << "Setting new config";
  SetConfigInternal(std::make_shared<Config>(config));
}

absl::Status ConfigHandlerImpl::LoadFromFile(const std::string &filename) {
  ROMANTOOLS_VLOG(1) << "Loading config file: " << filename;
  absl::StatusOr<Config> config = ReadConfigFile(filename);
  if (!config.ok()) {
    return config.status();
  }
  {
    absl::MutexLock lock(&mutex_);
    filename_ = filename;
  }
  SetConfigInternal(std::make_shared<Config>(*std::move(config)));
  return absl::OkStatus();
}

void ConfigHandlerImpl::Reload() {
  const std::string filename = GetConfigFileName();
  if (filename.empty()) {
    return;
  }
  ROMANTOOLS_VLOG(1) << "Reloading config file: " << filename;
  absl::StatusOr<Config> config = ReadConfigFile(filename);
  if (!config.ok()) {
    // we set default config when file is broken
    LOG(ERROR) << config.status();
    SetConfigInternal(std::make_shared<Config>());
    return;
  }
  SetConfigInternal(std::make_shared<Config>(*std::move(config)));
}

std::string ConfigHandlerImpl::GetConfigFileName() const {
  absl::ReaderMutexLock lock(&mutex_);
  return filename_;
}

}  // namespace

Config ConfigHandler::GetCopiedConfig() { return *GetSharedConfig(); }

std::shared_ptr<const Config> ConfigHandler::GetSharedConfig() {
  return GetConfigHandlerImpl()->GetSharedConfig();
}

void ConfigHandler::SetConfig(const Config &config) {
  GetConfigHandlerImpl()->SetConfig(config);
}

// static
void ConfigHandler::GetDefaultConfig(Config *config) {
  *config = DefaultConfig();
}

// static
const Config &ConfigHandler::DefaultConfig() {
  return GetConfigHandlerImpl()->DefaultConfig();
}

absl::Status ConfigHandler::LoadFromFile(const std::string &filename) {
  return GetConfigHandlerImpl()->LoadFromFile(filename);
}

void ConfigHandler::Reload() { GetConfigHandlerImpl()->Reload(); }

absl::Status ConfigHandler::ParseTextConfig(absl::string_view text,
                                            Config *config) {
  config->Clear();
  if (!google::protobuf::TextFormat::ParseFromString(std::string(text),
                                                     config)) {
    config->Clear();
    return absl::InvalidArgumentError("Cannot parse text-format config");
  }
  return absl::OkStatus();
}

void ConfigHandler::NormalizeConfig(Config *config) {
  if (config->syllable_cache_size() < 1) {
    LOG(WARNING) << "syllable_cache_size must be positive: "
                 << config->syllable_cache_size();
    config->set_syllable_cache_size(1);
  }
  if (config->conversion_cache_size() < 1) {
    LOG(WARNING) << "conversion_cache_size must be positive: "
                 << config->conversion_cache_size();
    config->set_conversion_cache_size(1);
  }
  if (config->verbose_level() < 0) {
    config->set_verbose_level(0);
  }
  VLog::SetConfigLevel(config->verbose_level());
}

std::string ConfigHandler::GetConfigFileNameForTesting() {
  return GetConfigHandlerImpl()->GetConfigFileName();
}

}  // namespace config
}  // namespace romantools
