// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "dremel/util/logging.h"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace dremel {
namespace util {

namespace {

// This is the default implementation of dremel log,
// which is independent of any libs.
class CerrLog {
 public:
  explicit CerrLog(DremelLogLevel severity) : severity_(severity), has_logged_(false) {}

  virtual ~CerrLog() {
    if (has_logged_) {
      std::cerr << std::endl;
    }
    if (severity_ == DremelLogLevel::DREMEL_FATAL) {
      std::abort();
    }
  }

  std::ostream& Stream() {
    has_logged_ = true;
    return std::cerr;
  }

  template <class T>
  CerrLog& operator<<(const T& t) {
    has_logged_ = true;
    std::cerr << t;
    return *this;
  }

 protected:
  const DremelLogLevel severity_;
  bool has_logged_;
};

const char* SeverityName(DremelLogLevel severity) {
  switch (severity) {
    case DremelLogLevel::DREMEL_DEBUG:
      return "DEBUG";
    case DremelLogLevel::DREMEL_INFO:
      return "INFO";
    case DremelLogLevel::DREMEL_WARNING:
      return "WARNING";
    case DremelLogLevel::DREMEL_ERROR:
      return "ERROR";
    case DremelLogLevel::DREMEL_FATAL:
      return "FATAL";
  }
  return "UNKNOWN";
}

std::once_flag g_init_once;
DremelLogLevel g_severity_threshold = DremelLogLevel::DREMEL_INFO;
std::string g_app_name;  // NOLINT(runtime/string)

// Reads DREMEL_LOG_LEVEL the first time any log line is considered.
void InitFromEnvironment() {
  std::call_once(g_init_once, []() {
    const char* env = std::getenv("DREMEL_LOG_LEVEL");
    if (env == nullptr) {
      return;
    }
    DremelLogLevel level;
    if (DremelLog::ParseLevel(env, &level)) {
      g_severity_threshold = level;
    } else {
      std::cerr << "Unrecognized DREMEL_LOG_LEVEL '" << env << "', keeping "
                << SeverityName(g_severity_threshold) << std::endl;
    }
  });
}

}  // namespace

typedef CerrLog LoggingProvider;

void DremelLog::StartDremelLog(const std::string& app_name,
                               DremelLogLevel severity_threshold) {
  InitFromEnvironment();
  g_app_name = app_name;
  g_severity_threshold = severity_threshold;
}

void DremelLog::SetSeverityThreshold(DremelLogLevel severity_threshold) {
  InitFromEnvironment();
  g_severity_threshold = severity_threshold;
}

DremelLogLevel DremelLog::GetSeverityThreshold() {
  InitFromEnvironment();
  return g_severity_threshold;
}

bool DremelLog::ParseLevel(const std::string& name, DremelLogLevel* out) {
  std::string upper;
  for (char c : name) {
    upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (upper == "DEBUG") {
    *out = DremelLogLevel::DREMEL_DEBUG;
  } else if (upper == "INFO") {
    *out = DremelLogLevel::DREMEL_INFO;
  } else if (upper == "WARNING" || upper == "WARN") {
    *out = DremelLogLevel::DREMEL_WARNING;
  } else if (upper == "ERROR") {
    *out = DremelLogLevel::DREMEL_ERROR;
  } else if (upper == "FATAL") {
    *out = DremelLogLevel::DREMEL_FATAL;
  } else {
    return false;
  }
  return true;
}

bool DremelLog::IsLevelEnabled(DremelLogLevel log_level) {
  return log_level >= GetSeverityThreshold();
}

DremelLog::DremelLog(const char* file_name, int line_number, DremelLogLevel severity)
    : logging_provider_(nullptr), is_enabled_(severity >= GetSeverityThreshold()) {
  // FATAL is always constructed so that the process aborts.
  if (is_enabled_ || severity == DremelLogLevel::DREMEL_FATAL) {
    auto logging_provider = new CerrLog(severity);
    *logging_provider << file_name << ":" << line_number << ": ";
    if (severity != DremelLogLevel::DREMEL_INFO) {
      *logging_provider << SeverityName(severity) << ": ";
    }
    logging_provider_ = logging_provider;
    is_enabled_ = true;
  }
}

std::ostream& DremelLog::Stream() {
  auto logging_provider = reinterpret_cast<LoggingProvider*>(logging_provider_);
  return logging_provider->Stream();
}

bool DremelLog::IsEnabled() const { return is_enabled_; }

DremelLog::~DremelLog() {
  if (logging_provider_ != nullptr) {
    delete reinterpret_cast<LoggingProvider*>(logging_provider_);
    logging_provider_ = nullptr;
  }
}

}  // namespace util
}  // namespace dremel
