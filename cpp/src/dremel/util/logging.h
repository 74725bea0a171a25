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

#pragma once

#include <iostream>
#include <memory>
#include <string>

#include "dremel/util/macros.h"
#include "dremel/util/visibility.h"

namespace dremel {
namespace util {

enum class DremelLogLevel : int {
  DREMEL_DEBUG = -1,
  DREMEL_INFO = 0,
  DREMEL_WARNING = 1,
  DREMEL_ERROR = 2,
  DREMEL_FATAL = 3
};

#define DREMEL_LOG_INTERNAL(level) ::dremel::util::DremelLog(__FILE__, __LINE__, level)
#define DREMEL_LOG(level) DREMEL_LOG_INTERNAL(::dremel::util::DremelLogLevel::DREMEL_##level)

#define DREMEL_IGNORE_EXPR(expr) ((void)(expr))

#define DREMEL_CHECK(condition)                                                   \
  DREMEL_PREDICT_TRUE(condition)                                                  \
  ? DREMEL_IGNORE_EXPR(0)                                                         \
  : ::dremel::util::Voidify() &                                                   \
          ::dremel::util::DremelLog(__FILE__, __LINE__,                           \
                                    ::dremel::util::DremelLogLevel::DREMEL_FATAL) \
              << " Check failed: " #condition " "

// If 'to_call' returns a bad status, CHECK immediately with a logged message
// of 'msg' followed by the status.
#define DREMEL_CHECK_OK_PREPEND(to_call, msg)                              \
  do {                                                                     \
    ::dremel::Status _s = (to_call);                                       \
    DREMEL_CHECK(_s.ok()) << "Operation failed: " << DREMEL_STRINGIFY(to_call) \
                          << "\n"                                           \
                          << (msg) << ": " << _s.ToString();               \
  } while (false)

// If the status is bad, CHECK immediately, appending the status to the
// logged message.
#define DREMEL_CHECK_OK(s) DREMEL_CHECK_OK_PREPEND(s, "Bad status")

#define DREMEL_CHECK_EQ(val1, val2) DREMEL_CHECK((val1) == (val2))
#define DREMEL_CHECK_NE(val1, val2) DREMEL_CHECK((val1) != (val2))
#define DREMEL_CHECK_LE(val1, val2) DREMEL_CHECK((val1) <= (val2))
#define DREMEL_CHECK_LT(val1, val2) DREMEL_CHECK((val1) < (val2))
#define DREMEL_CHECK_GE(val1, val2) DREMEL_CHECK((val1) >= (val2))
#define DREMEL_CHECK_GT(val1, val2) DREMEL_CHECK((val1) > (val2))

#ifdef NDEBUG
#define DREMEL_DFATAL ::dremel::util::DremelLogLevel::DREMEL_WARNING

// CAUTION: DCHECK_OK() always evaluates its argument, but other DCHECK*() macros
// only do so in debug mode.

#define DREMEL_DCHECK(condition)               \
  while (false) DREMEL_IGNORE_EXPR(condition); \
  while (false) ::dremel::util::detail::NullLog()
#define DREMEL_DCHECK_OK(s) \
  DREMEL_IGNORE_EXPR(s);    \
  while (false) ::dremel::util::detail::NullLog()
#define DREMEL_DCHECK_EQ(val1, val2)      \
  while (false) DREMEL_IGNORE_EXPR(val1); \
  while (false) DREMEL_IGNORE_EXPR(val2); \
  while (false) ::dremel::util::detail::NullLog()
#define DREMEL_DCHECK_NE(val1, val2)      \
  while (false) DREMEL_IGNORE_EXPR(val1); \
  while (false) DREMEL_IGNORE_EXPR(val2); \
  while (false) ::dremel::util::detail::NullLog()
#define DREMEL_DCHECK_LE(val1, val2)      \
  while (false) DREMEL_IGNORE_EXPR(val1); \
  while (false) DREMEL_IGNORE_EXPR(val2); \
  while (false) ::dremel::util::detail::NullLog()
#define DREMEL_DCHECK_LT(val1, val2)      \
  while (false) DREMEL_IGNORE_EXPR(val1); \
  while (false) DREMEL_IGNORE_EXPR(val2); \
  while (false) ::dremel::util::detail::NullLog()
#define DREMEL_DCHECK_GE(val1, val2)      \
  while (false) DREMEL_IGNORE_EXPR(val1); \
  while (false) DREMEL_IGNORE_EXPR(val2); \
  while (false) ::dremel::util::detail::NullLog()
#define DREMEL_DCHECK_GT(val1, val2)      \
  while (false) DREMEL_IGNORE_EXPR(val1); \
  while (false) DREMEL_IGNORE_EXPR(val2); \
  while (false) ::dremel::util::detail::NullLog()

#else
#define DREMEL_DFATAL ::dremel::util::DremelLogLevel::DREMEL_FATAL

#define DREMEL_DCHECK DREMEL_CHECK
#define DREMEL_DCHECK_OK DREMEL_CHECK_OK
#define DREMEL_DCHECK_EQ DREMEL_CHECK_EQ
#define DREMEL_DCHECK_NE DREMEL_CHECK_NE
#define DREMEL_DCHECK_LE DREMEL_CHECK_LE
#define DREMEL_DCHECK_LT DREMEL_CHECK_LT
#define DREMEL_DCHECK_GE DREMEL_CHECK_GE
#define DREMEL_DCHECK_GT DREMEL_CHECK_GT

#endif  // NDEBUG

// This code is adapted from
// https://github.com/ray-project/ray/blob/master/src/ray/util/logging.h.

// To make the logging lib pluggable with other logging libs and make
// the implementation unawared by the user, DremelLog is only a declaration
// which hide the implementation into logging.cc file.
// In logging.cc, we can choose different log libs using different macros.

// This is also a null log which does not output anything.
class DREMEL_EXPORT DremelLogBase {
 public:
  virtual ~DremelLogBase() {}

  virtual bool IsEnabled() const { return false; }

  template <typename T>
  DremelLogBase& operator<<(const T& t) {
    if (IsEnabled()) {
      Stream() << t;
    }
    return *this;
  }

 protected:
  virtual std::ostream& Stream() = 0;
};

class DREMEL_EXPORT DremelLog : public DremelLogBase {
 public:
  DremelLog(const char* file_name, int line_number, DremelLogLevel severity);
  ~DremelLog() override;

  /// Return whether or not current logging instance is enabled.
  ///
  /// \return True if logging is enabled and false otherwise.
  bool IsEnabled() const override;

  /// The init function of the logging library, which reads the
  /// DREMEL_LOG_LEVEL environment variable. It is called once when the
  /// first log line is produced unless a threshold was set explicitly.
  ///
  /// \param app_name The app name which starts the log.
  /// \param severity_threshold Logging threshold for the program.
  static void StartDremelLog(const std::string& app_name,
                             DremelLogLevel severity_threshold = DremelLogLevel::DREMEL_INFO);

  /// Set the minimum severity that is written to the log.
  static void SetSeverityThreshold(DremelLogLevel severity_threshold);

  /// Return the minimum severity that is written to the log.
  static DremelLogLevel GetSeverityThreshold();

  /// Parse a level name such as "debug" or "WARNING".
  ///
  /// \return false if the name is not recognized.
  static bool ParseLevel(const std::string& name, DremelLogLevel* out);

  /// Return whether or not the log level is enabled in current setting.
  ///
  /// \param log_level The input log level to test.
  /// \return True if input log level is not lower than the threshold.
  static bool IsLevelEnabled(DremelLogLevel log_level);

 private:
  DREMEL_DISALLOW_COPY_AND_ASSIGN(DremelLog);

  // Hide the implementation of log provider by void *.
  // Otherwise, lib user may define the same macro to use the correct header file.
  void* logging_provider_;
  /// True if log messages should be logged and false if they should be ignored.
  bool is_enabled_;

 protected:
  std::ostream& Stream() override;
};

// This class make DREMEL_CHECK compilation pass to change the << operator to void.
// This class is copied from glog.
class DREMEL_EXPORT Voidify {
 public:
  Voidify() {}
  // This has to be an operator with a precedence lower than << but
  // higher than ?:
  void operator&(DremelLogBase&) {}
};

namespace detail {

/// @brief A helper for the nil log sink.
///
/// Using this helper is analogous to sending log messages to /dev/null:
/// nothing gets logged.
class NullLog {
 public:
  /// The no-op output operator.
  ///
  /// @param [in] t
  ///   The object to send into the nil sink.
  /// @return Reference to the updated object.
  template <class T>
  NullLog& operator<<(const T& t) {
    return *this;
  }
};

}  // namespace detail
}  // namespace util
}  // namespace dremel
