// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef CHANSTOR_BASE_LOGMACROS_H_
#define CHANSTOR_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_CHANSTOR_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)

#else  // !DISABLE_CHANSTOR_LOGGING

#define CS_LOG_PREFIX(level) \
  CS::Logging::GetLogLevelPrefix(CS::Logging::LogLevel::level)

// INFO stream is flushed after every non-fatal message, so the log file is
// complete when a test reads it back.
#define CS_LOG(severity, level, msg)                \
  {                                                 \
    LOG(severity) << CS_LOG_PREFIX(level) << msg;   \
    google::FlushLogFiles(google::INFO);       \
  }

#define CS_LOG_IF(severity, level, condition, msg)                  \
  {                                                                 \
    LOG_IF(severity, (condition)) << CS_LOG_PREFIX(level) << msg;   \
    google::FlushLogFiles(google::INFO);                       \
  }

#define CS_DEBUG_LOG(severity, level, msg)            \
  {                                                   \
    if (CS::Logging::Log::Instance().IsDebug()) {     \
      CS_LOG(severity, level, msg)                    \
    }                                                 \
  }

#define Info(msg) CS_LOG(INFO, Info, msg)
#define Warning(msg) CS_LOG(WARNING, Warn, msg)
#define Error(msg) CS_LOG(ERROR, Error, msg)
#define Fatal(msg) \
  { LOG(FATAL) << CS_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) CS_LOG_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) CS_LOG_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) CS_LOG_IF(ERROR, Error, condition, msg)

#define DebugInfo(msg) CS_DEBUG_LOG(INFO, Info, msg)
#define DebugWarning(msg) CS_DEBUG_LOG(WARNING, Warn, msg)
#define DebugError(msg) CS_DEBUG_LOG(ERROR, Error, msg)

#endif  // DISABLE_CHANSTOR_LOGGING

#endif  // CHANSTOR_BASE_LOGMACROS_H_
