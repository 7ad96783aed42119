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

#ifndef CHANSTOR_BASE_LOGLEVEL_H_
#define CHANSTOR_BASE_LOGLEVEL_H_

#include <string>

namespace CS {

namespace Logging {

// Values match glog severities, so they can be assigned to FLAGS_minloglevel
struct LogLevel {
  enum Value { Info = 0, Warn = 1, Error = 2, Fatal = 3 };
};

// Get log level name
//
// @param  : log level enumeration
// @return : log level name
std::string GetLogLevelName(LogLevel::Value logLevel);

// Get log level
//
// @param  : log level name, level (output)
// @return : true if name is one of {info, warn, warning, error, fatal}
//
// Name matching is case insensitive. Level keeps its value on failure.
bool ParseLogLevelName(const std::string &name, LogLevel::Value *level);

// Get log level
//
// @param  : log level name
// @return : log level enumeration, Warn if name is not a level name
LogLevel::Value GetLogLevelByName(const std::string &name);

// Get log level prefix
//
// @param  : log level enumeration
// @return : prefix, e.g. "[WARN] "
std::string GetLogLevelPrefix(LogLevel::Value logLevel);

}  // namespace Logging
}  // namespace CS


#endif  // CHANSTOR_BASE_LOGLEVEL_H_
