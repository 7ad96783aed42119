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

#ifndef CHANSTOR_BASE_STRINGUTILS_H_
#define CHANSTOR_BASE_STRINGUTILS_H_

#include <stdint.h>

#include <string>
#include <vector>

namespace CS {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Left pad the decimal representation of value with '0' up to width
//
// @param  : value, width
// @return : string, e.g. ZeroPad(7, 3) is "007"
std::string ZeroPad(uint64_t value, int width);

// Split string by delimiter, empty tokens are kept
//
// @param  : string, delimiter
// @return : tokens
std::vector<std::string> Split(const std::string &str, char delim);

// Format path
//
// @param  : path
// @return : formatted string
std::string FormatPath(const std::string &path);

// Format byte range for log message
//
// @param  : start, end (inclusive)
// @return : string in form of "[range=start-end]"
std::string FormatRange(uint64_t start, uint64_t end);

}  // namespace StringUtils
}  // namespace CS

#endif  // CHANSTOR_BASE_STRINGUTILS_H_
