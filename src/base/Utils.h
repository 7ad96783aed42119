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

#ifndef CHANSTOR_BASE_UTILS_H_
#define CHANSTOR_BASE_UTILS_H_

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

namespace CS {

namespace Utils {

// Create dir and its missing parents
//
// @param  : dir path
// @return : true if the dir exists afterwards
bool MakeDirectories(const std::string &path);

// Remove file if it exists
bool RemoveFileIfExists(const std::string &path);

// Remove everything under dir, keep dir itself
//
// @param  : dir path
// @return : a pair of {true,""} or {false, message}
std::pair<bool, std::string> ClearDirectory(const std::string &path);

// Remove dir with everything under it
std::pair<bool, std::string> RemoveDirectory(const std::string &path);

bool FileExists(const std::string &path);
bool IsDirectory(const std::string &path);

// List names of the regular files under dir, sorted
//
// @param  : dir path, names
// @return : a pair of {true,""} or {false, message}
std::pair<bool, std::string> ListFileNames(const std::string &dir,
                                           std::vector<std::string> *names);

// Get size of a regular file
//
// @param  : file path
// @return : a pair of {true, size} or {false, 0}
std::pair<bool, uint64_t> GetFileSize(const std::string &path);

// Append "/" to path if missing
std::string AppendPathDelim(const std::string &path);

// Last component of path, trailing "/" ignored
std::string GetBaseName(const std::string &path);

}  // namespace Utils
}  // namespace CS

#endif  // CHANSTOR_BASE_UTILS_H_
