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

#ifndef CHANSTOR_CLIENT_UTILS_H_
#define CHANSTOR_CLIENT_UTILS_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "client/BackendTypes.h"

namespace CS {

namespace Client {

namespace Utils {

// Generate a random id for a pending upload
//
// @param  : void
// @return : 19 decimal digits id
uint64_t GenerateFileId();

// Generate a transfer session id
//
// @param  : prefix, e.g. "dl" or "ul"
// @return : string with format of "prefix-<12 hex digits>"
std::string GenerateSessionId(const std::string &prefix);

// Build a range string
//
// @param  : start, end (inclusive)
// @return : string with format of "bytes=start-end"
std::string BuildRequestRange(uint64_t start, uint64_t end);

// Parse a part description
//
// @param  : string with format of "channel:message:size", part (output)
// @return : bool
bool ParseFilePart(const std::string &text, FilePart *part);

// Format a part description
//
// @param  : part
// @return : string with format of "channel:message:size"
std::string FormatFilePart(const FilePart &part);

// Sum of the part sizes
uint64_t GetTotalSize(const std::vector<FilePart> &parts);

}  // namespace Utils
}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_UTILS_H_
