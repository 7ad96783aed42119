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

#ifndef CHANSTOR_CONFIGURE_DEFAULT_H_
#define CHANSTOR_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>
#include <vector>

namespace CS {

namespace Configure {

namespace Default {

const char* GetProgramName();

std::string GetDefaultLogDirectory();
std::string GetDefaultLogLevelName();
std::string GetDefaultStoreDirectory();
std::string GetDefaultUploadChannel();
std::vector<std::string> GetMimeFiles();

mode_t GetDefineDirMode();

uint64_t GetDefaultDownloadPageSize();  // page size of a backend read
uint64_t GetDefaultUploadPageSize();    // page size of a backend append
uint64_t GetDefaultMinBufferSize();     // keep smaller uploads in memory
int GetDefaultMaxUploadParts();         // pages per backend object

size_t GetDefaultParallelTransfers();

}  // namespace Default
}  // namespace Configure
}  // namespace CS

#endif  // CHANSTOR_CONFIGURE_DEFAULT_H_
