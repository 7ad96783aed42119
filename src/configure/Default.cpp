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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "base/Size.h"

namespace CS {

namespace Configure {

namespace Default {

using std::string;
using std::vector;

static const char* const PROGRAM_NAME = "chanstor";
static const char* const CHANSTOR_DEFAULT_LOG_DIR = "/tmp/chanstor_log/";
static const char* const CHANSTOR_DEFAULT_LOGLEVEL_NAME = "WARN";
static const char* const CHANSTOR_DEFAULT_STORE_DIR = "/tmp/chanstor_store/";
static const char* const CHANSTOR_DEFAULT_UPLOAD_CHANNEL = "self";
static const char* const MIME_FILE_DEFAULT = "/etc/mime.types";
static const int CHANSTOR_DEFAULT_MAX_UPLOAD_PARTS = 4000;

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultLogDirectory() { return CHANSTOR_DEFAULT_LOG_DIR; }
string GetDefaultLogLevelName() { return CHANSTOR_DEFAULT_LOGLEVEL_NAME; }
string GetDefaultStoreDirectory() { return CHANSTOR_DEFAULT_STORE_DIR; }
string GetDefaultUploadChannel() { return CHANSTOR_DEFAULT_UPLOAD_CHANNEL; }

vector<string> GetMimeFiles() {
  vector<string> mimes;
  mimes.push_back(MIME_FILE_DEFAULT);
  return mimes;
}

mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

uint64_t GetDefaultDownloadPageSize() { return CS::Size::MB1; }

uint64_t GetDefaultUploadPageSize() { return CS::Size::MB1; }

uint64_t GetDefaultMinBufferSize() {
  // an upload up to this size is kept inline, not sent as a message
  return CS::Size::MB10;
}

int GetDefaultMaxUploadParts() { return CHANSTOR_DEFAULT_MAX_UPLOAD_PARTS; }

size_t GetDefaultParallelTransfers() { return 5; }

}  // namespace Default
}  // namespace Configure
}  // namespace CS
