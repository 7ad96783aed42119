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

#include "base/Utils.h"

#include <errno.h>
#include <stdint.h>
#include <string.h>  // for strerror

#include <dirent.h>  // for opendir readdir
#include <ftw.h>     // for nftw
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access rmdir unlink

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "boost/scope_exit.hpp"

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace CS {

namespace Utils {

using CS::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

static const char PATH_DELIM = '/';
static const int MAX_OPEN_DIRS = 16;

namespace {

string ErrnoMessage(const string &what, const string &path) {
  return what + " " + FormatPath(path) + ": " + strerror(errno);
}

// nftw callback, children come before their dir with FTW_DEPTH
int RemoveEntry(const char *path, const struct stat *st, int type,
                struct FTW *ftw) {
  if (ftw->level == 0) {
    return 0;
  }
  int rc = (type == FTW_DP || type == FTW_DNR) ? rmdir(path) : unlink(path);
  return rc == 0 ? 0 : -1;
}

// --------------------------------------------------------------------------
pair<bool, string> RemoveTree(const string &path, bool keepTop) {
  if (nftw(path.c_str(), RemoveEntry, MAX_OPEN_DIRS, FTW_DEPTH | FTW_PHYS) !=
      0) {
    return make_pair(false, ErrnoMessage("Could not clear", path));
  }
  if (!keepTop && rmdir(path.c_str()) != 0) {
    return make_pair(false, ErrnoMessage("Could not remove", path));
  }
  return make_pair(true, string());
}

}  // namespace

// --------------------------------------------------------------------------
bool MakeDirectories(const string &path) {
  if (path.empty()) {
    return false;
  }
  mode_t mode = CS::Configure::Default::GetDefineDirMode();
  string::size_type pos = path[0] == PATH_DELIM ? 1 : 0;
  while (pos != string::npos) {
    pos = path.find(PATH_DELIM, pos);
    string dir = path.substr(0, pos);
    if (mkdir(dir.c_str(), mode) != 0 && errno != EEXIST) {
      return false;
    }
    if (pos != string::npos) {
      ++pos;
    }
  }
  return IsDirectory(path);
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  return unlink(path.c_str()) == 0 || errno == ENOENT;
}

// --------------------------------------------------------------------------
pair<bool, string> ClearDirectory(const string &path) {
  return RemoveTree(path, true);
}

// --------------------------------------------------------------------------
pair<bool, string> RemoveDirectory(const string &path) {
  return RemoveTree(path, false);
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) { return access(path.c_str(), F_OK) == 0; }

// --------------------------------------------------------------------------
bool IsDirectory(const string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

// --------------------------------------------------------------------------
pair<bool, string> ListFileNames(const string &path, vector<string> *names) {
  if (names == NULL) {
    return make_pair(false, string("Null output"));
  }

  DIR *dir = opendir(path.c_str());
  BOOST_SCOPE_EXIT((dir)) {
    if (dir) {
      closedir(dir);
    }
  }
  BOOST_SCOPE_EXIT_END

  if (dir == NULL) {
    return make_pair(false, ErrnoMessage("Could not open directory", path));
  }

  string prefix = AppendPathDelim(path);
  struct dirent *entry = NULL;
  while ((entry = readdir(dir)) != NULL) {
    struct stat st;
    if (stat((prefix + entry->d_name).c_str(), &st) == 0 &&
        S_ISREG(st.st_mode)) {
      names->push_back(entry->d_name);
    }
  }
  std::sort(names->begin(), names->end());
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
pair<bool, uint64_t> GetFileSize(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return make_pair(false, static_cast<uint64_t>(0));
  }
  return make_pair(true, static_cast<uint64_t>(st.st_size));
}

// --------------------------------------------------------------------------
string AppendPathDelim(const string &path) {
  if (!path.empty() && path[path.size() - 1] == PATH_DELIM) {
    return path;
  }
  return path + PATH_DELIM;
}

// --------------------------------------------------------------------------
string GetBaseName(const string &path) {
  string::size_type last = path.find_last_not_of(PATH_DELIM);
  if (last == string::npos) {
    return path.empty() ? path : string(1, PATH_DELIM);
  }
  string::size_type slash = path.find_last_of(PATH_DELIM, last);
  string::size_type first = slash == string::npos ? 0 : slash + 1;
  return path.substr(first, last - first + 1);
}

}  // namespace Utils
}  // namespace CS
