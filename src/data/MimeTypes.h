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

#ifndef CHANSTOR_DATA_MIMETYPES_H_
#define CHANSTOR_DATA_MIMETYPES_H_

#include <string.h>  // for strcasecmp

#include <map>
#include <string>

#include "boost/noncopyable.hpp"

namespace CS {

namespace Data {

struct CaseInsensitiveCmp {
  bool operator()(const std::string &lhs, const std::string &rhs) const {
    return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
  }
};

typedef std::map<std::string, std::string, CaseInsensitiveCmp> ExtToMimetypeMap;
typedef ExtToMimetypeMap::const_iterator ExtToMimetypeMapConstIterator;

// Extension to mime type table
class MimeTypes : private boost::noncopyable {
 public:
  MimeTypes() {}
  ~MimeTypes() {}

 public:
  // Load entries from a file in the format of /etc/mime.types
  //
  // @param  : file path
  // @return : false if the file cannot be opened
  bool LoadFile(const std::string &mimeFile);

  // Load the built-in entries
  void LoadDefaults();

  // Find mime type by extension
  //
  // @param  : ext, without the leading dot
  // @return : mime type, or empty string if not found
  std::string Find(const std::string &ext) const;

  size_t GetCount() const { return m_extToMimeTypeMap.size(); }

 private:
  ExtToMimetypeMap m_extToMimeTypeMap;
};

// Initialize the process wide table, once only
//
// @param  : mime file, the built-in entries are used if it is empty or
//           cannot be opened
void InitializeMimeTypes(const std::string &mimeFile);

// Look up the mime type from the file path
//
// @param  : e.g., "index.html"
// @return : e.g., "text/html", or "application/octet-stream" if unknown
//
// The process wide table is initialized from the default mime files if that
// has not been done yet.
std::string LookupMimeType(const std::string &path);

std::string GetDefaultMimeType();

}  // namespace Data
}  // namespace CS

#endif  // CHANSTOR_DATA_MIMETYPES_H_
