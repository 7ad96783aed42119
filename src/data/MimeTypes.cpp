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

#include "data/MimeTypes.h"

#include <fstream>
#include <sstream>
#include <string>

#include "boost/bind.hpp"
#include "boost/foreach.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/once.hpp"

#include "base/LogMacros.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace CS {

namespace Data {

using CS::Configure::Default::GetMimeFiles;
using std::string;

static const char *CONTENT_TYPE_STREAM = "application/octet-stream";

namespace {

boost::scoped_ptr<MimeTypes> mimeTypesInstance;
boost::once_flag initOnceFlag = BOOST_ONCE_INIT;

void DoInitializeMimeTypes(const string &mimeFile) {
  mimeTypesInstance.reset(new MimeTypes);
  if (mimeFile.empty() || !mimeTypesInstance->LoadFile(mimeFile)) {
    mimeTypesInstance->LoadDefaults();
  }
}

void DoDefaultInitializeMimeTypes() {
  string mimeFile;
  BOOST_FOREACH(const string &filePath, GetMimeFiles()) {
    if (CS::Utils::FileExists(filePath)) {
      mimeFile = filePath;
      break;
    }
  }
  DoInitializeMimeTypes(mimeFile);
}

struct ExtMimePair {
  const char *m_ext;
  const char *m_mime;
};

const ExtMimePair defaultMimeTypes[] = {
    {"7z", "application/x-7z-compressed"},
    {"avi", "video/x-msvideo"},
    {"bin", "application/octet-stream"},
    {"bz2", "application/x-bzip2"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"deb", "application/vnd.debian.binary-package"},
    {"doc", "application/msword"},
    {"epub", "application/epub+zip"},
    {"flac", "audio/flac"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"iso", "application/x-iso9660-image"},
    {"jar", "application/java-archive"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "application/javascript"},
    {"json", "application/json"},
    {"mkv", "video/x-matroska"},
    {"mov", "video/quicktime"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"ogg", "audio/ogg"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"rar", "application/rar"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"txt", "text/plain"},
    {"wav", "audio/x-wav"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"xml", "application/xml"},
    {"xz", "application/x-xz"},
    {"zip", "application/zip"},
};

}  // namespace

// --------------------------------------------------------------------------
bool MimeTypes::LoadFile(const string &mimeFile) {
  std::ifstream file(mimeFile.c_str());
  if (!file) {
    Info("Unable to open file " + mimeFile);
    return false;
  }

  string line;
  while (getline(file, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }

    std::stringstream ss(line);
    string mimeType;
    ss >> mimeType;
    string ext;
    while (ss >> ext) {
      m_extToMimeTypeMap[ext] = mimeType;
    }
  }
  return true;
}

// --------------------------------------------------------------------------
void MimeTypes::LoadDefaults() {
  size_t n = sizeof(defaultMimeTypes) / sizeof(defaultMimeTypes[0]);
  for (size_t i = 0; i < n; ++i) {
    m_extToMimeTypeMap[defaultMimeTypes[i].m_ext] = defaultMimeTypes[i].m_mime;
  }
}

// --------------------------------------------------------------------------
string MimeTypes::Find(const string &ext) const {
  ExtToMimetypeMapConstIterator it = m_extToMimeTypeMap.find(ext);
  return it != m_extToMimeTypeMap.end() ? it->second : string();
}

// --------------------------------------------------------------------------
void InitializeMimeTypes(const string &mimeFile) {
  boost::call_once(initOnceFlag, boost::bind(boost::type<void>(),
                                             DoInitializeMimeTypes, mimeFile));
}

// --------------------------------------------------------------------------
string LookupMimeType(const string &path) {
  boost::call_once(initOnceFlag, DoDefaultInitializeMimeTypes);

  string name = CS::Utils::GetBaseName(path);
  string::size_type pos = name.find_last_of('.');
  if (pos == string::npos || pos + 1 == name.size()) {
    return CONTENT_TYPE_STREAM;
  }
  string mimeType = mimeTypesInstance->Find(name.substr(pos + 1));
  return mimeType.empty() ? CONTENT_TYPE_STREAM : mimeType;
}

// --------------------------------------------------------------------------
string GetDefaultMimeType() { return CONTENT_TYPE_STREAM; }

}  // namespace Data
}  // namespace CS
