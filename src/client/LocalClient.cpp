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

#include "client/LocalClient.h"

#include <errno.h>
#include <string.h>  // for strerror
#include <unistd.h>  // for access

#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/functional/hash.hpp"
#include "boost/lexical_cast.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "client/ClientConfiguration.h"

namespace CS {

namespace Client {

using boost::bad_lexical_cast;
using boost::lexical_cast;
using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using CS::StringUtils::Split;
using CS::StringUtils::Trim;
using CS::StringUtils::ZeroPad;
using CS::Utils::AppendPathDelim;
using CS::Utils::MakeDirectories;
using CS::Utils::FileExists;
using CS::Utils::GetFileSize;
using CS::Utils::IsDirectory;
using CS::Utils::ListFileNames;
using CS::Utils::RemoveDirectory;
using std::ifstream;
using std::ofstream;
using std::pair;
using std::string;
using std::vector;

namespace {

const char *const SELF_CHANNEL = "self";
const char *const DATA_SUFFIX = ".dat";
const char *const META_SUFFIX = ".meta";
const char *const PART_SUFFIX = ".part";
const int PAGE_NAME_WIDTH = 6;

uint64_t GetAccessHash(const string &channelRef) {
  boost::hash<string> hasher;
  return static_cast<uint64_t>(hasher(channelRef));
}

bool IsValidChannelRef(const string &channelRef) {
  return !channelRef.empty() && channelRef != "." && channelRef != ".." &&
         channelRef.find('/') == string::npos;
}

bool EndsWith(const string &str, const string &suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// meta file holds "key=value" lines
bool ReadMeta(const string &path, Message *message) {
  ifstream in(path.c_str());
  if (!in) {
    return false;
  }
  string line;
  while (std::getline(in, line)) {
    string::size_type pos = line.find('=');
    if (pos == string::npos) {
      continue;
    }
    string key = Trim(line.substr(0, pos), ' ');
    string value = Trim(line.substr(pos + 1), ' ');
    try {
      if (key == "document") {
        message->m_document.m_id = lexical_cast<uint64_t>(value);
      } else if (key == "name") {
        message->m_fileName = value;
      } else if (key == "mime") {
        message->m_mime = value;
      }
    } catch (const bad_lexical_cast &) {
      return false;
    }
  }
  return true;
}

bool WriteMeta(const string &path, const Message &message) {
  ofstream out(path.c_str(), std::ios_base::out | std::ios_base::trunc);
  if (!out) {
    return false;
  }
  out << "document=" << message.m_document.m_id << "\n";
  out << "name=" << message.m_fileName << "\n";
  out << "mime=" << message.m_mime << "\n";
  out.flush();
  return static_cast<bool>(out);
}

}  // namespace

// --------------------------------------------------------------------------
LocalClient::LocalClient(const string &storeDirectory)
    : m_storeDirectory(AppendPathDelim(storeDirectory)),
      m_maxUploadParts(ClientConfiguration::Instance().GetMaxUploadParts()) {
  Initialize();
}

// --------------------------------------------------------------------------
LocalClient::LocalClient(const string &storeDirectory, int maxUploadParts)
    : m_storeDirectory(AppendPathDelim(storeDirectory)),
      m_maxUploadParts(maxUploadParts > 0 ? maxUploadParts : 1) {
  Initialize();
}

// --------------------------------------------------------------------------
void LocalClient::Initialize() {
  if (!MakeDirectories(m_storeDirectory + "uploads") ||
      !CreateChannel(SELF_CHANNEL)) {
    Warning("Unable to initialize store directory " + m_storeDirectory +
            " : " + strerror(errno));
  }
}

// --------------------------------------------------------------------------
bool LocalClient::CreateChannel(const string &channelRef) {
  if (!IsValidChannelRef(channelRef)) {
    return false;
  }
  return MakeDirectories(GetChannelDirectory(channelRef));
}

// --------------------------------------------------------------------------
string LocalClient::GetChannelDirectory(const string &channelRef) const {
  return m_storeDirectory + "channels/" + channelRef + "/";
}

// --------------------------------------------------------------------------
string LocalClient::GetUploadDirectory(uint64_t fileId) const {
  return m_storeDirectory + "uploads/" + to_string(fileId) + "/";
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> LocalClient::GetChannel(
    const string &channelRef, Channel *channel) {
  if (channel == NULL) {
    return MakeTransferError(TransferError::PARAMETER_MISSING, "GetChannel",
                             "null channel output");
  }
  string dir = GetChannelDirectory(channelRef);
  if (!IsValidChannelRef(channelRef) || !IsDirectory(dir)) {
    return MakeTransferError(TransferError::CHANNEL_NOT_FOUND, "GetChannel",
                             channelRef);
  }
  // reading messages and committing into the channel both need rwx
  if (access(dir.c_str(), R_OK | W_OK | X_OK) != 0) {
    return MakeTransferError(TransferError::ACCESS_DENIED, "GetChannel",
                             channelRef + ": " + strerror(errno));
  }

  channel->m_id = channelRef;
  channel->m_accessHash = GetAccessHash(channelRef);
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> LocalClient::GetMessage(
    const Channel &channel, int64_t messageId, Message *message) {
  if (message == NULL) {
    return MakeTransferError(TransferError::PARAMETER_MISSING, "GetMessage",
                             "null message output");
  }
  if (channel.m_accessHash != GetAccessHash(channel.m_id)) {
    return MakeTransferError(TransferError::ACCESS_DENIED, "GetMessage",
                             "bad access hash for channel " + channel.m_id);
  }

  string base = GetChannelDirectory(channel.m_id) + to_string(messageId);
  string dataFile = base + DATA_SUFFIX;
  pair<bool, uint64_t> size = GetFileSize(dataFile);
  Message found;
  if (!size.first || !ReadMeta(base + META_SUFFIX, &found)) {
    return MakeTransferError(TransferError::MESSAGE_NOT_FOUND, "GetMessage",
                             channel.m_id + ":" + to_string(messageId));
  }

  found.m_id = messageId;
  found.m_document.m_accessHash = channel.m_accessHash;
  found.m_document.m_fileReference = dataFile;
  found.m_document.m_size = size.second;
  *message = found;
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> LocalClient::GetFile(
    const Document &document, uint64_t offset, uint64_t limit,
    vector<char> *bytes) {
  if (bytes == NULL) {
    return MakeTransferError(TransferError::PARAMETER_MISSING, "GetFile",
                             "null bytes output");
  }
  bytes->clear();
  ifstream in(document.m_fileReference.c_str(),
              std::ios_base::in | std::ios_base::binary);
  if (!in) {
    return MakeTransferError(TransferError::BACKEND_FETCH_ERROR, "GetFile",
                             "unable to open document " +
                                 to_string(document.m_id));
  }
  if (offset >= document.m_size || limit == 0) {
    return GoodTransferError();
  }

  uint64_t available = document.m_size - offset;
  size_t len = static_cast<size_t>(limit < available ? limit : available);
  bytes->resize(len);
  in.seekg(static_cast<std::streamoff>(offset), std::ios_base::beg);
  in.read(&(*bytes)[0], static_cast<std::streamsize>(len));
  bytes->resize(static_cast<size_t>(in.gcount()));
  if (in.bad()) {
    bytes->clear();
    return MakeTransferError(TransferError::BACKEND_FETCH_ERROR, "GetFile",
                             "read document " + to_string(document.m_id) +
                                 " at " + to_string(offset));
  }
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> LocalClient::SendFileParts(
    uint64_t fileId, int pageIndex, int totalPages,
    const vector<char> &bytes) {
  if (pageIndex < 0 || pageIndex >= m_maxUploadParts) {
    return MakeTransferError(TransferError::BACKEND_PUSH_ERROR,
                             "SendFileParts",
                             "page index " + to_string(pageIndex) +
                                 " out of [0, " + to_string(m_maxUploadParts) +
                                 ")");
  }
  if (totalPages != -1 && totalPages != pageIndex + 1) {
    return MakeTransferError(TransferError::BACKEND_PUSH_ERROR,
                             "SendFileParts",
                             "total pages " + to_string(totalPages) +
                                 " for last page " + to_string(pageIndex));
  }

  string dir = GetUploadDirectory(fileId);
  if (!MakeDirectories(dir)) {
    return MakeTransferError(TransferError::BACKEND_PUSH_ERROR,
                             "SendFileParts",
                             "create " + dir + ": " + strerror(errno));
  }
  string path = dir + ZeroPad(pageIndex, PAGE_NAME_WIDTH) + PART_SUFFIX;
  ofstream out(path.c_str(), std::ios_base::out | std::ios_base::binary |
                                 std::ios_base::trunc);
  if (!bytes.empty()) {
    out.write(&bytes[0], static_cast<std::streamsize>(bytes.size()));
  }
  out.flush();
  if (!out) {
    return MakeTransferError(TransferError::BACKEND_PUSH_ERROR,
                             "SendFileParts", "write " + path);
  }
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> LocalClient::MoveFileToChat(
    const Channel *channel, const UploadedFile &file, Message *message) {
  if (message == NULL) {
    return MakeTransferError(TransferError::PARAMETER_MISSING,
                             "MoveFileToChat", "null message output");
  }
  string channelRef = channel != NULL ? channel->m_id : string(SELF_CHANNEL);
  string channelDir = GetChannelDirectory(channelRef);
  if (!IsValidChannelRef(channelRef) || !IsDirectory(channelDir)) {
    return MakeTransferError(TransferError::CHANNEL_NOT_FOUND,
                             "MoveFileToChat", channelRef);
  }

  string uploadDir = GetUploadDirectory(file.m_fileId);
  vector<string> pageFiles;
  pair<bool, string> listed = ListFileNames(uploadDir, &pageFiles);
  if (file.m_parts > 0 &&
      (!listed.first || static_cast<int>(pageFiles.size()) != file.m_parts)) {
    return MakeTransferError(
        TransferError::BACKEND_COMMIT_ERROR, "MoveFileToChat",
        "file " + to_string(file.m_fileId) + " has " +
            to_string(pageFiles.size()) + " pages, expect " +
            to_string(file.m_parts));
  }

  lock_guard<mutex> locker(m_lock);
  int64_t messageId = NextMessageId(channelDir);
  string base = channelDir + to_string(messageId);
  string dataFile = base + DATA_SUFFIX;

  ofstream out(dataFile.c_str(), std::ios_base::out | std::ios_base::binary |
                                     std::ios_base::trunc);
  uint64_t size = 0;
  for (int i = 0; i < file.m_parts && out; ++i) {
    string pagePath =
        uploadDir + ZeroPad(i, PAGE_NAME_WIDTH) + PART_SUFFIX;
    ifstream in(pagePath.c_str(), std::ios_base::in | std::ios_base::binary);
    if (!in) {
      out.close();
      CS::Utils::RemoveFileIfExists(dataFile);
      return MakeTransferError(TransferError::BACKEND_COMMIT_ERROR,
                               "MoveFileToChat", "missing page " + pagePath);
    }
    pair<bool, uint64_t> pageSize = GetFileSize(pagePath);
    if (pageSize.second > 0) {
      out << in.rdbuf();  // sets failbit if nothing is copied
      size += pageSize.second;
    }
  }
  out.flush();
  if (!out) {
    out.close();
    CS::Utils::RemoveFileIfExists(dataFile);
    return MakeTransferError(TransferError::BACKEND_COMMIT_ERROR,
                             "MoveFileToChat", "write " + dataFile);
  }
  out.close();

  Message committed;
  committed.m_id = messageId;
  committed.m_document.m_id = file.m_fileId;
  committed.m_document.m_accessHash = GetAccessHash(channelRef);
  committed.m_document.m_fileReference = dataFile;
  committed.m_document.m_size = size;
  committed.m_fileName = file.m_fileName;
  committed.m_mime = file.m_mime;
  if (!WriteMeta(base + META_SUFFIX, committed)) {
    CS::Utils::RemoveFileIfExists(dataFile);
    return MakeTransferError(TransferError::BACKEND_COMMIT_ERROR,
                             "MoveFileToChat", "write meta of " + base);
  }

  if (file.m_parts > 0) {
    pair<bool, string> removed = RemoveDirectory(uploadDir);
    if (!removed.first) {
      Warning("Unable to remove staged pages " + uploadDir + " : " +
              removed.second);
    }
  }

  DebugInfo("Commit file " + to_string(file.m_fileId) + " as message " +
            channelRef + ":" + to_string(messageId));
  *message = committed;
  return GoodTransferError();
}

// --------------------------------------------------------------------------
int64_t LocalClient::NextMessageId(const string &channelDir) const {
  vector<string> names;
  int64_t maxId = 0;
  if (!ListFileNames(channelDir, &names).first) {
    return maxId + 1;
  }
  BOOST_FOREACH(const string &name, names) {
    if (!EndsWith(name, META_SUFFIX)) {
      continue;
    }
    try {
      int64_t id = lexical_cast<int64_t>(
          name.substr(0, name.size() - strlen(META_SUFFIX)));
      if (id > maxId) {
        maxId = id;
      }
    } catch (const bad_lexical_cast &) {
      continue;
    }
  }
  return maxId + 1;
}

}  // namespace Client
}  // namespace CS
