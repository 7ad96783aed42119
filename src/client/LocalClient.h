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

#ifndef CHANSTOR_CLIENT_LOCALCLIENT_H_
#define CHANSTOR_CLIENT_LOCALCLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/thread/mutex.hpp"

#include "client/BackendTypes.h"
#include "client/Client.h"
#include "client/TransferError.h"

namespace CS {

namespace Client {

//
// LocalClient
//
// Backend kept in a local directory:
//
//   <store>/channels/<channel>/<message>.dat    document bytes
//   <store>/channels/<channel>/<message>.meta   document id, name and mime
//   <store>/uploads/<file id>/<page>.part       pages of a pending upload
//
// A null channel in MoveFileToChat stands for the "self" channel, which is
// created with the client.
//
class LocalClient : public Client {
 public:
  explicit LocalClient(const std::string &storeDirectory);
  LocalClient(const std::string &storeDirectory, int maxUploadParts);
  ~LocalClient() {}

 public:
  ClientError<TransferError::Value> GetChannel(const std::string &channelRef,
                                               Channel *channel);
  ClientError<TransferError::Value> GetMessage(const Channel &channel,
                                               int64_t messageId,
                                               Message *message);
  ClientError<TransferError::Value> GetFile(const Document &document,
                                            uint64_t offset, uint64_t limit,
                                            std::vector<char> *bytes);
  ClientError<TransferError::Value> SendFileParts(
      uint64_t fileId, int pageIndex, int totalPages,
      const std::vector<char> &bytes);
  ClientError<TransferError::Value> MoveFileToChat(const Channel *channel,
                                                   const UploadedFile &file,
                                                   Message *message);
  int GetMaxUploadParts() const { return m_maxUploadParts; }

 public:
  // Create a channel directory if it doesn't exist
  //
  // @param  : channel reference
  // @return : bool
  bool CreateChannel(const std::string &channelRef);

  const std::string &GetStoreDirectory() const { return m_storeDirectory; }
  std::string GetChannelDirectory(const std::string &channelRef) const;
  std::string GetUploadDirectory(uint64_t fileId) const;

 private:
  void Initialize();
  int64_t NextMessageId(const std::string &channelDir) const;

 private:
  std::string m_storeDirectory;
  int m_maxUploadParts;
  boost::mutex m_lock;  // serialize commits into channels
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_LOCALCLIENT_H_
