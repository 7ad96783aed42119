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

#ifndef CHANSTOR_CLIENT_CLIENT_H_
#define CHANSTOR_CLIENT_CLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"

#include "client/BackendTypes.h"
#include "client/TransferError.h"

namespace CS {

namespace Client {

//
// Remote object client
//
// The channel based backend seen by the transfer sessions. Every call is
// blocking, and a session issues them one at a time.
//
class Client : private boost::noncopyable {
 public:
  Client() {}
  virtual ~Client() {}

 public:
  // Resolve a channel
  //
  // @param  : channel reference, channel (output)
  // @return : ClientError, CHANNEL_NOT_FOUND or ACCESS_DENIED on failure
  virtual ClientError<TransferError::Value> GetChannel(
      const std::string &channelRef, Channel *channel) = 0;

  // Look up a message of channel
  //
  // @param  : channel, message id, message (output)
  // @return : ClientError, MESSAGE_NOT_FOUND on failure
  virtual ClientError<TransferError::Value> GetMessage(
      const Channel &channel, int64_t messageId, Message *message) = 0;

  // Fetch one page of a document
  //
  // @param  : document, offset, limit, bytes (output)
  // @return : ClientError
  //
  // Fewer than limit bytes are returned only for the last page of the
  // document.
  virtual ClientError<TransferError::Value> GetFile(
      const Document &document, uint64_t offset, uint64_t limit,
      std::vector<char> *bytes) = 0;

  // Append one page to a pending upload
  //
  // @param  : file id, page index, total pages (-1 if unknown), bytes
  // @return : ClientError
  virtual ClientError<TransferError::Value> SendFileParts(
      uint64_t fileId, int pageIndex, int totalPages,
      const std::vector<char> &bytes) = 0;

  // Commit a pending upload as a new message
  //
  // @param  : channel (NULL for the default destination), file, message
  //           (output)
  // @return : ClientError
  virtual ClientError<TransferError::Value> MoveFileToChat(
      const Channel *channel, const UploadedFile &file, Message *message) = 0;

  // Maximum count of pages of one uploaded object
  virtual int GetMaxUploadParts() const = 0;
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_CLIENT_H_
