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

#ifndef CHANSTOR_CLIENT_DOWNLOADER_H_
#define CHANSTOR_CLIENT_DOWNLOADER_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "client/BackendTypes.h"
#include "client/TransferError.h"
#include "client/TransferSession.h"

namespace CS {

namespace Data {
class OutputSink;
}  // namespace Data

namespace Client {

class Client;

struct DownloadConfigure {
  uint64_t m_pageSize;

  // Default from ClientConfiguration
  DownloadConfigure();
  explicit DownloadConfigure(uint64_t pageSize) : m_pageSize(pageSize) {}
};

// Requested window, m_end is inclusive
struct DownloadRange {
  uint64_t m_start;
  uint64_t m_end;
  uint64_t m_totalSize;

  DownloadRange(uint64_t start = 0, uint64_t end = 0, uint64_t totalSize = 0)
      : m_start(start), m_end(end), m_totalSize(totalSize) {}
};

//
// Downloader
//
// Reassembles the byte range [start, end] of a file stored as ordered parts,
// each part being the document of one message. Parts are visited in order
// and streamed page by page, so the sink receives the range contiguously.
//
class Downloader : public TransferSession {
 public:
  Downloader(const std::string &sessionId, const std::vector<FilePart> &parts,
             uint64_t start, uint64_t end,
             const DownloadConfigure &config = DownloadConfigure());
  ~Downloader() {}

 public:
  // Run the download
  //
  // @param  : client, sink
  // @return : ClientError
  //
  // Blocking. The sink is closed exactly once before return, except when the
  // session was executed before (ILLEGAL_STATE) or an argument is missing
  // (PARAMETER_MISSING). A stop request is not an error, the session ends
  // as Cancelled.
  ClientError<TransferError::Value> Execute(
      const boost::shared_ptr<Client> &client,
      const boost::shared_ptr<CS::Data::OutputSink> &sink);

  // Request to stop, the sink is left to Execute
  void Stop();

  DownloadRange GetRange() const;
  const std::vector<FilePart> &GetParts() const { return m_parts; }
  const DownloadConfigure &GetConfigure() const { return m_config; }

 private:
  ClientError<TransferError::Value> DownloadPart(
      Client *client, const ResolvedPartRange &range,
      CS::Data::OutputSink *sink);

  ClientError<TransferError::Value> FinishDownload(
      CS::Data::OutputSink *sink,
      const ClientError<TransferError::Value> &err, bool interrupted = false);

 private:
  std::vector<FilePart> m_parts;
  uint64_t m_start;
  uint64_t m_end;  // inclusive
  uint64_t m_totalSize;
  DownloadConfigure m_config;
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_DOWNLOADER_H_
