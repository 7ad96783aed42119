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

#ifndef CHANSTOR_CLIENT_UPLOADER_H_
#define CHANSTOR_CLIENT_UPLOADER_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "client/BackendTypes.h"
#include "client/FilePortion.h"
#include "client/PartLedger.h"
#include "client/TransferError.h"
#include "client/TransferSession.h"
#include "data/ChunkSplitter.h"

namespace CS {

namespace Data {
class InputSource;
}  // namespace Data

namespace Client {

class Client;

struct UploadConfigure {
  uint64_t m_pageSize;
  uint64_t m_minBufferSize;      // uploads up to this size stay in memory
  std::string m_defaultChannel;  // used when no channel is given

  // Default from ClientConfiguration
  UploadConfigure();
  UploadConfigure(uint64_t pageSize, uint64_t minBufferSize,
                  const std::string &defaultChannel)
      : m_pageSize(pageSize),
        m_minBufferSize(minBufferSize),
        m_defaultChannel(defaultChannel) {}
};

typedef boost::function<void(const boost::shared_ptr<FilePortion> &)>
    PortionUploadedCallback;
typedef boost::function<void(const PartLedger &, const std::string &)>
    CompleteUploadCallback;
typedef boost::function<void()> StoppedCallback;

//
// Uploader
//
// Splits an input into pages and appends them to pending backend files.
// A pending file takes at most GetMaxUploadParts pages, a longer input is
// committed as several portions named "<file>.001", "<file>.002", ...
// Inputs not larger than the minimum buffer size are never sent, they are
// handed back as the buffered content of a single portion.
//
class Uploader : public TransferSession {
 public:
  Uploader(const std::string &sessionId,
           const boost::shared_ptr<Client> &client,
           const std::string &channelRef, const std::string &fileName,
           const UploadConfigure &config = UploadConfigure());
  ~Uploader() {}

 public:
  // Resolve the target channel
  //
  // @param  : void
  // @return : ClientError
  //
  // An empty channel reference falls back to the default channel. Without
  // Prepare, portions are committed to the backend default destination.
  ClientError<TransferError::Value> Prepare();

  // Run the upload
  //
  // @param  : source
  // @return : ClientError
  //
  // Blocking. The source is destroyed on failure. A stop request is not an
  // error, the session ends as Cancelled and completeUpload is not emitted.
  ClientError<TransferError::Value> Execute(
      const boost::shared_ptr<CS::Data::InputSource> &source);

  // Request to stop, destroys the source and emits stopped
  void Stop();

 public:
  void SetPortionUploadedCallback(const PortionUploadedCallback &callback) {
    m_portionUploaded = callback;
  }
  void SetCompleteUploadCallback(const CompleteUploadCallback &callback) {
    m_completeUpload = callback;
  }
  void SetStoppedCallback(const StoppedCallback &callback) {
    m_stopped = callback;
  }

  const PartLedger &GetLedger() const { return m_ledger; }
  const std::string &GetChannelRef() const { return m_channelRef; }
  const std::string &GetFileName() const { return m_fileName; }
  const std::string &GetMime() const { return m_mime; }
  const UploadConfigure &GetConfigure() const { return m_config; }
  bool IsPrepared() const { return m_prepared; }

 private:
  // Account one chunk, buffer or send it
  ClientError<TransferError::Value> CommitChunk(const std::vector<char> &chunk,
                                                bool lastChunk);

  // Send the buffered pages and stop buffering
  ClientError<TransferError::Value> FlushAccumulator();

  // Send one page of the current portion, finalize it if it is full or last
  ClientError<TransferError::Value> SendPage(const std::vector<char> &page,
                                             bool lastChunk);

  // Commit a portion after its last page
  ClientError<TransferError::Value> FinalizePortion(
      const boost::shared_ptr<FilePortion> &portion);

  // Handle the end of stream with nothing left to send
  ClientError<TransferError::Value> FinishPortions();

  boost::shared_ptr<FilePortion> OpenPortion();
  void DestroySource();
  ClientError<TransferError::Value> FinishUpload(
      const ClientError<TransferError::Value> &err);

 private:
  boost::shared_ptr<Client> m_client;
  std::string m_channelRef;
  std::string m_fileName;
  std::string m_mime;
  UploadConfigure m_config;
  int m_maxUploadParts;

  Channel m_channel;
  bool m_prepared;
  bool m_interrupted;  // a stop request cut the run short

  PartLedger m_ledger;
  CS::Data::Buffer m_accumulator;  // null once buffering is over

  boost::shared_ptr<CS::Data::InputSource> m_source;
  mutable boost::mutex m_sourceLock;

  PortionUploadedCallback m_portionUploaded;
  CompleteUploadCallback m_completeUpload;
  StoppedCallback m_stopped;
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_UPLOADER_H_
