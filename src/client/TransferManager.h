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

#ifndef CHANSTOR_CLIENT_TRANSFERMANAGER_H_
#define CHANSTOR_CLIENT_TRANSFERMANAGER_H_

#include <stddef.h>

#include <map>
#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ClientConfiguration.h"
#include "client/TransferError.h"

namespace CS {

namespace Data {
class InputSource;
class OutputSink;
}  // namespace Data

namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace Client {

class Client;
class Downloader;
class TransferSession;
class Uploader;

struct TransferManagerConfigure {
  // Maximum number of sessions to run in parallel
  size_t m_maxParallelTransfers;

  explicit TransferManagerConfigure(
      size_t maxParallelTransfers =
          ClientConfiguration::Instance().GetParallelTransfers())
      : m_maxParallelTransfers(maxParallelTransfers) {}
};

typedef boost::unique_future<ClientError<TransferError::Value> >
    TransferFuture;

//
// TransferManager
//
// Runs transfer sessions on a worker pool. Sessions are tracked by id while
// queued or running, so they can be stopped from any thread.
//
// Sessions still queued when the manager is destroyed never run, the get of
// their future throws boost::broken_promise.
//
class TransferManager : private boost::noncopyable {
 public:
  explicit TransferManager(
      const boost::shared_ptr<Client> &client,
      const TransferManagerConfigure &config = TransferManagerConfigure());

  ~TransferManager();

 public:
  // Download asynchronously
  //
  // @param  : downloader, sink
  // @return : future of the result of Downloader::Execute
  TransferFuture DownloadFile(
      const boost::shared_ptr<Downloader> &downloader,
      const boost::shared_ptr<CS::Data::OutputSink> &sink);

  // Upload asynchronously
  //
  // @param  : uploader, source
  // @return : future of the result of Uploader::Execute
  //
  // The uploader uses its own client, prepare it before if a channel is
  // needed.
  TransferFuture UploadFile(
      const boost::shared_ptr<Uploader> &uploader,
      const boost::shared_ptr<CS::Data::InputSource> &source);

  // Stop a tracked session
  //
  // @param  : session id
  // @return : false if no such session is queued or running
  bool Cancel(const std::string &sessionId);

  // Stop all tracked sessions
  void StopAll();

  boost::shared_ptr<TransferSession> GetSession(
      const std::string &sessionId) const;
  size_t GetSessionCount() const;

  size_t GetMaxParallelTransfers() const {
    return m_configure.m_maxParallelTransfers;
  }
  const boost::shared_ptr<Client> &GetClient() const { return m_client; }

 private:
  ClientError<TransferError::Value> RunDownload(
      const boost::shared_ptr<Downloader> &downloader,
      const boost::shared_ptr<CS::Data::OutputSink> &sink);
  ClientError<TransferError::Value> RunUpload(
      const boost::shared_ptr<Uploader> &uploader,
      const boost::shared_ptr<CS::Data::InputSource> &source);

  void Track(const boost::shared_ptr<TransferSession> &session);
  void Untrack(const std::string &sessionId);

 private:
  typedef std::map<std::string, boost::shared_ptr<TransferSession> >
      SessionMap;

  TransferManagerConfigure m_configure;
  boost::shared_ptr<Client> m_client;
  boost::shared_ptr<CS::Threading::ThreadPool> m_executor;

  SessionMap m_sessions;
  mutable boost::mutex m_sessionsLock;
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_TRANSFERMANAGER_H_
