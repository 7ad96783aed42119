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

#include "client/TransferManager.h"

#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/foreach.hpp"
#include "boost/function.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/ThreadPool.h"
#include "client/Downloader.h"
#include "client/TransferSession.h"
#include "client/Uploader.h"
#include "data/Sink.h"
#include "data/Source.h"

namespace CS {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using CS::Data::InputSource;
using CS::Data::OutputSink;
using CS::Threading::ThreadPool;
using std::string;

typedef boost::function<ClientError<TransferError::Value>()> TransferTask;

// --------------------------------------------------------------------------
TransferManager::TransferManager(const shared_ptr<Client> &client,
                                 const TransferManagerConfigure &config)
    : m_configure(config), m_client(client) {
  if (m_configure.m_maxParallelTransfers == 0) {
    m_configure.m_maxParallelTransfers = 1;
  }
  m_executor = shared_ptr<ThreadPool>(
      new ThreadPool(m_configure.m_maxParallelTransfers));
}

// --------------------------------------------------------------------------
TransferManager::~TransferManager() {
  StopAll();
  // join workers before the sessions map goes away
  m_executor.reset();
}

// --------------------------------------------------------------------------
TransferFuture TransferManager::DownloadFile(
    const shared_ptr<Downloader> &downloader,
    const shared_ptr<OutputSink> &sink) {
  Track(downloader);
  TransferTask task = boost::bind(&TransferManager::RunDownload, this,
                                  downloader, sink);
  return m_executor->SubmitCallable(task);
}

// --------------------------------------------------------------------------
TransferFuture TransferManager::UploadFile(
    const shared_ptr<Uploader> &uploader,
    const shared_ptr<InputSource> &source) {
  Track(uploader);
  TransferTask task =
      boost::bind(&TransferManager::RunUpload, this, uploader, source);
  return m_executor->SubmitCallable(task);
}

// --------------------------------------------------------------------------
bool TransferManager::Cancel(const string &sessionId) {
  shared_ptr<TransferSession> session = GetSession(sessionId);
  if (!session) {
    DebugWarning("No transfer session " + sessionId + " to cancel");
    return false;
  }
  session->Stop();
  return true;
}

// --------------------------------------------------------------------------
void TransferManager::StopAll() {
  SessionMap sessions;
  {
    lock_guard<mutex> locker(m_sessionsLock);
    sessions = m_sessions;
  }
  BOOST_FOREACH(SessionMap::value_type &entry, sessions) {
    entry.second->Stop();
  }
}

// --------------------------------------------------------------------------
shared_ptr<TransferSession> TransferManager::GetSession(
    const string &sessionId) const {
  lock_guard<mutex> locker(m_sessionsLock);
  SessionMap::const_iterator it = m_sessions.find(sessionId);
  return it != m_sessions.end() ? it->second : shared_ptr<TransferSession>();
}

// --------------------------------------------------------------------------
size_t TransferManager::GetSessionCount() const {
  lock_guard<mutex> locker(m_sessionsLock);
  return m_sessions.size();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> TransferManager::RunDownload(
    const shared_ptr<Downloader> &downloader,
    const shared_ptr<OutputSink> &sink) {
  ClientError<TransferError::Value> err = downloader->Execute(m_client, sink);
  Untrack(downloader->GetSessionId());
  return err;
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> TransferManager::RunUpload(
    const shared_ptr<Uploader> &uploader,
    const shared_ptr<InputSource> &source) {
  ClientError<TransferError::Value> err = uploader->Execute(source);
  Untrack(uploader->GetSessionId());
  return err;
}

// --------------------------------------------------------------------------
void TransferManager::Track(const shared_ptr<TransferSession> &session) {
  lock_guard<mutex> locker(m_sessionsLock);
  std::pair<SessionMap::iterator, bool> res =
      m_sessions.insert(std::make_pair(session->GetSessionId(), session));
  if (!res.second) {
    Warning("Transfer session " + session->GetSessionId() +
            " is already tracked");
  }
}

// --------------------------------------------------------------------------
void TransferManager::Untrack(const string &sessionId) {
  lock_guard<mutex> locker(m_sessionsLock);
  m_sessions.erase(sessionId);
}

}  // namespace Client
}  // namespace CS
