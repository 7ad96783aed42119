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

#ifndef CHANSTOR_CLIENT_TRANSFERSESSION_H_
#define CHANSTOR_CLIENT_TRANSFERSESSION_H_

#include <stdint.h>  // for uint64_t

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "client/TransferError.h"

namespace CS {

namespace Client {

struct TransferStatus {
  enum Value {
    NotStarted,  // session has not been executed
    InProgress,  // session is running
    Cancelled,   // session was stopped before all data was transferred
    Failed,      // session ended with an error
    Completed    // all data was transferred
  };
};

struct TransferDirection {
  enum Value { Upload, Download };
};

std::string GetTransferStatusName(TransferStatus::Value status);

//
// State shared by download and upload sessions.
//
// A session is executed once. Stop may be called from any thread, it only
// sets the abort flag which the running session checks between backend calls.
//
class TransferSession : private boost::noncopyable {
 public:
  TransferSession(const std::string &sessionId,
                  TransferDirection::Value direction);
  virtual ~TransferSession() {}

 public:
  // Request the session to stop
  virtual void Stop() = 0;

 public:
  const std::string &GetSessionId() const { return m_sessionId; }
  TransferDirection::Value GetDirection() const { return m_direction; }

  bool IsAborted() const {
    boost::lock_guard<boost::mutex> locker(m_abortLock);
    return m_aborted;
  }
  bool ShouldContinue() const { return !IsAborted(); }

  TransferStatus::Value GetStatus() const {
    boost::lock_guard<boost::mutex> locker(m_statusLock);
    return m_status;
  }
  ClientError<TransferError::Value> GetError() const {
    boost::lock_guard<boost::mutex> locker(m_statusLock);
    return m_error;
  }
  uint64_t GetBytesTransferred() const {
    boost::lock_guard<boost::mutex> locker(m_bytesTransferredLock);
    return m_bytesTransferred;
  }

  bool DoneTransfer() const;
  void WaitUntilFinished() const;

 protected:
  // Move from NotStarted to InProgress
  //
  // @param  : void
  // @return : false if the session has been executed before
  bool Begin();

  // Record the result and move to a finished status
  //
  // @param  : error, whether the run stopped before all data was transferred
  // @return : void
  //
  // A stop request arriving after the last byte does not turn a delivered
  // transfer into Cancelled.
  void Finish(const ClientError<TransferError::Value> &error,
              bool interrupted);

  void SetAborted() {
    boost::lock_guard<boost::mutex> locker(m_abortLock);
    m_aborted = true;
  }
  void UpdateBytesTransferred(uint64_t amount) {
    boost::lock_guard<boost::mutex> locker(m_bytesTransferredLock);
    m_bytesTransferred += amount;
  }

  // "[session id] "
  std::string LogPrefix() const { return "[" + m_sessionId + "] "; }

 private:
  bool Predicate() const;

 private:
  std::string m_sessionId;
  TransferDirection::Value m_direction;

  mutable boost::mutex m_abortLock;
  bool m_aborted;

  mutable boost::mutex m_statusLock;
  TransferStatus::Value m_status;
  ClientError<TransferError::Value> m_error;
  mutable boost::condition_variable m_waitUntilFinishSignal;

  mutable boost::mutex m_bytesTransferredLock;
  uint64_t m_bytesTransferred;
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_TRANSFERSESSION_H_
