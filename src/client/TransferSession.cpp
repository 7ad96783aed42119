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

#include "client/TransferSession.h"

#include <string>

#include "boost/bind.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

namespace CS {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::unique_lock;
using std::string;

namespace {

bool IsFinishedStatus(TransferStatus::Value status) {
  return !(status == TransferStatus::NotStarted ||
           status == TransferStatus::InProgress);
}

}  // namespace

// --------------------------------------------------------------------------
string GetTransferStatusName(TransferStatus::Value status) {
  switch (status) {
    case TransferStatus::NotStarted:
      return "NotStarted";
    case TransferStatus::InProgress:
      return "InProgress";
    case TransferStatus::Cancelled:
      return "Cancelled";
    case TransferStatus::Failed:
      return "Failed";
    case TransferStatus::Completed:
      return "Completed";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
TransferSession::TransferSession(const string &sessionId,
                                 TransferDirection::Value direction)
    : m_sessionId(sessionId),
      m_direction(direction),
      m_aborted(false),
      m_status(TransferStatus::NotStarted),
      m_error(TransferError::GOOD),
      m_bytesTransferred(0) {}

// --------------------------------------------------------------------------
bool TransferSession::DoneTransfer() const {
  lock_guard<mutex> locker(m_statusLock);
  return IsFinishedStatus(m_status);
}

// --------------------------------------------------------------------------
void TransferSession::WaitUntilFinished() const {
  unique_lock<mutex> lock(m_statusLock);
  m_waitUntilFinishSignal.wait(
      lock,
      boost::bind(boost::type<bool>(), &TransferSession::Predicate, this));
}

// --------------------------------------------------------------------------
bool TransferSession::Begin() {
  lock_guard<mutex> locker(m_statusLock);
  if (m_status != TransferStatus::NotStarted) {
    return false;
  }
  m_status = TransferStatus::InProgress;
  return true;
}

// --------------------------------------------------------------------------
void TransferSession::Finish(const ClientError<TransferError::Value> &error,
                             bool interrupted) {
  TransferStatus::Value status = TransferStatus::Completed;
  if (!IsGoodTransferError(error)) {
    status = TransferStatus::Failed;
  } else if (interrupted) {
    status = TransferStatus::Cancelled;
  }

  {
    lock_guard<mutex> locker(m_statusLock);
    m_error = error;
    m_status = status;
  }
  m_waitUntilFinishSignal.notify_all();
}

// --------------------------------------------------------------------------
bool TransferSession::Predicate() const { return IsFinishedStatus(m_status); }

}  // namespace Client
}  // namespace CS
