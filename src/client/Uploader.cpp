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

#include "client/Uploader.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/Client.h"
#include "client/ClientConfiguration.h"
#include "client/Utils.h"
#include "data/ChunkSplitter.h"
#include "data/MimeTypes.h"
#include "data/Source.h"

namespace CS {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using CS::Data::Buffer;
using CS::Data::ChunkSplitter;
using CS::Data::ChunkStatus;
using CS::Data::InputSource;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
UploadConfigure::UploadConfigure()
    : m_pageSize(ClientConfiguration::Instance().GetUploadPageSize()),
      m_minBufferSize(ClientConfiguration::Instance().GetMinBufferSize()),
      m_defaultChannel(ClientConfiguration::Instance().GetDefaultChannel()) {}

// --------------------------------------------------------------------------
Uploader::Uploader(const string &sessionId, const shared_ptr<Client> &client,
                   const string &channelRef, const string &fileName,
                   const UploadConfigure &config)
    : TransferSession(sessionId, TransferDirection::Upload),
      m_client(client),
      m_channelRef(channelRef),
      m_fileName(fileName),
      m_mime(CS::Data::LookupMimeType(fileName)),
      m_config(config),
      m_maxUploadParts(1),
      m_channel(),
      m_prepared(false),
      m_interrupted(false) {
  if (m_config.m_pageSize == 0) {
    m_config.m_pageSize = 1;
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Uploader::Prepare() {
  if (!m_client) {
    return MakeTransferError(TransferError::PARAMETER_MISSING, "Prepare",
                             "null client");
  }
  if (m_channelRef.empty()) {
    m_channelRef = m_config.m_defaultChannel;
    DebugInfo(LogPrefix() + "no channel given, use " + m_channelRef);
  }
  if (m_channelRef.empty()) {
    return MakeTransferError(TransferError::PARAMETER_MISSING, "Prepare",
                             "no channel to upload to");
  }

  ClientError<TransferError::Value> err =
      m_client->GetChannel(m_channelRef, &m_channel);
  if (!IsGoodTransferError(err)) {
    Error(LogPrefix() + "fail to resolve channel " + m_channelRef + ": " +
          GetMessageForTransferError(err));
    return err;
  }
  m_prepared = true;
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Uploader::Execute(
    const shared_ptr<InputSource> &source) {
  if (!m_client || !source) {
    Error(LogPrefix() + "upload without client or source");
    return MakeTransferError(TransferError::PARAMETER_MISSING, "Execute",
                             "null client or source");
  }
  if (!Begin()) {
    Error(LogPrefix() + "upload executed more than once");
    return MakeTransferError(TransferError::ILLEGAL_STATE, "Execute",
                             "session " + GetSessionId() + " already executed");
  }
  {
    lock_guard<mutex> locker(m_sourceLock);
    m_source = source;
  }
  if (IsAborted()) {
    // stopped before the source was handed over
    DestroySource();
  }

  m_maxUploadParts = std::max(m_client->GetMaxUploadParts(), 1);
  // buffered pages must fit in the first portion
  uint64_t portionLimit =
      static_cast<uint64_t>(m_maxUploadParts) * m_config.m_pageSize;
  if (m_config.m_minBufferSize >= portionLimit) {
    Warning(LogPrefix() + "min buffer size " +
            to_string(m_config.m_minBufferSize) + " is not below " +
            to_string(portionLimit) + ", clamp it");
    m_config.m_minBufferSize = portionLimit - 1;
  }

  Info(LogPrefix() + "start upload " + m_fileName + " [mime=" + m_mime +
       "] to " + (m_prepared ? m_channelRef : string("default channel")));

  m_accumulator.reset(new vector<char>());
  OpenPortion();

  ChunkSplitter splitter(source, static_cast<size_t>(m_config.m_pageSize));
  vector<char> chunk;
  bool done = false;
  while (!done) {
    if (IsAborted()) {
      Info(LogPrefix() + "upload aborted after " +
           to_string(splitter.GetBytesRead()) + " bytes");
      m_interrupted = true;
      break;
    }

    ClientError<TransferError::Value> err = GoodTransferError();
    ChunkStatus::Value status = splitter.Next(&chunk);
    switch (status) {
      case ChunkStatus::Page:
        err = CommitChunk(chunk, false);
        break;
      case ChunkStatus::Tail:
        err = CommitChunk(chunk, true);
        done = true;
        break;
      case ChunkStatus::End:
        err = FinishPortions();
        done = true;
        break;
      case ChunkStatus::Error:
      default:
        if (IsAborted()) {
          // source destroyed by Stop
          m_interrupted = true;
          done = true;
        } else {
          err = MakeTransferError(
              TransferError::SOURCE_READ_ERROR, "Read",
              "after " + to_string(splitter.GetBytesRead()) + " bytes");
        }
        break;
    }

    if (!IsGoodTransferError(err)) {
      Error(LogPrefix() + GetMessageForTransferError(err));
      return FinishUpload(err);
    }
  }

  if (!m_interrupted) {
    Info(LogPrefix() + "upload " + m_fileName + " done, " +
         to_string(m_ledger.GetTotalSize()) + " bytes in " +
         to_string(m_ledger.GetCount()) + " portions");
    if (m_completeUpload) {
      m_completeUpload(m_ledger, m_channelRef);
    }
  }
  return FinishUpload(GoodTransferError());
}

// --------------------------------------------------------------------------
void Uploader::Stop() {
  SetAborted();
  Warning(LogPrefix() + "upload stop requested");
  DestroySource();
  if (m_stopped) {
    m_stopped();
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Uploader::CommitChunk(
    const vector<char> &chunk, bool lastChunk) {
  shared_ptr<FilePortion> portion = m_ledger.GetCurrent();
  portion->m_size += chunk.size();

  if (m_accumulator) {
    if (m_ledger.GetTotalSize() <= m_config.m_minBufferSize) {
      m_accumulator->insert(m_accumulator->end(), chunk.begin(), chunk.end());
      return lastChunk ? FinalizePortion(portion) : GoodTransferError();
    }
    ClientError<TransferError::Value> err = FlushAccumulator();
    if (!IsGoodTransferError(err)) {
      return err;
    }
  }
  return SendPage(chunk, lastChunk);
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Uploader::FlushAccumulator() {
  Buffer buffered = m_accumulator;
  m_accumulator.reset();
  DebugInfo(LogPrefix() + "buffer threshold exceeded, flush " +
            to_string(buffered->size()) + " buffered bytes");

  size_t pageSize = static_cast<size_t>(m_config.m_pageSize);
  for (size_t offset = 0; offset < buffered->size(); offset += pageSize) {
    if (IsAborted()) {
      Info(LogPrefix() + "upload aborted, drop " +
           to_string(buffered->size() - offset) + " buffered bytes");
      m_interrupted = true;
      return GoodTransferError();
    }
    size_t len = std::min(pageSize, buffered->size() - offset);
    vector<char> page(buffered->begin() + offset,
                      buffered->begin() + offset + len);
    ClientError<TransferError::Value> err = SendPage(page, false);
    if (!IsGoodTransferError(err)) {
      return err;
    }
  }
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Uploader::SendPage(const vector<char> &page,
                                                     bool lastChunk) {
  if (IsAborted()) {
    m_interrupted = true;
    return GoodTransferError();
  }

  shared_ptr<FilePortion> portion = m_ledger.GetCurrent();
  int pageIndex = ++portion->m_currentPageIndex;
  bool lastPage = lastChunk;
  if (pageIndex + 1 == m_maxUploadParts) {
    lastPage = true;
    if (!lastChunk) {
      OpenPortion();
    }
  }

  int totalPages = -1;
  if (lastPage) {
    totalPages = static_cast<int>(
        (portion->m_size + m_config.m_pageSize - 1) / m_config.m_pageSize);
  }

  ClientError<TransferError::Value> err = m_client->SendFileParts(
      portion->m_fileId, pageIndex, totalPages, page);
  if (!IsGoodTransferError(err)) {
    return MakeTransferError(TransferError::BACKEND_PUSH_ERROR,
                             "SendFileParts",
                             "file " + to_string(portion->m_fileId) +
                                 " page " + to_string(pageIndex) + ": " +
                                 GetMessageForTransferError(err));
  }
  UpdateBytesTransferred(page.size());

  return lastPage ? FinalizePortion(portion) : GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Uploader::FinalizePortion(
    const shared_ptr<FilePortion> &portion) {
  if (IsAborted()) {
    m_interrupted = true;
    Warning(LogPrefix() + "upload aborted, portion " +
            to_string(portion->m_index) + " is not committed");
    return GoodTransferError();
  }

  if (m_accumulator) {
    portion->m_bufferedContent = m_accumulator;
    portion->m_finalized = true;
    DebugInfo(LogPrefix() + "keep " + to_string(m_accumulator->size()) +
              " bytes inline");
  } else {
    string fileName = m_fileName;
    if (m_ledger.GetCount() > 1) {
      fileName += "." + CS::StringUtils::ZeroPad(portion->m_index + 1, 3);
    }

    Message message;
    ClientError<TransferError::Value> err = m_client->MoveFileToChat(
        m_prepared ? &m_channel : NULL,
        UploadedFile(portion->m_fileId, portion->GetPageCount(), fileName,
                     portion->m_mime),
        &message);
    if (!IsGoodTransferError(err)) {
      return MakeTransferError(TransferError::BACKEND_COMMIT_ERROR,
                               "MoveFileToChat",
                               fileName + ": " +
                                   GetMessageForTransferError(err));
    }

    portion->m_messageId = message.m_id;
    portion->m_hasMessageId = true;
    portion->m_fileId = message.m_document.m_id;
    portion->m_fileName = message.m_fileName.empty() ? fileName
                                                     : message.m_fileName;
    portion->m_finalized = true;
    Info(LogPrefix() + "portion " + to_string(portion->m_index) +
         " committed as message " + to_string(message.m_id) + " [" +
         portion->m_fileName + ", " + to_string(portion->m_size) + " bytes]");
  }

  if (m_portionUploaded) {
    m_portionUploaded(portion);
  }
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Uploader::FinishPortions() {
  shared_ptr<FilePortion> portion = m_ledger.GetCurrent();
  if (portion->m_size == 0 && m_ledger.GetCount() > 1) {
    // opened by a full portion just before the input ended
    m_ledger.RemoveCurrent();
    return GoodTransferError();
  }
  return FinalizePortion(portion);
}

// --------------------------------------------------------------------------
shared_ptr<FilePortion> Uploader::OpenPortion() {
  shared_ptr<FilePortion> portion =
      m_ledger.NewPortion(Utils::GenerateFileId(), m_mime, m_fileName);
  DebugInfo(LogPrefix() + "open portion " + to_string(portion->m_index) +
            " [file id=" + to_string(portion->m_fileId) + "]");
  return portion;
}

// --------------------------------------------------------------------------
void Uploader::DestroySource() {
  lock_guard<mutex> locker(m_sourceLock);
  if (m_source) {
    m_source->Destroy();
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Uploader::FinishUpload(
    const ClientError<TransferError::Value> &err) {
  if (!IsGoodTransferError(err)) {
    DestroySource();
  }
  Finish(err, m_interrupted);
  return err;
}

}  // namespace Client
}  // namespace CS
