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

#include "client/Downloader.h"

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/Client.h"
#include "client/ClientConfiguration.h"
#include "client/PageStreamer.h"
#include "client/RangeResolver.h"
#include "client/Utils.h"
#include "data/Sink.h"

namespace CS {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using CS::Data::OutputSink;
using CS::Data::SegmentSink;
using CS::StringUtils::FormatRange;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
DownloadConfigure::DownloadConfigure()
    : m_pageSize(ClientConfiguration::Instance().GetDownloadPageSize()) {}

// --------------------------------------------------------------------------
Downloader::Downloader(const string &sessionId, const vector<FilePart> &parts,
                       uint64_t start, uint64_t end,
                       const DownloadConfigure &config)
    : TransferSession(sessionId, TransferDirection::Download),
      m_parts(parts),
      m_start(start),
      m_end(end),
      m_totalSize(Utils::GetTotalSize(parts)),
      m_config(config) {}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Downloader::Execute(
    const shared_ptr<Client> &client, const shared_ptr<OutputSink> &sink) {
  if (!client || !sink) {
    Error(LogPrefix() + "download without client or sink");
    return MakeTransferError(TransferError::PARAMETER_MISSING, "Execute",
                             "null client or sink");
  }
  if (!Begin()) {
    Error(LogPrefix() + "download executed more than once");
    return MakeTransferError(TransferError::ILLEGAL_STATE, "Execute",
                             "session " + GetSessionId() + " already executed");
  }

  Info(LogPrefix() + "start download " + FormatRange(m_start, m_end) +
       " of " + to_string(m_totalSize) + " bytes in " +
       to_string(m_parts.size()) + " parts");

  ResolveRangeOutcome outcome =
      ResolveRange(m_parts, ByteRange(m_start, m_end));
  if (!outcome.IsSuccess()) {
    Error(LogPrefix() + GetMessageForTransferError(outcome.GetError()));
    return FinishDownload(sink.get(), outcome.GetError());
  }

  const vector<ResolvedPartRange> &ranges = outcome.GetResult();
  uint64_t expected = 0;
  for (vector<ResolvedPartRange>::const_iterator it = ranges.begin();
       it != ranges.end(); ++it) {
    expected += it->GetSize();
  }

  for (vector<ResolvedPartRange>::const_iterator it = ranges.begin();
       it != ranges.end(); ++it) {
    if (IsAborted()) {
      Info(LogPrefix() + "download aborted before part " +
           to_string(it->m_partIndex));
      break;
    }
    if (it->GetSize() == 0) {
      continue;
    }

    ClientError<TransferError::Value> err =
        DownloadPart(client.get(), *it, sink.get());
    if (!IsGoodTransferError(err)) {
      Error(LogPrefix() + "part " + to_string(it->m_partIndex) + " " +
            Utils::FormatFilePart(it->m_part) + ": " +
            GetMessageForTransferError(err));
      return FinishDownload(sink.get(), err);
    }
  }

  return FinishDownload(sink.get(), GoodTransferError(),
                        GetBytesTransferred() < expected);
}

// --------------------------------------------------------------------------
void Downloader::Stop() {
  SetAborted();
  Warning(LogPrefix() + "download stop requested");
}

// --------------------------------------------------------------------------
DownloadRange Downloader::GetRange() const {
  return DownloadRange(m_start, m_end, m_totalSize);
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Downloader::DownloadPart(
    Client *client, const ResolvedPartRange &range, OutputSink *sink) {
  DebugInfo(LogPrefix() + "download part " + to_string(range.m_partIndex) +
            " " + FormatRange(range.m_startOffsetInPart,
                              range.m_endOffsetInPart - 1));

  Channel channel;
  ClientError<TransferError::Value> err =
      client->GetChannel(range.m_part.m_channel, &channel);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  Message message;
  err = client->GetMessage(channel, range.m_part.m_message, &message);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  SegmentSink segment(sink);
  PageStreamer streamer(client, m_config.m_pageSize, GetSessionId());
  err = streamer.Stream(
      message.m_document, range.m_startOffsetInPart, range.m_endOffsetInPart,
      &segment,
      boost::bind(boost::type<bool>(), &TransferSession::ShouldContinue, this));
  UpdateBytesTransferred(segment.GetBytesWritten());
  return err;
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> Downloader::FinishDownload(
    OutputSink *sink, const ClientError<TransferError::Value> &err,
    bool interrupted) {
  sink->Close();
  Finish(err, interrupted);
  if (IsGoodTransferError(err)) {
    Info(LogPrefix() + "download " + GetTransferStatusName(GetStatus()) +
         ", " + to_string(GetBytesTransferred()) + " bytes");
  }
  return err;
}

}  // namespace Client
}  // namespace CS
