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

#include "client/PageStreamer.h"

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/Client.h"
#include "data/Sink.h"

namespace CS {

namespace Client {

using boost::to_string;
using CS::Data::OutputSink;
using CS::StringUtils::FormatRange;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
PageStreamer::PageStreamer(Client *client, uint64_t pageSize,
                           const string &sessionId)
    : m_client(client),
      m_pageSize(pageSize > 0 ? pageSize : 1),
      m_sessionId(sessionId),
      m_pagesFetched(0) {}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> PageStreamer::Stream(
    const Document &document, uint64_t start, uint64_t end, OutputSink *sink,
    const ContinuePredicate &shouldContinue) {
  if (m_client == NULL || sink == NULL) {
    if (sink != NULL) {
      sink->Close();
    }
    return MakeTransferError(TransferError::PARAMETER_MISSING, "Stream",
                             "null client or sink");
  }
  if (start >= end) {
    sink->Close();
    return GoodTransferError();
  }

  DebugInfo(LogPrefix() + "stream document " + to_string(document.m_id) +
            " " + FormatRange(start, end - 1));

  uint64_t offset = start - start % m_pageSize;  // page aligned
  bool first = true;
  bool needStop = false;
  vector<char> page;

  while (true) {
    page.clear();
    ClientError<TransferError::Value> err =
        m_client->GetFile(document, offset, m_pageSize, &page);
    if (!IsGoodTransferError(err)) {
      sink->Close();
      return MakeTransferError(TransferError::BACKEND_FETCH_ERROR, "GetFile",
                               "offset " + to_string(offset) + ": " +
                                   GetMessageForTransferError(err));
    }
    ++m_pagesFetched;

    uint64_t fetched = page.size() < m_pageSize ? page.size() : m_pageSize;
    uint64_t firstByte = 0;
    uint64_t lastByte = fetched;
    if (first) {
      firstByte = start - offset;
      first = false;
    }
    if (offset + fetched >= end) {
      lastByte = end - offset;
      needStop = true;
    }

    if (!needStop && fetched < m_pageSize) {
      sink->Close();
      return MakeTransferError(
          TransferError::BACKEND_FETCH_ERROR, "GetFile",
          "document " + to_string(document.m_id) + " ends at " +
              to_string(offset + fetched) + " before " + to_string(end));
    }

    if (lastByte > firstByte &&
        !sink->Write(&page[firstByte], lastByte - firstByte)) {
      sink->Close();
      return MakeTransferError(TransferError::SINK_WRITE_ERROR, "Write",
                               "offset " + to_string(offset + firstByte));
    }

    offset += m_pageSize;
    if (needStop) {
      break;
    }
    if (shouldContinue && !shouldContinue()) {
      DebugInfo(LogPrefix() + "stop streaming at offset " + to_string(offset));
      break;
    }
  }

  sink->Close();
  return GoodTransferError();
}

// --------------------------------------------------------------------------
string PageStreamer::LogPrefix() const {
  return m_sessionId.empty() ? string() : "[" + m_sessionId + "] ";
}

}  // namespace Client
}  // namespace CS
