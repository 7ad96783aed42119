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

#ifndef CHANSTOR_CLIENT_PAGESTREAMER_H_
#define CHANSTOR_CLIENT_PAGESTREAMER_H_

#include <stdint.h>

#include <string>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"

#include "client/BackendTypes.h"
#include "client/TransferError.h"

namespace CS {

namespace Data {
class OutputSink;
}  // namespace Data

namespace Client {

class Client;

// Return false to stop streaming after the current page
typedef boost::function<bool()> ContinuePredicate;

//
// Streams a window of one document page by page.
//
// Pages are fetched in order starting from the page holding the first byte.
// The first and last page are trimmed to the window, so the sink receives
// exactly the bytes of the window.
//
class PageStreamer : private boost::noncopyable {
 public:
  PageStreamer(Client *client, uint64_t pageSize,
               const std::string &sessionId = std::string());
  ~PageStreamer() {}

 public:
  // Stream the window [start, end) of document into sink
  //
  // @param  : document, start, end (exclusive), sink, continue predicate
  // @return : ClientError
  //
  // The sink is closed on return in all cases. A failed fetch, or a page
  // shorter than the page size before end is reached, is a
  // BACKEND_FETCH_ERROR. Nothing is retried.
  ClientError<TransferError::Value> Stream(
      const Document &document, uint64_t start, uint64_t end,
      CS::Data::OutputSink *sink, const ContinuePredicate &shouldContinue);

  uint64_t GetPageSize() const { return m_pageSize; }
  int GetPagesFetched() const { return m_pagesFetched; }

 private:
  std::string LogPrefix() const;

 private:
  Client *m_client;
  uint64_t m_pageSize;
  std::string m_sessionId;
  int m_pagesFetched;
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_PAGESTREAMER_H_
