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

#include "data/Sink.h"

#include <ostream>

#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

namespace CS {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;

// --------------------------------------------------------------------------
StreamSink::StreamSink(const shared_ptr<std::ostream> &stream)
    : m_stream(stream), m_bytesWritten(0), m_closeCount(0), m_closed(false) {}

// --------------------------------------------------------------------------
bool StreamSink::Write(const char *data, size_t size) {
  lock_guard<mutex> lock(m_lock);
  if (m_closed || !m_stream) {
    return false;
  }
  if (size == 0) {
    return true;
  }
  m_stream->write(data, size);
  if (!m_stream->good()) {
    return false;
  }
  m_bytesWritten += size;
  return true;
}

// --------------------------------------------------------------------------
void StreamSink::Close() {
  lock_guard<mutex> lock(m_lock);
  ++m_closeCount;
  if (!m_closed) {
    m_closed = true;
    if (m_stream) {
      m_stream->flush();
    }
  }
}

// --------------------------------------------------------------------------
bool StreamSink::IsClosed() const {
  lock_guard<mutex> lock(m_lock);
  return m_closed;
}

// --------------------------------------------------------------------------
uint64_t StreamSink::GetBytesWritten() const {
  lock_guard<mutex> lock(m_lock);
  return m_bytesWritten;
}

// --------------------------------------------------------------------------
int StreamSink::GetCloseCount() const {
  lock_guard<mutex> lock(m_lock);
  return m_closeCount;
}

// --------------------------------------------------------------------------
SegmentSink::SegmentSink(OutputSink *target)
    : m_target(target), m_bytesWritten(0), m_closed(false) {}

// --------------------------------------------------------------------------
bool SegmentSink::Write(const char *data, size_t size) {
  if (m_closed || m_target == NULL) {
    return false;
  }
  if (!m_target->Write(data, size)) {
    return false;
  }
  m_bytesWritten += size;
  return true;
}

}  // namespace Data
}  // namespace CS
