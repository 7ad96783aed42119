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

#include "data/Source.h"

#include <istream>

#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

namespace CS {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;

// --------------------------------------------------------------------------
StreamSource::StreamSource(const shared_ptr<std::istream> &stream)
    : m_stream(stream), m_bytesRead(0), m_destroyed(false) {}

// --------------------------------------------------------------------------
bool StreamSource::Read(char *buf, size_t size, size_t *readSize) {
  lock_guard<mutex> lock(m_lock);
  if (readSize != NULL) {
    *readSize = 0;
  }
  if (m_destroyed || !m_stream || buf == NULL || readSize == NULL) {
    return false;
  }
  if (size == 0 || m_stream->eof()) {
    return true;
  }

  m_stream->read(buf, size);
  if (m_stream->bad()) {
    return false;
  }
  *readSize = static_cast<size_t>(m_stream->gcount());
  m_bytesRead += *readSize;
  return true;
}

// --------------------------------------------------------------------------
void StreamSource::Destroy() {
  lock_guard<mutex> lock(m_lock);
  m_destroyed = true;
  m_stream.reset();
}

// --------------------------------------------------------------------------
bool StreamSource::IsDestroyed() const {
  lock_guard<mutex> lock(m_lock);
  return m_destroyed;
}

// --------------------------------------------------------------------------
uint64_t StreamSource::GetBytesRead() const {
  lock_guard<mutex> lock(m_lock);
  return m_bytesRead;
}

}  // namespace Data
}  // namespace CS
