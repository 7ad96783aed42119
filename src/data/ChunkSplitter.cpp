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

#include "data/ChunkSplitter.h"

#include <vector>

#include "boost/shared_ptr.hpp"

#include "data/Source.h"

namespace CS {

namespace Data {

using boost::shared_ptr;
using std::vector;

// --------------------------------------------------------------------------
ChunkSplitter::ChunkSplitter(const shared_ptr<InputSource> &source,
                             size_t pageSize)
    : m_source(source),
      m_pageSize(pageSize > 0 ? pageSize : 1),
      m_bytesRead(0),
      m_eof(false) {}

// --------------------------------------------------------------------------
ChunkStatus::Value ChunkSplitter::Next(vector<char> *page) {
  if (page == NULL || !m_source) {
    return ChunkStatus::Error;
  }
  page->resize(m_pageSize);
  size_t filled = 0;

  // a source may hand out fewer bytes than asked, keep reading until the
  // page is full or the stream ends
  while (!m_eof && filled < m_pageSize) {
    size_t readSize = 0;
    if (!m_source->Read(&(*page)[filled], m_pageSize - filled, &readSize)) {
      page->clear();
      return ChunkStatus::Error;
    }
    if (readSize == 0) {
      m_eof = true;
    } else {
      filled += readSize;
      m_bytesRead += readSize;
    }
  }

  page->resize(filled);
  if (filled == m_pageSize) {
    return ChunkStatus::Page;
  }
  return filled > 0 ? ChunkStatus::Tail : ChunkStatus::End;
}

}  // namespace Data
}  // namespace CS
