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

#ifndef CHANSTOR_DATA_CHUNKSPLITTER_H_
#define CHANSTOR_DATA_CHUNKSPLITTER_H_

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

namespace CS {

namespace Data {

class InputSource;

typedef boost::shared_ptr<std::vector<char> > Buffer;

struct ChunkStatus {
  enum Value {
    Page,   // a full page
    Tail,   // the trailing partial page, end of stream follows
    End,    // end of stream, no bytes
    Error   // the source failed
  };
};

//
// Slices an input source into pages of a fixed size.
//
// Pull based: the source is read only inside Next, so nothing is read while
// the caller is busy with the previous page.
//
class ChunkSplitter : private boost::noncopyable {
 public:
  ChunkSplitter(const boost::shared_ptr<InputSource> &source, size_t pageSize);
  ~ChunkSplitter() {}

 public:
  // Get the next page
  //
  // @param  : page (output)
  // @return : status, page holds the bytes for Page and Tail
  ChunkStatus::Value Next(std::vector<char> *page);

  uint64_t GetBytesRead() const { return m_bytesRead; }
  size_t GetPageSize() const { return m_pageSize; }

 private:
  boost::shared_ptr<InputSource> m_source;
  size_t m_pageSize;
  uint64_t m_bytesRead;
  bool m_eof;
};

}  // namespace Data
}  // namespace CS

#endif  // CHANSTOR_DATA_CHUNKSPLITTER_H_
