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

#ifndef CHANSTOR_CLIENT_FILEPORTION_H_
#define CHANSTOR_CLIENT_FILEPORTION_H_

#include <stdint.h>

#include <string>

#include "data/ChunkSplitter.h"

namespace CS {

namespace Client {

//
// One logical part of an upload.
//
// A portion collects at most GetMaxUploadParts pages of one pending backend
// file. It is finalized once, either as a message in a channel or as
// buffered content when the whole upload stayed below the buffer threshold.
//
struct FilePortion {
  int m_index;          // 0 based position in the ledger
  uint64_t m_fileId;    // pending file id, the document id once finalized
  int m_currentPageIndex;  // index of the last sent page, -1 if none
  std::string m_mime;
  std::string m_fileName;
  int64_t m_messageId;
  bool m_hasMessageId;
  uint64_t m_size;
  CS::Data::Buffer m_bufferedContent;  // null unless kept inline
  bool m_finalized;

  FilePortion(int index, uint64_t fileId, const std::string &mime,
              const std::string &fileName)
      : m_index(index),
        m_fileId(fileId),
        m_currentPageIndex(-1),
        m_mime(mime),
        m_fileName(fileName),
        m_messageId(0),
        m_hasMessageId(false),
        m_size(0),
        m_bufferedContent(),
        m_finalized(false) {}

  int GetPageCount() const { return m_currentPageIndex + 1; }
  bool IsBuffered() const { return static_cast<bool>(m_bufferedContent); }
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_FILEPORTION_H_
