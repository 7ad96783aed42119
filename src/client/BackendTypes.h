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

#ifndef CHANSTOR_CLIENT_BACKENDTYPES_H_
#define CHANSTOR_CLIENT_BACKENDTYPES_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace CS {

namespace Client {

// A resolved channel, the access hash authorizes reads of its messages
struct Channel {
  std::string m_id;
  uint64_t m_accessHash;

  explicit Channel(const std::string &id = std::string(),
                   uint64_t accessHash = 0)
      : m_id(id), m_accessHash(accessHash) {}
};

// Descriptor of the media attached to a message
struct Document {
  uint64_t m_id;
  uint64_t m_accessHash;
  std::string m_fileReference;
  uint64_t m_size;

  Document() : m_id(0), m_accessHash(0), m_fileReference(), m_size(0) {}
};

struct Message {
  int64_t m_id;
  Document m_document;
  std::string m_fileName;
  std::string m_mime;

  Message() : m_id(0), m_document(), m_fileName(), m_mime() {}
};

// Pages already appended under m_fileId, ready to be moved into a channel
struct UploadedFile {
  uint64_t m_fileId;
  int m_parts;
  std::string m_fileName;
  std::string m_mime;

  UploadedFile(uint64_t fileId, int parts, const std::string &fileName,
               const std::string &mime)
      : m_fileId(fileId), m_parts(parts), m_fileName(fileName), m_mime(mime) {}
};

// One physical part of a file. The order of parts defines the file layout.
struct FilePart {
  std::string m_channel;
  int64_t m_message;
  uint64_t m_size;

  FilePart() : m_channel(), m_message(0), m_size(0) {}
  FilePart(const std::string &channel, int64_t message, uint64_t size)
      : m_channel(channel), m_message(message), m_size(size) {}
};

// Byte window over a whole file, m_end is the inclusive last byte
struct ByteRange {
  uint64_t m_start;
  uint64_t m_end;

  ByteRange(uint64_t start = 0, uint64_t end = 0)
      : m_start(start), m_end(end) {}
};

// Window of one part selected by a ByteRange, m_endOffsetInPart is exclusive
struct ResolvedPartRange {
  size_t m_partIndex;
  FilePart m_part;
  uint64_t m_startOffsetInPart;
  uint64_t m_endOffsetInPart;

  ResolvedPartRange()
      : m_partIndex(0),
        m_part(),
        m_startOffsetInPart(0),
        m_endOffsetInPart(0) {}
  ResolvedPartRange(size_t partIndex, const FilePart &part, uint64_t start,
                    uint64_t end)
      : m_partIndex(partIndex),
        m_part(part),
        m_startOffsetInPart(start),
        m_endOffsetInPart(end) {}

  uint64_t GetSize() const { return m_endOffsetInPart - m_startOffsetInPart; }
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_BACKENDTYPES_H_
