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

#ifndef CHANSTOR_DATA_SOURCE_H_
#define CHANSTOR_DATA_SOURCE_H_

#include <stddef.h>
#include <stdint.h>

#include <istream>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

namespace CS {

namespace Data {

//
// Input of an upload, read on demand by the uploader
//
class InputSource : private boost::noncopyable {
 public:
  virtual ~InputSource() {}

 public:
  // Read bytes
  //
  // @param  : buffer, size of buffer, read size (output)
  // @return : false if reading failed or the source is destroyed
  //
  // A read size of 0 means the end of stream.
  virtual bool Read(char *buf, size_t size, size_t *readSize) = 0;

  // Release the underlying input, later reads fail
  virtual void Destroy() = 0;

  virtual bool IsDestroyed() const = 0;
};

// Source reading from a std::istream
class StreamSource : public InputSource {
 public:
  explicit StreamSource(const boost::shared_ptr<std::istream> &stream);
  ~StreamSource() {}

 public:
  bool Read(char *buf, size_t size, size_t *readSize);
  void Destroy();
  bool IsDestroyed() const;

  uint64_t GetBytesRead() const;

 private:
  boost::shared_ptr<std::istream> m_stream;
  uint64_t m_bytesRead;
  bool m_destroyed;
  mutable boost::mutex m_lock;  // Destroy may come from another thread
};

}  // namespace Data
}  // namespace CS

#endif  // CHANSTOR_DATA_SOURCE_H_
