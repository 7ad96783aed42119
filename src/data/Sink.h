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

#ifndef CHANSTOR_DATA_SINK_H_
#define CHANSTOR_DATA_SINK_H_

#include <stddef.h>
#include <stdint.h>

#include <ostream>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

namespace CS {

namespace Data {

//
// Destination of a download. Bytes are written in increasing offset order.
//
class OutputSink : private boost::noncopyable {
 public:
  virtual ~OutputSink() {}

 public:
  // Write bytes
  //
  // @param  : data, size
  // @return : false if the sink is closed or the write failed
  virtual bool Write(const char *data, size_t size) = 0;

  // Mark the end of data, no more writes are accepted afterwards
  virtual void Close() = 0;

  virtual bool IsClosed() const = 0;
};

// Sink writing into a std::ostream
class StreamSink : public OutputSink {
 public:
  explicit StreamSink(const boost::shared_ptr<std::ostream> &stream);
  ~StreamSink() {}

 public:
  bool Write(const char *data, size_t size);
  void Close();
  bool IsClosed() const;

  uint64_t GetBytesWritten() const;
  // Count of Close calls, including repeated ones
  int GetCloseCount() const;

 private:
  boost::shared_ptr<std::ostream> m_stream;
  uint64_t m_bytesWritten;
  int m_closeCount;
  bool m_closed;
  mutable boost::mutex m_lock;
};

//
// A segment of another sink
//
// Closing a segment ends this segment only, the target sink stays open.
// The target must outlive the segment.
//
class SegmentSink : public OutputSink {
 public:
  explicit SegmentSink(OutputSink *target);
  ~SegmentSink() {}

 public:
  bool Write(const char *data, size_t size);
  void Close() { m_closed = true; }
  bool IsClosed() const { return m_closed; }

  uint64_t GetBytesWritten() const { return m_bytesWritten; }

 private:
  OutputSink *m_target;
  uint64_t m_bytesWritten;
  bool m_closed;
};

}  // namespace Data
}  // namespace CS

#endif  // CHANSTOR_DATA_SINK_H_
