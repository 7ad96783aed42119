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

#include "client/RangeResolver.h"

#include <stdint.h>

#include <vector>

#include "boost/exception/to_string.hpp"

#include "client/Utils.h"

namespace CS {

namespace Client {

using boost::to_string;
using CS::Client::Utils::BuildRequestRange;
using std::vector;

namespace {

ResolveRangeOutcome OutOfBounds(const ByteRange &range, uint64_t totalSize) {
  return ResolveRangeOutcome(MakeTransferError(
      TransferError::RANGE_OUT_OF_BOUNDS, "ResolveRange",
      BuildRequestRange(range.m_start, range.m_end) + " of total size " +
          to_string(totalSize)));
}

}  // namespace

// --------------------------------------------------------------------------
ResolveRangeOutcome ResolveRange(const vector<FilePart> &parts,
                                 const ByteRange &range) {
  if (parts.empty() || range.m_start > range.m_end) {
    return OutOfBounds(range, CS::Client::Utils::GetTotalSize(parts));
  }

  vector<ResolvedPartRange> resolved;
  uint64_t running = 0;  // offset of the current part in the whole file
  for (size_t i = 0; i < parts.size(); ++i) {
    const FilePart &part = parts[i];
    uint64_t partEnd = running + part.m_size;  // exclusive

    if (range.m_start < partEnd) {
      uint64_t start = resolved.empty() ? range.m_start - running : 0;
      if (range.m_end < partEnd) {
        resolved.push_back(
            ResolvedPartRange(i, part, start, range.m_end - running + 1));
        return ResolveRangeOutcome(resolved);
      }
      resolved.push_back(ResolvedPartRange(i, part, start, part.m_size));
    }
    running = partEnd;
  }

  // exhausted parts before reaching end
  return OutOfBounds(range, running);
}

}  // namespace Client
}  // namespace CS
