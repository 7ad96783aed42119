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

#ifndef CHANSTOR_CLIENT_RANGERESOLVER_H_
#define CHANSTOR_CLIENT_RANGERESOLVER_H_

#include <vector>

#include "client/BackendTypes.h"
#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace CS {

namespace Client {

typedef Outcome<std::vector<ResolvedPartRange>,
                ClientError<TransferError::Value> >
    ResolveRangeOutcome;

// Map a byte range of the whole file to windows of its parts
//
// @param  : ordered parts, range with inclusive end
// @return : the parts covering the range in order, with the window of each
//
// Fails with RANGE_OUT_OF_BOUNDS if start > end, if parts is empty or if the
// range ends beyond the total size. No I/O is done.
ResolveRangeOutcome ResolveRange(const std::vector<FilePart> &parts,
                                 const ByteRange &range);

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_RANGERESOLVER_H_
