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

#include "client/TransferError.h"

#include <string.h>  // for strcmp

#include <string>
#include <utility>

namespace CS {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;

namespace {

typedef pair<TransferError::Value, const char *> ErrorNamePair;

// keep in sorted order of enumeration value
const ErrorNamePair errToNames[] = {
    make_pair(TransferError::UNKNOWN, "Unknown"),
    make_pair(TransferError::GOOD, "Good"),
    make_pair(TransferError::RANGE_OUT_OF_BOUNDS, "RangeOutOfBounds"),
    make_pair(TransferError::PARAMETER_MISSING, "ParameterMissing"),
    make_pair(TransferError::ILLEGAL_STATE, "IllegalState"),
    make_pair(TransferError::CHANNEL_NOT_FOUND, "ChannelNotFound"),
    make_pair(TransferError::ACCESS_DENIED, "AccessDenied"),
    make_pair(TransferError::MESSAGE_NOT_FOUND, "MessageNotFound"),
    make_pair(TransferError::BACKEND_FETCH_ERROR, "BackendFetchError"),
    make_pair(TransferError::BACKEND_PUSH_ERROR, "BackendPushError"),
    make_pair(TransferError::BACKEND_COMMIT_ERROR, "BackendCommitError"),
    make_pair(TransferError::SINK_WRITE_ERROR, "SinkWriteError"),
    make_pair(TransferError::SOURCE_READ_ERROR, "SourceReadError"),
};

const int errToNamesCount = sizeof(errToNames) / sizeof(errToNames[0]);

}  // namespace

// --------------------------------------------------------------------------
TransferError::Value StringToTransferError(const string &name) {
  for (int i = 0; i < errToNamesCount; ++i) {
    if (strcmp(name.c_str(), errToNames[i].second) == 0) {
      return errToNames[i].first;
    }
  }
  return TransferError::UNKNOWN;
}

// --------------------------------------------------------------------------
string TransferErrorToString(TransferError::Value err) {
  // binary search
  int low = 0;
  int high = errToNamesCount - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (err == errToNames[mid].first) {
      return errToNames[mid].second;
    }
    if (static_cast<int>(err) < static_cast<int>(errToNames[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "Unknown";
}

// --------------------------------------------------------------------------
TransferClientError MakeTransferError(TransferError::Value err,
                                      const string &operation,
                                      const string &detail) {
  return TransferClientError(err, operation, detail);
}

// --------------------------------------------------------------------------
TransferClientError GoodTransferError() {
  return TransferClientError(TransferError::GOOD);
}

// --------------------------------------------------------------------------
string GetMessageForTransferError(const TransferClientError &error) {
  return TransferErrorToString(error.GetError()) + ", " +
         error.GetOperation() + ":" + error.GetDetail();
}

// --------------------------------------------------------------------------
bool IsGoodTransferError(const TransferClientError &error) {
  return error.GetError() == TransferError::GOOD;
}

}  // namespace Client
}  // namespace CS
