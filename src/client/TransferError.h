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

#ifndef CHANSTOR_CLIENT_TRANSFERERROR_H_
#define CHANSTOR_CLIENT_TRANSFERERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace CS {

namespace Client {

struct TransferError {
  enum Value {
    UNKNOWN,
    GOOD,

    // range and arguments
    RANGE_OUT_OF_BOUNDS,
    PARAMETER_MISSING,
    ILLEGAL_STATE,  // e.g. a session executed twice

    // backend lookup
    CHANNEL_NOT_FOUND,
    ACCESS_DENIED,
    MESSAGE_NOT_FOUND,

    // backend transfer
    BACKEND_FETCH_ERROR,   // page read failed or document too short
    BACKEND_PUSH_ERROR,    // page append rejected
    BACKEND_COMMIT_ERROR,  // finalize into channel failed

    // local endpoints
    SINK_WRITE_ERROR,
    SOURCE_READ_ERROR
  };
};

typedef ClientError<TransferError::Value> TransferClientError;

TransferError::Value StringToTransferError(const std::string &name);
std::string TransferErrorToString(TransferError::Value err);

// Build an error with the operation name and detail filled in
TransferClientError MakeTransferError(TransferError::Value err,
                                      const std::string &operation,
                                      const std::string &detail);
TransferClientError GoodTransferError();

std::string GetMessageForTransferError(const TransferClientError &error);
bool IsGoodTransferError(const TransferClientError &error);

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_TRANSFERERROR_H_
