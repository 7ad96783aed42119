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

#include <string>

#include "gtest/gtest.h"

#include "client/TransferError.h"

namespace CS {

namespace Client {

using std::string;

TEST(TransferErrorTest, Names) {
  EXPECT_EQ(TransferErrorToString(TransferError::GOOD), "Good");
  EXPECT_EQ(TransferErrorToString(TransferError::RANGE_OUT_OF_BOUNDS),
            "RangeOutOfBounds");
  EXPECT_EQ(TransferErrorToString(TransferError::ACCESS_DENIED),
            "AccessDenied");
  EXPECT_EQ(TransferErrorToString(TransferError::SOURCE_READ_ERROR),
            "SourceReadError");

  EXPECT_EQ(StringToTransferError("MessageNotFound"),
            TransferError::MESSAGE_NOT_FOUND);
  EXPECT_EQ(StringToTransferError("BackendCommitError"),
            TransferError::BACKEND_COMMIT_ERROR);
  EXPECT_EQ(StringToTransferError("NoSuchError"), TransferError::UNKNOWN);
}

TEST(TransferErrorTest, EveryValueHasAName) {
  for (int i = TransferError::UNKNOWN; i <= TransferError::SOURCE_READ_ERROR;
       ++i) {
    TransferError::Value err = static_cast<TransferError::Value>(i);
    EXPECT_EQ(StringToTransferError(TransferErrorToString(err)), err);
  }
}

TEST(TransferErrorTest, Make) {
  TransferClientError good = GoodTransferError();
  EXPECT_TRUE(IsGoodTransferError(good));
  EXPECT_TRUE(good.GetOperation().empty());

  TransferClientError err = MakeTransferError(
      TransferError::CHANNEL_NOT_FOUND, "GetChannel", "ch1");
  EXPECT_FALSE(IsGoodTransferError(err));
  EXPECT_EQ(err.GetError(), TransferError::CHANNEL_NOT_FOUND);
  EXPECT_EQ(err.GetOperation(), "GetChannel");
  EXPECT_EQ(err.GetDetail(), "ch1");
  EXPECT_EQ(GetMessageForTransferError(err), "ChannelNotFound, GetChannel:ch1");

  // default constructed error is not good
  EXPECT_FALSE(IsGoodTransferError(TransferClientError()));
}

}  // namespace Client
}  // namespace CS

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
