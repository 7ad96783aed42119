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

#include "client/ClientConfiguration.h"

#include <string>

#include "boost/bind.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/once.hpp"

#include "base/Exception.h"
#include "base/Utils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace CS {

namespace Client {

using boost::call_once;
using boost::shared_ptr;
using CS::Configure::Default::GetDefaultDownloadPageSize;
using CS::Configure::Default::GetDefaultMaxUploadParts;
using CS::Configure::Default::GetDefaultMinBufferSize;
using CS::Configure::Default::GetDefaultParallelTransfers;
using CS::Configure::Default::GetDefaultStoreDirectory;
using CS::Configure::Default::GetDefaultUploadChannel;
using CS::Configure::Default::GetDefaultUploadPageSize;
using CS::Exception::CSException;
using std::string;

static shared_ptr<ClientConfiguration> clientConfigInstance;
static boost::once_flag clientConfigFlag = BOOST_ONCE_INIT;

namespace {

void SetClientConfigInstance(const shared_ptr<ClientConfiguration> &config) {
  clientConfigInstance = config;
}

void ConstructClientConfigInstance() {
  clientConfigInstance =
      shared_ptr<ClientConfiguration>(new ClientConfiguration);
}

}  // namespace

// --------------------------------------------------------------------------
void InitializeClientConfiguration(
    const shared_ptr<ClientConfiguration> &config) {
  if (!config) {
    throw CSException("Null client configuration");
  }
  call_once(clientConfigFlag,
            boost::bind(boost::type<void>(), SetClientConfigInstance, config));
}

// --------------------------------------------------------------------------
ClientConfiguration &ClientConfiguration::Instance() {
  call_once(clientConfigFlag, ConstructClientConfigInstance);
  return *clientConfigInstance.get();
}

// --------------------------------------------------------------------------
ClientConfiguration::ClientConfiguration()
    : m_storeDirectory(GetDefaultStoreDirectory()),
      m_defaultChannel(GetDefaultUploadChannel()),
      m_downloadPageSize(GetDefaultDownloadPageSize()),
      m_uploadPageSize(GetDefaultUploadPageSize()),
      m_minBufferSize(GetDefaultMinBufferSize()),
      m_maxUploadParts(GetDefaultMaxUploadParts()),
      m_parallelTransfers(GetDefaultParallelTransfers()) {}

// --------------------------------------------------------------------------
void ClientConfiguration::InitializeByOptions() {
  const CS::Configure::Options &options = CS::Configure::Options::Instance();
  m_storeDirectory = options.GetStoreDirectory();
  m_defaultChannel = options.GetChannel();
  m_downloadPageSize = options.GetDownloadPageSize();
  m_uploadPageSize = options.GetUploadPageSize();
  m_minBufferSize = options.GetMinBufferSize();
  m_maxUploadParts = options.GetMaxUploadParts();
  m_parallelTransfers = options.GetParallelTransfers();

  if (!CS::Utils::MakeDirectories(m_storeDirectory)) {
    throw CSException("Unable to create store directory " + m_storeDirectory);
  }
}

}  // namespace Client
}  // namespace CS
