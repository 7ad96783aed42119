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

#ifndef CHANSTOR_CLIENT_CLIENTCONFIGURATION_H_
#define CHANSTOR_CLIENT_CLIENTCONFIGURATION_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "boost/shared_ptr.hpp"

// Declare in global namespace before class ClientConfiguration, since friend
// declarations can only introduce names in the surrounding namespace.
extern void ClientConfigurationInitializer();

namespace CS {

namespace Client {

class ClientConfiguration;
void InitializeClientConfiguration(
    const boost::shared_ptr<ClientConfiguration> &config);

class ClientConfiguration {
 public:
  static ClientConfiguration &Instance();

 public:
  ClientConfiguration();

 public:
  // accessor
  const std::string &GetStoreDirectory() const { return m_storeDirectory; }
  const std::string &GetDefaultChannel() const { return m_defaultChannel; }
  uint64_t GetDownloadPageSize() const { return m_downloadPageSize; }
  uint64_t GetUploadPageSize() const { return m_uploadPageSize; }
  uint64_t GetMinBufferSize() const { return m_minBufferSize; }
  int GetMaxUploadParts() const { return m_maxUploadParts; }
  size_t GetParallelTransfers() const { return m_parallelTransfers; }

 private:
  void InitializeByOptions();
  friend void ::ClientConfigurationInitializer();

 private:
  std::string m_storeDirectory;  // root of the local backend
  std::string m_defaultChannel;  // upload channel if none is given
  uint64_t m_downloadPageSize;
  uint64_t m_uploadPageSize;
  uint64_t m_minBufferSize;      // uploads up to this size stay in memory
  int m_maxUploadParts;          // pages per backend object
  size_t m_parallelTransfers;    // sessions run in parallel
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_CLIENTCONFIGURATION_H_
