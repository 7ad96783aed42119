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

#include "client/PartLedger.h"

#include <stdint.h>

#include <string>

#include "boost/foreach.hpp"
#include "boost/shared_ptr.hpp"

namespace CS {

namespace Client {

using boost::shared_ptr;
using std::string;

// --------------------------------------------------------------------------
shared_ptr<FilePortion> PartLedger::NewPortion(uint64_t fileId,
                                               const string &mime,
                                               const string &fileName) {
  shared_ptr<FilePortion> portion(new FilePortion(
      static_cast<int>(m_portions.size()), fileId, mime, fileName));
  m_portions.push_back(portion);
  return portion;
}

// --------------------------------------------------------------------------
shared_ptr<FilePortion> PartLedger::GetCurrent() const {
  return m_portions.empty() ? shared_ptr<FilePortion>() : m_portions.back();
}

// --------------------------------------------------------------------------
bool PartLedger::RemoveCurrent() {
  if (m_portions.empty()) {
    return false;
  }
  m_portions.pop_back();
  return true;
}

// --------------------------------------------------------------------------
uint64_t PartLedger::GetTotalSize() const {
  uint64_t total = 0;
  BOOST_FOREACH(const shared_ptr<FilePortion> &portion, m_portions) {
    total += portion->m_size;
  }
  return total;
}

}  // namespace Client
}  // namespace CS
