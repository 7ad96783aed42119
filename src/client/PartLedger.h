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

#ifndef CHANSTOR_CLIENT_PARTLEDGER_H_
#define CHANSTOR_CLIENT_PARTLEDGER_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "client/FilePortion.h"

namespace CS {

namespace Client {

typedef std::vector<boost::shared_ptr<FilePortion> > FilePortionList;

//
// Ordered portions of one upload, the last one is the current portion.
//
class PartLedger {
 public:
  PartLedger() {}
  ~PartLedger() {}

 public:
  // Append a new portion and make it current
  //
  // @param  : file id, mime, file name
  // @return : the new portion
  boost::shared_ptr<FilePortion> NewPortion(uint64_t fileId,
                                            const std::string &mime,
                                            const std::string &fileName);

  // Get the current portion
  //
  // @param  : void
  // @return : the last portion, null if the ledger is empty
  boost::shared_ptr<FilePortion> GetCurrent() const;

  // Drop the current portion
  //
  // @param  : void
  // @return : false if the ledger is empty
  bool RemoveCurrent();

  // Sum of the portion sizes
  uint64_t GetTotalSize() const;

  size_t GetCount() const { return m_portions.size(); }
  bool IsEmpty() const { return m_portions.empty(); }
  const FilePortionList &GetPortions() const { return m_portions; }

 private:
  FilePortionList m_portions;
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_PARTLEDGER_H_
