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

#ifndef CHANSTOR_CLIENT_CLIENTERROR_HPP_
#define CHANSTOR_CLIENT_CLIENTERROR_HPP_

#include <string>

namespace CS {

namespace Client {

//
// Error value carried by every backend call and transfer session.
//
// Besides the code it names the operation which failed, e.g. "GetFile", and
// a detail such as the channel or offset involved. A default constructed
// error holds the zero code.
//
template <typename CODE>
class ClientError {
 public:
  ClientError() : m_code() {}
  explicit ClientError(CODE code) : m_code(code) {}
  ClientError(CODE code, const std::string &operation,
              const std::string &detail)
      : m_code(code), m_operation(operation), m_detail(detail) {}

 public:
  CODE GetError() const { return m_code; }
  const std::string &GetOperation() const { return m_operation; }
  const std::string &GetDetail() const { return m_detail; }

 private:
  CODE m_code;
  std::string m_operation;
  std::string m_detail;
};

}  // namespace Client
}  // namespace CS

#endif  // CHANSTOR_CLIENT_CLIENTERROR_HPP_
