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

#ifndef CHANSTOR_BASE_SINGLETON_HPP_
#define CHANSTOR_BASE_SINGLETON_HPP_

#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/once.hpp"

namespace CS {

//
// Process wide instance built on first use.
//
// Derive with a private constructor and befriend Singleton<T>, as Log and
// Options do. The instance lives until exit.
//
template <typename T>
class Singleton : private boost::noncopyable {
 public:
  static T &Instance() {
    boost::call_once(CreateFlag(), &Singleton<T>::Create);
    return *Holder();
  }

 protected:
  Singleton() {}
  virtual ~Singleton() {}

 private:
  static void Create() { Holder().reset(new T); }

  static boost::scoped_ptr<T> &Holder() {
    static boost::scoped_ptr<T> instance;
    return instance;
  }

  static boost::once_flag &CreateFlag() {
    static boost::once_flag flag = BOOST_ONCE_INIT;
    return flag;
  }
};

}  // namespace CS

#endif  // CHANSTOR_BASE_SINGLETON_HPP_
