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

#include "base/Logging.h"

#include <errno.h>
#include <string.h>  // for strerror
#include <unistd.h>  // for access

#include <iostream>
#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace CS {

namespace Logging {

using CS::Exception::CSException;
using std::pair;
using std::string;

static boost::once_flag initOnce = BOOST_ONCE_INIT;

// --------------------------------------------------------------------------
void Log::Initialize(const string &logdir) {
  boost::call_once(initOnce, boost::bind(boost::type<void>(),
                                         &Log::DoInitialize, this, logdir));
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const string &logdir) {
  if (logdir.empty()) {
    FLAGS_logtostderr = 1;
    FLAGS_colorlogtostderr = true;
  } else {
    // glog reads FLAGS_log_dir only in InitGoogleLogging, so it has to be
    // set first.
    if (!CS::Utils::MakeDirectories(logdir)) {
      throw CSException("Unable to create log directory " + logdir + " : " +
                        strerror(errno));
    }

    if (access(logdir.c_str(), W_OK | X_OK) != 0) {
      throw CSException("Could not create logging file at " + logdir + ": " +
                        strerror(errno));
    }

    m_logDirectory = logdir;
    FLAGS_log_dir = logdir;
    FLAGS_stop_logging_if_full_disk = true;
  }
  FLAGS_minloglevel = static_cast<int>(m_logLevel);

  google::InitGoogleLogging(CS::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
}

// --------------------------------------------------------------------------
void Log::ClearLogDirectory() const {
  if (m_logDirectory.empty()) {
    std::cerr << "Log message to console, nothing to clear" << std::endl;
  } else {
    pair<bool, string> outcome =
        CS::Utils::ClearDirectory(m_logDirectory);
    if (!outcome.first) {
      std::cerr << "Unable to clear log directory : ";
      std::cerr << outcome.second << ". But Continue..." << std::endl;
    }
  }
}

}  // namespace Logging
}  // namespace CS
