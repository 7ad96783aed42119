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

#include "configure/Options.h"

#include <ostream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"

#include "base/LogLevel.h"
#include "configure/Default.h"

namespace CS {

namespace Configure {

using boost::to_string;
using CS::Configure::Default::GetDefaultDownloadPageSize;
using CS::Configure::Default::GetDefaultLogDirectory;
using CS::Configure::Default::GetDefaultLogLevelName;
using CS::Configure::Default::GetDefaultMaxUploadParts;
using CS::Configure::Default::GetDefaultMinBufferSize;
using CS::Configure::Default::GetDefaultParallelTransfers;
using CS::Configure::Default::GetDefaultStoreDirectory;
using CS::Configure::Default::GetDefaultUploadChannel;
using CS::Configure::Default::GetDefaultUploadPageSize;
using CS::Logging::GetLogLevelByName;
using CS::Logging::GetLogLevelName;
using std::ostream;
using std::string;

// --------------------------------------------------------------------------
Options::Options()
    : m_command(),
      m_arguments(),
      m_storeDirectory(GetDefaultStoreDirectory()),
      m_channel(GetDefaultUploadChannel()),
      m_logDirectory(GetDefaultLogDirectory()),
      m_logLevel(GetLogLevelByName(GetDefaultLogLevelName())),
      m_downloadPageSize(GetDefaultDownloadPageSize()),
      m_uploadPageSize(GetDefaultUploadPageSize()),
      m_minBufferSize(GetDefaultMinBufferSize()),
      m_maxUploadParts(GetDefaultMaxUploadParts()),
      m_parallelTransfers(GetDefaultParallelTransfers()),
      m_rangeStart(0),
      m_rangeEnd(0),
      m_hasRangeEnd(false),
      m_outputFile(),
      m_clearLogDir(false),
      m_foreground(false),
      m_debug(false),
      m_showHelp(false),
      m_showVersion(false) {}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const Options &opts) {
  string args;
  BOOST_FOREACH(const string &arg, opts.m_arguments) {
    if (!args.empty()) {
      args.append(" ");
    }
    args.append(arg);
  }

  os << "[command: " << opts.m_command << "] "
     << "[arguments: " << args << "] "
     << "[store directory: " << opts.m_storeDirectory << "] "
     << "[channel: " << opts.m_channel << "] "
     << "[log directory: " << opts.m_logDirectory << "] "
     << "[log level: " << GetLogLevelName(opts.m_logLevel) << "] "
     << "[download page: " << to_string(opts.m_downloadPageSize) << "] "
     << "[upload page: " << to_string(opts.m_uploadPageSize) << "] "
     << "[min buffer: " << to_string(opts.m_minBufferSize) << "] "
     << "[max parts: " << to_string(opts.m_maxUploadParts) << "] "
     << "[num transfers: " << to_string(opts.m_parallelTransfers) << "] "
     << "[start: " << to_string(opts.m_rangeStart) << "] ";
  if (opts.m_hasRangeEnd) {
    os << "[end: " << to_string(opts.m_rangeEnd) << "] ";
  }
  return os << "[output: " << opts.m_outputFile << "] " << std::boolalpha
            << "[clear logdir: " << opts.m_clearLogDir << "] "
            << "[foreground: " << opts.m_foreground << "] "
            << "[debug: " << opts.m_debug << "] "
            << "[show help: " << opts.m_showHelp << "] "
            << "[show version: " << opts.m_showVersion << "]"
            << std::noboolalpha;
}

}  // namespace Configure
}  // namespace CS
