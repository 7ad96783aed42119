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

#include <sstream>
#include <string>

#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"

#include "base/LogMacros.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/ClientConfiguration.h"
#include "configure/Default.h"
#include "configure/Options.h"
#include "data/MimeTypes.h"
#include "tool/Initializer.h"

using boost::make_shared;
using CS::Client::ClientConfiguration;
using CS::Client::InitializeClientConfiguration;
using CS::Configure::Default::GetMimeFiles;
using CS::Tool::Initializer;
using CS::Tool::Priority;
using CS::Tool::PriorityInitFuncPair;
using CS::Utils::FileExists;
using std::string;

// --------------------------------------------------------------------------
void LoggingInitializer() {
  const CS::Configure::Options &options = CS::Configure::Options::Instance();
  if (options.IsForeground()) {
    CS::Logging::Log::Instance().Initialize();
  } else {
    CS::Logging::Log::Instance().Initialize(options.GetLogDirectory());
  }
  CS::Logging::Log &log = CS::Logging::Log::Instance();
  if (options.IsDebug()) {
    log.SetDebug(true);
  }
  log.SetLogLevel(options.GetLogLevel());
  if (options.IsClearLogDir()) {
    log.ClearLogDirectory();
  }
}

// --------------------------------------------------------------------------
void ClientConfigurationInitializer() {
  InitializeClientConfiguration(make_shared<ClientConfiguration>());
  ClientConfiguration::Instance().InitializeByOptions();
}

// --------------------------------------------------------------------------
void MimeTypesInitializer() {
  string mimeFile = string();
  BOOST_FOREACH(const string &filePath, GetMimeFiles()) {
    if (FileExists(filePath)) {
      mimeFile = filePath;
      break;
    }
  }
  // an empty path falls back to the built-in table
  CS::Data::InitializeMimeTypes(mimeFile);
}

// --------------------------------------------------------------------------
void PrintCommandLineOptions() {
  // Notice: this should only be invoked after logging initialization
  const CS::Configure::Options &options = CS::Configure::Options::Instance();
  std::stringstream ss;
  ss << "<<Command Line Options>> ";
  ss << options << std::endl;
  DebugInfo(ss.str());
}

namespace {

// Register the initializers
static Initializer logInitializer(PriorityInitFuncPair(Priority::First,
                                                       LoggingInitializer));
static Initializer clientConfigInitializer(
    PriorityInitFuncPair(Priority::Second, ClientConfigurationInitializer));
static Initializer mimeTypesInitializer(
    PriorityInitFuncPair(Priority::Third, MimeTypesInitializer));

// Priority must be lower than log initializer
static Initializer printCommandLineOpts(
    PriorityInitFuncPair(Priority::Fourth, PrintCommandLineOptions));

}  // namespace
