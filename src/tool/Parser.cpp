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

#include "tool/Parser.h"

#include <getopt.h>
#include <stdint.h>
#include <stdlib.h>

#include <iostream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/lexical_cast.hpp"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace CS {

namespace Tool {

namespace Parser {

namespace {

using boost::bad_lexical_cast;
using boost::lexical_cast;
using boost::to_string;
using CS::Configure::Default::GetDefaultDownloadPageSize;
using CS::Configure::Default::GetDefaultMaxUploadParts;
using CS::Configure::Default::GetDefaultMinBufferSize;
using CS::Configure::Default::GetDefaultParallelTransfers;
using CS::Configure::Default::GetDefaultUploadPageSize;
using CS::Configure::Default::GetProgramName;
using CS::Exception::CSException;
using std::string;

void PrintWarnMsg(const char *opt, int64_t invalidVal, int64_t defaultVal) {
  if (opt == NULL) return;
  std::cerr << "[" << GetProgramName() << "] invalid parameter in option "
            << opt << "=" << to_string(invalidVal) << ", "
            << to_string(defaultVal) << " is used." << std::endl;
}

int64_t ToInteger(const char *opt, const char *arg) {
  string value = CS::StringUtils::Trim(arg != NULL ? arg : "", ' ');
  try {
    return lexical_cast<int64_t>(value);
  } catch (const bad_lexical_cast &) {
    throw CSException(string("invalid value '") + value + "' of option " +
                      opt);
  }
}

uint64_t ToOffset(const char *opt, const char *arg) {
  int64_t value = ToInteger(opt, arg);
  if (value < 0) {
    throw CSException(string("negative value of option ") + opt);
  }
  return static_cast<uint64_t>(value);
}

// Positive integer or the default
int64_t ToPositive(const char *opt, const char *arg, int64_t defaultVal) {
  int64_t value = ToInteger(opt, arg);
  if (value <= 0) {
    PrintWarnMsg(opt, value, defaultVal);
    return defaultVal;
  }
  return value;
}

// Long only options
enum {
  OPT_DOWNLOAD_PAGE = 256,
  OPT_UPLOAD_PAGE,
  OPT_MIN_BUFFER
};

const char *const shortOptions = ":s:c:l:L:m:n:S:E:o:CfdhV";

const struct option longOptions[] = {
    {"store",       required_argument, NULL, 's'},
    {"channel",     required_argument, NULL, 'c'},
    {"logdir",      required_argument, NULL, 'l'},
    {"loglevel",    required_argument, NULL, 'L'},
    {"dlpagesize",  required_argument, NULL, OPT_DOWNLOAD_PAGE},
    {"ulpagesize",  required_argument, NULL, OPT_UPLOAD_PAGE},
    {"minbuf",      required_argument, NULL, OPT_MIN_BUFFER},
    {"maxparts",    required_argument, NULL, 'm'},
    {"numtransfer", required_argument, NULL, 'n'},
    {"start",       required_argument, NULL, 'S'},
    {"end",         required_argument, NULL, 'E'},
    {"output",      required_argument, NULL, 'o'},
    {"clearlogdir", no_argument,       NULL, 'C'},
    {"foreground",  no_argument,       NULL, 'f'},
    {"debug",       no_argument,       NULL, 'd'},
    {"help",        no_argument,       NULL, 'h'},
    {"version",     no_argument,       NULL, 'V'},
    {NULL, 0, NULL, 0}
};

}  // namespace

void Parse(int argc, char **argv, CS::Configure::Options *options) {
  if (options == NULL) {
    throw CSException("null options to parse into");
  }

  // restart scanning, Parse may be called more than once in a process
  optind = 0;
  opterr = 0;

  int opt = 0;
  while ((opt = getopt_long(argc, argv, shortOptions, longOptions, NULL)) !=
         -1) {
    switch (opt) {
      case 's':
        options->SetStoreDirectory(optarg);
        break;
      case 'c':
        options->SetChannel(optarg);
        break;
      case 'l':
        options->SetLogDirectory(optarg);
        break;
      case 'L': {
        CS::Logging::LogLevel::Value level;
        if (!CS::Logging::ParseLogLevelName(optarg, &level)) {
          throw CSException(string("invalid log level '") + optarg +
                            "', expect one of INFO,WARN,ERROR,FATAL");
        }
        options->SetLogLevel(level);
        break;
      }
      case OPT_DOWNLOAD_PAGE:
        options->SetDownloadPageSize(
            ToPositive("--dlpagesize", optarg,
                       static_cast<int64_t>(GetDefaultDownloadPageSize() /
                                            CS::Size::KB1)) *
            CS::Size::KB1);
        break;
      case OPT_UPLOAD_PAGE:
        options->SetUploadPageSize(
            ToPositive("--ulpagesize", optarg,
                       static_cast<int64_t>(GetDefaultUploadPageSize() /
                                            CS::Size::KB1)) *
            CS::Size::KB1);
        break;
      case OPT_MIN_BUFFER:
        // zero turns buffering off
        options->SetMinBufferSize(ToOffset("--minbuf", optarg) *
                                  CS::Size::KB1);
        break;
      case 'm':
        options->SetMaxUploadParts(static_cast<int>(ToPositive(
            "-m|--maxparts", optarg, GetDefaultMaxUploadParts())));
        break;
      case 'n':
        options->SetParallelTransfers(static_cast<size_t>(ToPositive(
            "-n|--numtransfer", optarg,
            static_cast<int64_t>(GetDefaultParallelTransfers()))));
        break;
      case 'S':
        options->SetRangeStart(ToOffset("-S|--start", optarg));
        break;
      case 'E':
        options->SetRangeEnd(ToOffset("-E|--end", optarg));
        break;
      case 'o':
        options->SetOutputFile(optarg);
        break;
      case 'C':
        options->SetClearLogDir(true);
        break;
      case 'f':
        options->SetForeground(true);
        break;
      case 'd':
        options->SetDebug(true);
        break;
      case 'h':
        options->SetShowHelp(true);
        break;
      case 'V':
        options->SetShowVersion(true);
        break;
      case ':':
        throw CSException(string("missing value of option ") +
                          argv[optind - 1]);
      case '?':
      default:
        throw CSException(string("unknown option ") + argv[optind - 1]);
    }
  }

  for (int i = optind; i < argc; ++i) {
    if (options->GetCommand().empty()) {
      options->SetCommand(argv[i]);
    } else {
      options->AddArgument(argv[i]);
    }
  }
}

}  // namespace Parser
}  // namespace Tool
}  // namespace CS
