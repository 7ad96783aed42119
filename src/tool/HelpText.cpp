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

#include "tool/HelpText.h"

#include <iostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/Size.h"
#include "configure/Default.h"
#include "configure/Version.h"

namespace CS {

namespace Tool {

namespace HelpText {

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
using std::cout;
using std::endl;

void ShowChanstorVersion() {
  cout << "chanstor version: " << CS::Configure::Version::GetVersionString()
       << endl;
}

void ShowChanstorHelp() {
  cout <<
  "Store files as ordered parts of channel messages and read them back.\n";
  ShowChanstorUsage();
  cout <<
  "\n"
  "  uploading\n"
  "    chanstor upload <FILE> [-c <CHANNEL>]\n"
  "    prints one line per committed part, CHANNEL:MESSAGE:SIZE, or\n"
  "    inline:PATH:SIZE for a file small enough to be kept locally\n"
  "  downloading\n"
  "    chanstor download <CHANNEL:MESSAGE:SIZE>... [-S <START>] [-E <END>]\n"
  "    parts are given in file order, END is inclusive\n"
  "\n"
  "chanstor Options:\n"
  "Mandatory arguments to long options are mandatory for short options too.\n"
  "  -s, --store        Store directory of the local backend, default path is\n"
  "                     " << GetDefaultStoreDirectory() << "\n" <<
  "  -c, --channel      Channel to upload to, default is " <<
                          GetDefaultUploadChannel() << "\n" <<
  "  -l, --logdir       Specify log directory, default path is " <<
                          GetDefaultLogDirectory() << "\n" <<
  "  -L, --loglevel     Min log level, message lower than this level don't logged;\n"
  "                     Specify one of following log level: INFO,WARN,ERROR,FATAL;\n"
  "                     " << GetDefaultLogLevelName() << " is set by default\n"
  "      --dlpagesize   Page size(KB) of a backend read, default value is "
                        << to_string(GetDefaultDownloadPageSize() / CS::Size::KB1) << "KB\n"
  "      --ulpagesize   Page size(KB) of a backend append, default value is "
                        << to_string(GetDefaultUploadPageSize() / CS::Size::KB1) << "KB\n"
  "      --minbuf       Files up to this size(KB) are not uploaded but kept inline,\n"
  "                     default value is "
                        << to_string(GetDefaultMinBufferSize() / CS::Size::KB1) << "KB\n"
  "  -m, --maxparts     Max count of pages of one backend object, default value is "
                        << to_string(GetDefaultMaxUploadParts()) << "\n"
  "  -n, --numtransfer  Max number of transfers to run in parallel, default value is "
                        << to_string(GetDefaultParallelTransfers()) << "\n"
  "  -S, --start        First byte to download, default is 0\n"
  "  -E, --end          Last byte to download, default is the end of file\n"
  "  -o, --output       Write downloaded bytes to file instead of STDOUT\n"
  "\n"
  "Miscellaneous Options:\n"
  "  -C, --clearlogdir  Clear log directory at beginning\n"
  "  -f, --foreground   Turn on log to STDERR\n"
  "  -d, --debug        Turn on debug messages to log\n"
  "  -h, --help         Print chanstor help\n"
  "  -V, --version      Print chanstor version\n";
  cout.flush();
}

void ShowChanstorUsage() {
  cout <<
  "Usage: chanstor upload <FILE> | download <CHANNEL:MESSAGE:SIZE>...\n"
  "       [-s|--store=[dir]] [-c|--channel=[value]]\n"
  "       [-l|--logdir=[dir]] [-L|--loglevel=[INFO|WARN|ERROR|FATAL]]\n"
  "       [--dlpagesize=[value]] [--ulpagesize=[value]] [--minbuf=[value]]\n"
  "       [-m|--maxparts=[value]] [-n|--numtransfer=[value]]\n"
  "       [-S|--start=[value]] [-E|--end=[value]] [-o|--output=[file]]\n"
  "       [-C|--clearlogdir]\n"
  "       [-f|--foreground]\n"
  "       [-d|--debug]\n"
  "       [-h|--help] [-V|--version]\n";
  cout.flush();
}

}  // namespace HelpText
}  // namespace Tool
}  // namespace CS
