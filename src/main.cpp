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

#include <stdint.h>
#include <stdlib.h>

#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/Utils.h"
#include "client/ClientConfiguration.h"
#include "client/Downloader.h"
#include "client/LocalClient.h"
#include "client/PartLedger.h"
#include "client/TransferManager.h"
#include "client/Uploader.h"
#include "client/Utils.h"
#include "configure/Default.h"
#include "configure/Options.h"
#include "data/Sink.h"
#include "data/Source.h"
#include "tool/HelpText.h"
#include "tool/Initializer.h"
#include "tool/Parser.h"

using boost::shared_ptr;
using CS::Client::ClientConfiguration;
using CS::Client::ClientError;
using CS::Client::Downloader;
using CS::Client::FilePart;
using CS::Client::FilePortion;
using CS::Client::LocalClient;
using CS::Client::TransferError;
using CS::Client::TransferManager;
using CS::Client::Uploader;
using CS::Configure::Default::GetProgramName;
using CS::Configure::Options;
using CS::Exception::CSException;
using CS::Tool::HelpText::ShowChanstorHelp;
using CS::Tool::HelpText::ShowChanstorUsage;
using CS::Tool::HelpText::ShowChanstorVersion;
using CS::Tool::Initializer;
using std::string;
using std::vector;

namespace {
void CheckCommand();
void RunUpload(const Options &options);
void RunDownload(const Options &options);

struct ErrorHandle {
  int *ret;
  explicit ErrorHandle(int *ret_) : ret(ret_) {}

  void operator()(const char *err) {
    if (ret) {
      *ret = EXIT_FAILURE;
    }
    if (err) {
      std::cerr << "[" << GetProgramName() << " ERROR] " << err << "\n";
    }
  }
};
}  // namespace

int main(int argc, char **argv) {
  int ret = 0;
  ErrorHandle errorHandle(&ret);

  // Parse command line arguments.
  Options &options = Options::Instance();
  try {
    CS::Tool::Parser::Parse(argc, argv, &options);
  } catch (const CSException &err) {
    errorHandle(err.what());
    ShowChanstorUsage();
    return ret;
  }

  try {
    if (options.IsNoTransfer()) {
      if (options.IsShowVersion()) {
        ShowChanstorVersion();
      }
      if (options.IsShowHelp()) {
        ShowChanstorHelp();
      }
    } else {
      CheckCommand();

      // Notice: DO NOT use logging before initialization done.
      Initializer::RunInitializers();

      if (options.GetCommand() == "upload") {
        RunUpload(options);
      } else {
        RunDownload(options);
      }
    }
  } catch (const CSException &err) {
    errorHandle(err.what());
  } catch (const char *err) {
    errorHandle(err);
  } catch (const string &err) {
    errorHandle(err.c_str());
  } catch (const std::exception &err) {
    errorHandle(err.what());
  }
  return ret;
}

namespace {

void CheckCommand() {
  const Options &options = Options::Instance();
  const string &command = options.GetCommand();
  if (command.empty()) {
    ShowChanstorUsage();
    throw "Missing command, expect upload or download";
  }
  if (command != "upload" && command != "download") {
    ShowChanstorUsage();
    throw "Unknown command " + command;
  }
  if (options.GetArguments().empty()) {
    ShowChanstorUsage();
    throw command == "upload" ? "Missing FILE parameter"
                              : "Missing CHANNEL:MESSAGE:SIZE parameter";
  }
  if (command == "upload" && options.GetArguments().size() > 1) {
    throw "Upload takes a single FILE";
  }
}

// Keep an inline portion under <store>/inline/ and return its path
string WriteInlinePortion(const string &sessionId, const FilePortion &portion) {
  string dir = CS::Utils::AppendPathDelim(
                   ClientConfiguration::Instance().GetStoreDirectory()) +
               "inline/";
  if (!CS::Utils::MakeDirectories(dir)) {
    throw "Unable to create directory " + dir;
  }
  string path = dir + sessionId + "-" + portion.m_fileName;
  std::ofstream out(path.c_str(), std::ios_base::out | std::ios_base::binary |
                                      std::ios_base::trunc);
  const vector<char> &content = *portion.m_bufferedContent;
  if (!content.empty()) {
    out.write(&content[0], static_cast<std::streamsize>(content.size()));
  }
  out.flush();
  if (!out) {
    throw "Unable to write " + path;
  }
  return path;
}

void RunUpload(const Options &options) {
  const string &filePath = options.GetArguments().front();
  if (!CS::Utils::FileExists(filePath)) {
    throw "File " + filePath + " does not exist";
  }
  shared_ptr<std::ifstream> file(new std::ifstream(
      filePath.c_str(), std::ios_base::in | std::ios_base::binary));
  if (!*file) {
    throw "Unable to open " + filePath;
  }

  shared_ptr<LocalClient> client(
      new LocalClient(ClientConfiguration::Instance().GetStoreDirectory()));
  // channels of the local backend come into being on first upload
  if (!options.GetChannel().empty() &&
      !client->CreateChannel(options.GetChannel())) {
    throw "Invalid channel " + options.GetChannel();
  }

  shared_ptr<Uploader> uploader(new Uploader(
      CS::Client::Utils::GenerateSessionId("ul"), client, options.GetChannel(),
      CS::Utils::GetBaseName(filePath)));
  ClientError<TransferError::Value> err = uploader->Prepare();
  if (!IsGoodTransferError(err)) {
    throw GetMessageForTransferError(err);
  }

  TransferManager manager(client);
  shared_ptr<CS::Data::InputSource> source(new CS::Data::StreamSource(file));
  err = manager.UploadFile(uploader, source).get();
  if (!IsGoodTransferError(err)) {
    throw GetMessageForTransferError(err);
  }

  BOOST_FOREACH(const shared_ptr<FilePortion> &portion,
                uploader->GetLedger().GetPortions()) {
    if (portion->IsBuffered()) {
      std::cout << "inline:"
                << WriteInlinePortion(uploader->GetSessionId(), *portion)
                << ":" << portion->m_size << "\n";
    } else {
      std::cout << uploader->GetChannelRef() << ":" << portion->m_messageId
                << ":" << portion->m_size << "\n";
    }
  }
  std::cout.flush();
}

void RunDownload(const Options &options) {
  vector<FilePart> parts;
  BOOST_FOREACH(const string &arg, options.GetArguments()) {
    FilePart part;
    if (!CS::Client::Utils::ParseFilePart(arg, &part)) {
      throw "Invalid part " + arg + ", expect CHANNEL:MESSAGE:SIZE";
    }
    parts.push_back(part);
  }

  uint64_t totalSize = CS::Client::Utils::GetTotalSize(parts);
  uint64_t end = options.HasRangeEnd()
                     ? options.GetRangeEnd()
                     : (totalSize > 0 ? totalSize - 1 : 0);

  shared_ptr<std::ostream> stream;
  if (options.GetOutputFile().empty()) {
    stream.reset(new std::ostream(std::cout.rdbuf()));
  } else {
    stream.reset(new std::ofstream(options.GetOutputFile().c_str(),
                                   std::ios_base::out | std::ios_base::binary |
                                       std::ios_base::trunc));
    if (!*stream) {
      throw "Unable to open " + options.GetOutputFile();
    }
  }

  shared_ptr<LocalClient> client(
      new LocalClient(ClientConfiguration::Instance().GetStoreDirectory()));
  TransferManager manager(client);
  shared_ptr<Downloader> downloader(
      new Downloader(CS::Client::Utils::GenerateSessionId("dl"), parts,
                     options.GetRangeStart(), end));
  shared_ptr<CS::Data::OutputSink> sink(new CS::Data::StreamSink(stream));
  ClientError<TransferError::Value> err =
      manager.DownloadFile(downloader, sink).get();
  stream->flush();
  if (!IsGoodTransferError(err)) {
    throw GetMessageForTransferError(err);
  }
}

}  // namespace
