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

#ifndef CHANSTOR_CONFIGURE_OPTIONS_H_
#define CHANSTOR_CONFIGURE_OPTIONS_H_

#include <stdint.h>  // for uint64_t

#include <ostream>
#include <string>
#include <vector>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace CS {

namespace Configure {
class Options;
}  // namespace Configure

namespace Tool {

namespace Parser {
void Parse(int argc, char **argv, CS::Configure::Options *options);
}  // namespace Parser
}  // namespace Tool

namespace Configure {

using CS::Logging::LogLevel;

class Options : public Singleton<Options> {
 public:
  // A standalone instance holding the compiled defaults
  Options();

 public:
  bool IsNoTransfer() const { return m_showHelp || m_showVersion; }

  // accessor
  const std::string &GetCommand() const { return m_command; }
  const std::vector<std::string> &GetArguments() const { return m_arguments; }
  const std::string &GetStoreDirectory() const { return m_storeDirectory; }
  const std::string &GetChannel() const { return m_channel; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  uint64_t GetDownloadPageSize() const { return m_downloadPageSize; }
  uint64_t GetUploadPageSize() const { return m_uploadPageSize; }
  uint64_t GetMinBufferSize() const { return m_minBufferSize; }
  int GetMaxUploadParts() const { return m_maxUploadParts; }
  size_t GetParallelTransfers() const { return m_parallelTransfers; }
  uint64_t GetRangeStart() const { return m_rangeStart; }
  bool HasRangeEnd() const { return m_hasRangeEnd; }
  uint64_t GetRangeEnd() const { return m_rangeEnd; }
  const std::string &GetOutputFile() const { return m_outputFile; }
  bool IsClearLogDir() const { return m_clearLogDir; }
  bool IsForeground() const { return m_foreground; }
  bool IsDebug() const { return m_debug; }
  bool IsShowHelp() const { return m_showHelp; }
  bool IsShowVersion() const { return m_showVersion; }

 private:
  // mutator
  void SetCommand(const std::string &command) { m_command = command; }
  void AddArgument(const std::string &arg) { m_arguments.push_back(arg); }
  void SetStoreDirectory(const std::string &dir) { m_storeDirectory = dir; }
  void SetChannel(const std::string &channel) { m_channel = channel; }
  void SetLogDirectory(const std::string &path) { m_logDirectory = path; }
  void SetLogLevel(LogLevel::Value level) { m_logLevel = level; }
  void SetDownloadPageSize(uint64_t size) { m_downloadPageSize = size; }
  void SetUploadPageSize(uint64_t size) { m_uploadPageSize = size; }
  void SetMinBufferSize(uint64_t size) { m_minBufferSize = size; }
  void SetMaxUploadParts(int parts) { m_maxUploadParts = parts; }
  void SetParallelTransfers(size_t num) { m_parallelTransfers = num; }
  void SetRangeStart(uint64_t start) { m_rangeStart = start; }
  void SetRangeEnd(uint64_t end) {
    m_rangeEnd = end;
    m_hasRangeEnd = true;
  }
  void SetOutputFile(const std::string &path) { m_outputFile = path; }
  void SetClearLogDir(bool clearLogDir) { m_clearLogDir = clearLogDir; }
  void SetForeground(bool foreground) { m_foreground = foreground; }
  void SetDebug(bool debug) { m_debug = debug; }
  void SetShowHelp(bool showHelp) { m_showHelp = showHelp; }
  void SetShowVersion(bool showVersion) { m_showVersion = showVersion; }

  std::string m_command;  // upload or download
  std::vector<std::string> m_arguments;
  std::string m_storeDirectory;  // root of the local backend
  std::string m_channel;         // upload destination
  std::string m_logDirectory;
  LogLevel::Value m_logLevel;
  uint64_t m_downloadPageSize;  // in bytes
  uint64_t m_uploadPageSize;    // in bytes
  uint64_t m_minBufferSize;     // in bytes
  int m_maxUploadParts;
  size_t m_parallelTransfers;
  uint64_t m_rangeStart;
  uint64_t m_rangeEnd;  // inclusive
  bool m_hasRangeEnd;
  std::string m_outputFile;  // stdout if empty
  bool m_clearLogDir;
  bool m_foreground;  // log to stderr
  bool m_debug;
  bool m_showHelp;
  bool m_showVersion;

  friend class Singleton<Options>;
  friend void CS::Tool::Parser::Parse(int argc, char **argv,
                                      CS::Configure::Options *options);
  friend std::ostream &operator<<(std::ostream &os, const Options &opts);
};

std::ostream &operator<<(std::ostream &os, const Options &opts);

}  // namespace Configure
}  // namespace CS

#endif  // CHANSTOR_CONFIGURE_OPTIONS_H_
