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

#include "client/Utils.h"

#include <stdint.h>
#include <time.h>
#include <unistd.h>  // for getpid

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/lexical_cast.hpp"
#include "boost/random/mersenne_twister.hpp"
#include "boost/random/uniform_int_distribution.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/StringUtils.h"

namespace CS {

namespace Client {

namespace Utils {

using boost::lexical_cast;
using boost::to_string;
using std::string;
using std::vector;

namespace {

boost::mutex generatorLock;

boost::random::mt19937_64 &GetGenerator() {
  static boost::random::mt19937_64 generator(
      static_cast<uint64_t>(time(NULL)) ^
      (static_cast<uint64_t>(getpid()) << 32));
  return generator;
}

}  // namespace

// --------------------------------------------------------------------------
uint64_t GenerateFileId() {
  static const uint64_t minId = 1000000000000000000ULL;  // 19 digits
  static const uint64_t maxId = 9223372036854775807ULL;
  boost::random::uniform_int_distribution<uint64_t> dist(minId, maxId);
  boost::lock_guard<boost::mutex> lock(generatorLock);
  return dist(GetGenerator());
}

// --------------------------------------------------------------------------
string GenerateSessionId(const string &prefix) {
  boost::random::uniform_int_distribution<uint64_t> dist(0, 0xffffffffffffULL);
  uint64_t value = 0;
  {
    boost::lock_guard<boost::mutex> lock(generatorLock);
    value = dist(GetGenerator());
  }
  std::ostringstream ss;
  ss << prefix << "-" << std::hex << std::setw(12) << std::setfill('0')
     << value;
  return ss.str();
}

// --------------------------------------------------------------------------
string BuildRequestRange(uint64_t start, uint64_t end) {
  return "bytes=" + to_string(start) + "-" + to_string(end);
}

// --------------------------------------------------------------------------
bool ParseFilePart(const string &text, FilePart *part) {
  vector<string> tokens = CS::StringUtils::Split(text, ':');
  if (tokens.size() != 3 || tokens[0].empty() || part == NULL) {
    return false;
  }
  // lexical_cast wraps a negative value into an unsigned one
  if (tokens[2].empty() || tokens[2][0] == '-') {
    return false;
  }
  try {
    part->m_channel = tokens[0];
    part->m_message = lexical_cast<int64_t>(tokens[1]);
    part->m_size = lexical_cast<uint64_t>(tokens[2]);
  } catch (const boost::bad_lexical_cast &) {
    return false;
  }
  return true;
}

// --------------------------------------------------------------------------
string FormatFilePart(const FilePart &part) {
  return part.m_channel + ":" + to_string(part.m_message) + ":" +
         to_string(part.m_size);
}

// --------------------------------------------------------------------------
uint64_t GetTotalSize(const vector<FilePart> &parts) {
  uint64_t total = 0;
  BOOST_FOREACH(const FilePart &part, parts) { total += part.m_size; }
  return total;
}

}  // namespace Utils
}  // namespace Client
}  // namespace CS
