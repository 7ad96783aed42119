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

#include "base/StringUtils.h"

#include <stdint.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/lambda/lambda.hpp"
#include "boost/lexical_cast.hpp"

namespace CS {

namespace StringUtils {

using std::string;
using std::vector;

// --------------------------------------------------------------------------
string ToLower(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::tolower(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string ToUpper(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::toupper(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string LTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::iterator pos = std::find_if(copy.begin(), copy.end(), ch != _1);
  copy.erase(copy.begin(), pos);
  return copy;
}

// --------------------------------------------------------------------------
string RTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::reverse_iterator rpos =
      std::find_if(copy.rbegin(), copy.rend(), ch != _1);
  copy.erase(rpos.base(), copy.end());
  return copy;
}

// --------------------------------------------------------------------------
string Trim(const string &str, unsigned char ch) {
  return LTrim(RTrim(str, ch), ch);
}

// --------------------------------------------------------------------------
string ZeroPad(uint64_t value, int width) {
  string digits = boost::lexical_cast<string>(value);
  if (width > 0 && digits.size() < static_cast<size_t>(width)) {
    digits.insert(0, static_cast<size_t>(width) - digits.size(), '0');
  }
  return digits;
}

// --------------------------------------------------------------------------
vector<string> Split(const string &str, char delim) {
  vector<string> tokens;
  string::size_type begin = 0;
  string::size_type pos = 0;
  while ((pos = str.find(delim, begin)) != string::npos) {
    tokens.push_back(str.substr(begin, pos - begin));
    begin = pos + 1;
  }
  tokens.push_back(str.substr(begin));
  return tokens;
}

// --------------------------------------------------------------------------
string FormatPath(const string &path) { return "[path=" + path + "]"; }

// --------------------------------------------------------------------------
string FormatRange(uint64_t start, uint64_t end) {
  return "[range=" + boost::lexical_cast<string>(start) + "-" +
         boost::lexical_cast<string>(end) + "]";
}

}  // namespace StringUtils
}  // namespace CS
