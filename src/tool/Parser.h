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

#ifndef CHANSTOR_TOOL_PARSER_H_
#define CHANSTOR_TOOL_PARSER_H_

namespace CS {

namespace Configure {
class Options;
}  // namespace Configure

namespace Tool {

namespace Parser {

// Parse command line into options
//
// @param  : argc, argv, options (output)
// @return : void
//
// Options come first or mixed with the non option arguments. The first non
// option argument is the command, the rest are its arguments.
// Throw CSException on an unknown option or a malformed value. A non
// positive value of a numeric option falls back to its default with a
// warning to stderr.
void Parse(int argc, char **argv, CS::Configure::Options *options);

}  // namespace Parser
}  // namespace Tool
}  // namespace CS

#endif  // CHANSTOR_TOOL_PARSER_H_
