// vcdq, Value Change Dump Query Engine
// Copyright (c) 2025, Parallax Software, Inc.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
// 
// The origin of this software must not be misrepresented; you must not
// claim that you wrote the original software.
// 
// Altered source versions must be plainly marked as such, and must not be
// misrepresented as being the original software.
// 
// This notice may not be removed or altered from any source distribution.


#include "VcdLex.hh"

#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "Debug.hh"
#include "Error.hh"
#include "StringUtil.hh"

namespace vcdq {

using std::string;
using std::vector;

// Widest accepted $var.
static constexpr unsigned long long vcd_max_var_width = 1ULL << 20;

// Very imprecise syntax definition
// https://en.wikipedia.org/wiki/Value_change_dump#Structure.2FSyntax
// Much better syntax definition
// https://web.archive.org/web/20120323132708/http://www.beyondttl.com/vcd.php

VcdGzStream::VcdGzStream(const char *filename) :
  stream_(gzopen(filename, "rb"))
{
  if (stream_ == nullptr)
    throw FileNotReadable(filename);
}

VcdGzStream::~VcdGzStream()
{
  gzclose(stream_);
}

bool
VcdGzStream::readLine(string &line)
{
  line.clear();
  constexpr int buffer_size = 4096;
  char buffer[buffer_size];
  bool read = false;
  while (gzgets(stream_, buffer, buffer_size) != Z_NULL) {
    read = true;
    line += buffer;
    if (!line.empty() && line.back() == '\n')
      break;
  }
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.pop_back();
  return read;
}

VcdStringStream::VcdStringStream(const string &text) :
  text_(text),
  pos_(0)
{
}

bool
VcdStringStream::readLine(string &line)
{
  if (pos_ >= text_.size())
    return false;
  size_t end = text_.find('\n', pos_);
  if (end == string::npos)
    end = text_.size();
  line = text_.substr(pos_, end - pos_);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  pos_ = end + 1;
  return true;
}

////////////////////////////////////////////////////////////////

const char *
vcdTokenTypeName(VcdTokenType type)
{
  switch (type) {
  case VcdTokenType::header:
    return "header";
  case VcdTokenType::scope_enter:
    return "scope_enter";
  case VcdTokenType::scope_exit:
    return "scope_exit";
  case VcdTokenType::var_decl:
    return "var_decl";
  case VcdTokenType::end_definitions:
    return "end_definitions";
  case VcdTokenType::time_marker:
    return "time_marker";
  case VcdTokenType::scalar_change:
    return "scalar_change";
  case VcdTokenType::vector_change:
    return "vector_change";
  case VcdTokenType::malformed_line:
    return "malformed_line";
  }
  return "unknown";
}

VcdToken::VcdToken()
{
  clear();
}

void
VcdToken::clear()
{
  type = VcdTokenType::malformed_line;
  line = 0;
  key.clear();
  name.clear();
  id.clear();
  value.clear();
  width = 0;
  time = 0;
  text.clear();
}

////////////////////////////////////////////////////////////////

static const char *line_space = " \t\r\f\v";

static string
trimLine(const string &line)
{
  size_t begin = line.find_first_not_of(line_space);
  if (begin == string::npos)
    return string();
  size_t end = line.find_last_not_of(line_space);
  return line.substr(begin, end - begin + 1);
}

VcdLex::VcdLex(VcdStream *stream,
               const VcdqState *state) :
  VcdqState(state),
  stream_(stream),
  line_(0),
  in_stmt_(false),
  stmt_line_(0),
  in_dump_(false)
{
}

bool
VcdLex::next(VcdToken &token)
{
  while (tokens_.empty()) {
    if (!readLine()) {
      if (in_stmt_) {
        in_stmt_ = false;
        pushMalformed(stmt_line_, stmt_text_,
                      stmt_keyword_ + " is missing $end");
      }
      else
        break;
    }
    else
      classifyLine();
  }
  if (tokens_.empty())
    return false;
  token = std::move(tokens_.front());
  tokens_.pop_front();
  debugPrint(debug_, "vcd_lex", 3, "line %d %s",
             token.line,
             vcdTokenTypeName(token.type));
  return true;
}

bool
VcdLex::readLine()
{
  if (stream_->readLine(line_text_)) {
    line_++;
    return true;
  }
  return false;
}

void
VcdLex::classifyLine()
{
  vector<string> words;
  split(line_text_, line_space, words);
  for (size_t i = 0; i < words.size(); i++) {
    const string &word = words[i];
    if (in_stmt_) {
      if (word == "$end")
        endStmt();
      else
        stmt_words_.push_back(word);
    }
    else if (word[0] == '$') {
      if (word == "$end") {
        if (in_dump_)
          in_dump_ = false;
        else {
          pushMalformed(line_, trimLine(line_text_),
                        "$end without a matching command");
          break;
        }
      }
      else if (word == "$dumpvars"
               || word == "$dumpall"
               || word == "$dumpon"
               || word == "$dumpoff")
        in_dump_ = true;
      else
        beginStmt(word);
    }
    else if (!classifyValue(words, i))
      break;
  }
}

void
VcdLex::beginStmt(const string &keyword)
{
  in_stmt_ = true;
  stmt_keyword_ = keyword;
  stmt_words_.clear();
  stmt_line_ = line_;
  stmt_text_ = trimLine(line_text_);
}

void
VcdLex::endStmt()
{
  in_stmt_ = false;
  VcdToken token;
  token.line = stmt_line_;
  token.text = stmt_text_;
  classifyStmt(token);
  // Empty comments are placeholders.
  if (!(token.type == VcdTokenType::header
        && token.key == "comment"
        && token.name.empty()))
    tokens_.push_back(std::move(token));
}

void
VcdLex::classifyStmt(VcdToken &token)
{
  const string &keyword = stmt_keyword_;
  const vector<string> &words = stmt_words_;
  if (keyword == "$date"
      || keyword == "$version"
      || keyword == "$comment"
      || keyword == "$timescale") {
    token.type = VcdTokenType::header;
    token.key = keyword.substr(1);
    token.name = join(words, ' ');
  }
  else if (keyword == "$scope") {
    if (words.size() >= 2) {
      token.type = VcdTokenType::scope_enter;
      token.key = words[0];
      token.name = words[1];
    }
    else
      token.value = "scope syntax error";
  }
  else if (keyword == "$upscope")
    token.type = VcdTokenType::scope_exit;
  else if (keyword == "$var") {
    if (words.size() == 4
        || words.size() == 5) {
      const string &width = words[1];
      errno = 0;
      unsigned long long width_value = strtoull(width.c_str(), nullptr, 10);
      if (!isDigits(width.c_str())
          || width_value == 0)
        token.value = "variable width " + width + " is not a positive integer";
      else if (errno == ERANGE
               || width_value > vcd_max_var_width)
        token.value = "variable width " + width + " is out of range";
      else {
        token.type = VcdTokenType::var_decl;
        token.key = words[0];
        token.width = width_value;
        token.id = words[2];
        token.name = words[3];
        // iverilog separates bus base name from bit range.
        if (words.size() == 5) {
          // Preserve space after escaped name.
          if (token.name[0] == '\\')
            token.name += ' ';
          token.name += words[4];
        }
      }
    }
    else
      token.value = "variable syntax error";
  }
  else if (keyword == "$enddefinitions")
    // empty body
    token.type = VcdTokenType::end_definitions;
  else
    token.value = "unhandled vcd command " + keyword;
}

bool
VcdLex::classifyValue(const vector<string> &words,
                      size_t &index)
{
  const string &word = words[index];
  char ch0 = word[0];
  VcdToken token;
  token.line = line_;
  token.text = trimLine(line_text_);
  if (ch0 == '#') {
    VcdTime time;
    if (parseTime(word.substr(1), time)) {
      token.type = VcdTokenType::time_marker;
      token.time = time;
      tokens_.push_back(std::move(token));
      return true;
    }
    pushMalformed(line_, token.text, "time marker " + word + " is not a non-negative integer");
    return false;
  }
  else if (ch0 == 'b' || ch0 == 'B') {
    string digits = word.substr(1);
    if (index + 1 >= words.size()) {
      pushMalformed(line_, token.text, "vector value " + word + " is missing an identifier");
      return false;
    }
    if (digits.empty()) {
      pushMalformed(line_, token.text, "vector value is empty");
      return false;
    }
    for (char ch : digits) {
      if (!isValueChar(ch)) {
        pushMalformed(line_, token.text, "vector value " + word + " has an illegal digit");
        return false;
      }
    }
    token.type = VcdTokenType::vector_change;
    token.value = digits;
    token.id = words[++index];
    tokens_.push_back(std::move(token));
    return true;
  }
  else if (ch0 == 'r' || ch0 == 'R') {
    pushMalformed(line_, token.text, "real value changes are not supported");
    return false;
  }
  else if (isValueChar(ch0)) {
    if (word.size() < 2) {
      pushMalformed(line_, token.text, "scalar value " + word + " is missing an identifier");
      return false;
    }
    token.type = VcdTokenType::scalar_change;
    token.value = word.substr(0, 1);
    token.id = word.substr(1);
    tokens_.push_back(std::move(token));
    return true;
  }
  pushMalformed(line_, token.text, "unrecognized value " + word);
  return false;
}

void
VcdLex::pushMalformed(int line,
                      const string &text,
                      const string &message)
{
  VcdToken token;
  token.type = VcdTokenType::malformed_line;
  token.line = line;
  token.text = text;
  token.value = message;
  tokens_.push_back(std::move(token));
}

bool
VcdLex::isValueChar(char ch)
{
  switch (ch) {
  case '0':
  case '1':
  case 'x':
  case 'X':
  case 'z':
  case 'Z':
    return true;
  default:
    return false;
  }
}

bool
VcdLex::parseTime(const string &digits,
                  // Return value.
                  VcdTime &time)
{
  if (digits.empty() || !isDigits(digits.c_str()))
    return false;
  errno = 0;
  long long value = strtoll(digits.c_str(), nullptr, 10);
  if (errno == ERANGE)
    return false;
  time = value;
  return true;
}

} // namespace
