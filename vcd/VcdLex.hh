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


#pragma once

#include <deque>
#include <string>
#include <vector>
#include <zlib.h>

#include "VcdClass.hh"
#include "VcdqState.hh"

namespace vcdq {

// Line source for the lexer.
class VcdStream
{
public:
  virtual ~VcdStream() {}
  // Read the next line without the line terminator.
  // Return false at the end of input.
  virtual bool readLine(std::string &line) = 0;
};

// Plain or gzip compressed file.
class VcdGzStream : public VcdStream
{
public:
  // Throws FileNotReadable.
  explicit VcdGzStream(const char *filename);
  ~VcdGzStream();
  VcdGzStream(const VcdGzStream &) = delete;
  VcdGzStream &operator=(const VcdGzStream &) = delete;
  bool readLine(std::string &line) override;

private:
  gzFile stream_;
};

class VcdStringStream : public VcdStream
{
public:
  explicit VcdStringStream(const std::string &text);
  bool readLine(std::string &line) override;

private:
  const std::string &text_;
  size_t pos_;
};

enum class VcdTokenType {
  header,
  scope_enter,
  scope_exit,
  var_decl,
  end_definitions,
  time_marker,
  scalar_change,
  vector_change,
  malformed_line
};

const char *
vcdTokenTypeName(VcdTokenType type);

// Classified vcd statement.
//  header           key=date|version|comment|timescale name=body
//  scope_enter      key=scope type name=scope name
//  var_decl         key=var type width id name
//  time_marker      time
//  scalar_change    value id
//  vector_change    value=digits id
//  malformed_line   value=message
class VcdToken
{
public:
  VcdToken();
  void clear();

  VcdTokenType type;
  // Line the statement starts on.
  int line;
  std::string key;
  std::string name;
  std::string id;
  std::string value;
  size_t width;
  VcdTime time;
  // Raw source line.
  std::string text;
};

// Classifies vcd lines into tokens without interpreting them.
// Statements may span lines; value changes may share a line.
class VcdLex : public VcdqState
{
public:
  VcdLex(VcdStream *stream,
         const VcdqState *state);
  // Return false at the end of input.
  bool next(VcdToken &token);
  // Lines read so far.
  int lineCount() const { return line_; }

private:
  bool readLine();
  void classifyLine();
  void beginStmt(const std::string &keyword);
  void endStmt();
  void classifyStmt(VcdToken &token);
  // Return false if the word is malformed.
  bool classifyValue(const std::vector<std::string> &words,
                     size_t &index);
  void pushMalformed(int line,
                     const std::string &text,
                     const std::string &message);
  static bool isValueChar(char ch);
  static bool parseTime(const std::string &digits,
                        // Return value.
                        VcdTime &time);

  VcdStream *stream_;
  std::string line_text_;
  int line_;
  std::deque<VcdToken> tokens_;

  // $keyword ... $end statement being collected.
  bool in_stmt_;
  std::string stmt_keyword_;
  std::vector<std::string> stmt_words_;
  int stmt_line_;
  std::string stmt_text_;
  // Inside $dumpvars/$dumpall/$dumpon/$dumpoff.
  bool in_dump_;
};

} // namespace
