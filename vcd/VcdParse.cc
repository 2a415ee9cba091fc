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


#include "VcdParse.hh"

#include "Debug.hh"
#include "Stats.hh"
#include "VcdReader.hh"
#include "VcdLex.hh"
#include "VcdDiagnosticLog.hh"
#include "VcdSymbolTable.hh"
#include "VcdReplay.hh"

namespace vcdq {

Vcd
readVcdFile(const char *filename,
            const VcdqState *state)
{
  VcdGzStream stream(filename);
  VcdParse parse(state);
  return parse.read(&stream, filename);
}

Vcd
readVcdString(const std::string &text,
              const VcdqState *state)
{
  VcdStringStream stream(text);
  VcdParse parse(state);
  return parse.read(&stream, "string");
}

VcdParse::VcdParse(const VcdqState *state) :
  VcdqState(state)
{
}

Vcd
VcdParse::read(VcdStream *stream,
               const char *filename)
{
  Stats stats(debug_, report_);
  Vcd vcd;
  VcdDiagnosticLog log(filename, &vcd.diagnostics_, this);
  VcdSymbolTable symbols(&vcd, &log, this);
  VcdReplay replay(&vcd, &log, this);
  VcdLex lex(stream, this);
  bool has_content = false;
  VcdToken token;
  while (lex.next(token)) {
    has_content = true;
    switch (token.type) {
    case VcdTokenType::header:
      if (token.key == "timescale" && symbols.frozen())
        log.record(VcdDiagnosticKind::declaration_after_freeze,
                   token.line, token.text,
                   "$timescale after $enddefinitions is ignored");
      else
        symbols.setHeader(token);
      break;
    case VcdTokenType::scope_enter:
    case VcdTokenType::scope_exit:
    case VcdTokenType::var_decl:
    case VcdTokenType::end_definitions:
      if (symbols.frozen())
        log.record(VcdDiagnosticKind::declaration_after_freeze,
                   token.line, token.text,
                   "declaration after $enddefinitions is ignored");
      else if (token.type == VcdTokenType::scope_enter)
        symbols.enterScope(token);
      else if (token.type == VcdTokenType::scope_exit)
        symbols.exitScope(token);
      else if (token.type == VcdTokenType::var_decl)
        symbols.declare(token);
      else
        symbols.freeze();
      break;
    case VcdTokenType::time_marker:
    case VcdTokenType::scalar_change:
    case VcdTokenType::vector_change:
      if (!symbols.frozen())
        log.record(VcdDiagnosticKind::malformed_line,
                   token.line, token.text,
                   "value change before $enddefinitions");
      else if (token.type == VcdTokenType::time_marker)
        replay.setTime(token);
      else
        replay.change(token);
      break;
    case VcdTokenType::malformed_line:
      log.record(VcdDiagnosticKind::malformed_line,
                 token.line, token.text,
                 "%s", token.value.c_str());
      break;
    }
  }
  if (!has_content)
    throw VcdEmptyInput(filename);
  if (!symbols.frozen())
    throw VcdMissingEndDefinitions(filename);
  replay.finish();
  debugPrint(debug_, "vcd_parse", 1, "%s %d lines %zu diagnostics",
             filename,
             lex.lineCount(),
             vcd.diagnostics_.size());
  stats.report("read vcd");
  return vcd;
}

} // namespace
