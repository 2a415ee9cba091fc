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


#include "VcdDiagnosticLog.hh"

#include <cstdarg>

#include "Report.hh"
#include "StringUtil.hh"
#include "Variables.hh"

namespace vcdq {

VcdDiagnosticLog::VcdDiagnosticLog(const char *filename,
                                   VcdDiagnostics *diagnostics,
                                   const VcdqState *state) :
  VcdqState(state),
  filename_(filename),
  diagnostics_(diagnostics)
{
}

void
VcdDiagnosticLog::record(VcdDiagnosticKind kind,
                         int line,
                         const std::string &text,
                         const char *fmt,
                         ...)
{
  va_list args;
  va_start(args, fmt);
  std::string message = stringPrintArgs(fmt, args);
  va_end(args);
  if (variables_ && variables_->reportDiagnostics())
    report_->fileWarn(vcdDiagnosticMsgId(kind), filename_.c_str(), line,
                      "%s: %s", vcdDiagnosticKindName(kind), message.c_str());
  diagnostics_->emplace_back(kind, line, text, std::move(message));
}

} // namespace
