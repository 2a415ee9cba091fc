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

#include <string>

#include "Machine.hh" // __attribute__
#include "VcdDiagnostic.hh"
#include "VcdqState.hh"

namespace vcdq {

// Accumulates diagnostics for one vcd read.
class VcdDiagnosticLog : public VcdqState
{
public:
  VcdDiagnosticLog(const char *filename,
                   VcdDiagnostics *diagnostics,
                   const VcdqState *state);
  void record(VcdDiagnosticKind kind,
              int line,
              const std::string &text,
              const char *fmt,
              ...)
    __attribute__((format (printf, 5, 6)));
  const char *filename() const { return filename_.c_str(); }

private:
  std::string filename_;
  VcdDiagnostics *diagnostics_;
};

} // namespace
