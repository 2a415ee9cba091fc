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

#include <cstdio>
#include <string>

#include "StringUtil.hh"
#include "VcdClass.hh"
#include "VcdqState.hh"

namespace vcdq {

// Delimited text export of vcd tables, change logs and summaries.
// The separator and time units come from Variables.
// Write failures throw FileNotWritable.
class VcdCsvWriter : public VcdqState
{
public:
  VcdCsvWriter(const Vcd *vcd,
               const VcdqState *state);
  // Time (<timescale>),<signal name>...
  void writeTable(const VcdTable &table,
                  const char *filename);
  // Time (<timescale>),<signal name> for every recorded change.
  void writeSignal(const VcdSignal &signal,
                   const char *filename);
  // Signal Name,Width (bits),Total Changes,Current Value
  void writeSummary(const char *filename);

  // Quote field if it holds the separator, a quote or a line break.
  std::string quote(const std::string &field) const;
  std::string timeHeader() const;
  std::string timeField(VcdTime time) const;

private:
  FILE *open(const char *filename);
  void close(FILE *stream,
             const char *filename);
  void writeRow(FILE *stream,
                const StringVector &fields);

  const Vcd *vcd_;
  char separator_;
};

} // namespace
