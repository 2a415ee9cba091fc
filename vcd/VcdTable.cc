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


#include "VcdTable.hh"

#include <algorithm>

#include "Vcd.hh"

namespace vcdq {

using std::string;
using std::vector;

VcdTimeGrid::VcdTimeGrid(bool all_change_times,
                         const VcdTimeSeq &times) :
  all_change_times_(all_change_times),
  times_(times)
{
}

VcdTimeGrid
VcdTimeGrid::allChangeTimes()
{
  return VcdTimeGrid(true, VcdTimeSeq());
}

VcdTimeGrid
VcdTimeGrid::times(const VcdTimeSeq &times)
{
  return VcdTimeGrid(false, times);
}

VcdTableRow::VcdTableRow(VcdTime time,
                         vector<string> values) :
  time_(time),
  values_(std::move(values))
{
}

VcdTable::VcdTable(const VcdSignalSeq &signals) :
  signals_(signals)
{
}

const string &
VcdTable::value(size_t row,
                size_t column) const
{
  return rows_[row].values()[column];
}

void
VcdTable::appendRow(VcdTime time,
                    vector<string> values)
{
  rows_.emplace_back(time, std::move(values));
}

////////////////////////////////////////////////////////////////

VcdTable
Vcd::project(const VcdIdSeq &ids,
             const VcdTimeGrid &grid) const
{
  VcdSignalSeq signals;
  for (const string &id : ids)
    signals.push_back(&signal(id));

  VcdTimeSeq times;
  if (grid.isAllChangeTimes()) {
    for (const VcdSignal *signal : signals) {
      for (const VcdChange &change : signal->changes())
        times.push_back(change.time());
    }
  }
  else
    times = grid.explicitTimes();
  std::sort(times.begin(), times.end());
  times.erase(std::unique(times.begin(), times.end()), times.end());

  VcdTable table(signals);
  for (VcdTime time : times) {
    vector<string> values;
    values.reserve(signals.size());
    for (const VcdSignal *signal : signals)
      values.push_back(signal->valueAt(time));
    table.appendRow(time, std::move(values));
  }
  return table;
}

} // namespace
