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
#include <vector>

#include "VcdClass.hh"

namespace vcdq {

// Times a table is sampled at.
class VcdTimeGrid
{
public:
  // Union of the change times of the projected signals.
  static VcdTimeGrid allChangeTimes();
  // Explicit times. Sorted and made unique when projected.
  static VcdTimeGrid times(const VcdTimeSeq &times);
  bool isAllChangeTimes() const { return all_change_times_; }
  const VcdTimeSeq &explicitTimes() const { return times_; }

private:
  VcdTimeGrid(bool all_change_times,
              const VcdTimeSeq &times);

  bool all_change_times_;
  VcdTimeSeq times_;
};

class VcdTableRow
{
public:
  VcdTableRow(VcdTime time,
              std::vector<std::string> values);
  VcdTime time() const { return time_; }
  // One value per table column.
  const std::vector<std::string> &values() const { return values_; }

private:
  VcdTime time_;
  std::vector<std::string> values_;
};

// Rectangular time aligned projection of signal values.
// Rows are strictly ascending in time.
class VcdTable
{
public:
  VcdTable(const VcdSignalSeq &signals);
  const VcdSignalSeq &signals() const { return signals_; }
  const std::vector<VcdTableRow> &rows() const { return rows_; }
  size_t rowCount() const { return rows_.size(); }
  size_t columnCount() const { return signals_.size(); }
  const std::string &value(size_t row,
                           size_t column) const;

private:
  void appendRow(VcdTime time,
                 std::vector<std::string> values);

  VcdSignalSeq signals_;
  std::vector<VcdTableRow> rows_;

  friend class Vcd;
};

} // namespace
