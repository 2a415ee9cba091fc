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


#include "Vcd.hh"

#include <algorithm>

namespace vcdq {

static bool
changeTimeLess(VcdTime time,
               const VcdChange &change)
{
  return time < change.time();
}

static bool
changeLessTime(const VcdChange &change,
               VcdTime time)
{
  return change.time() < time;
}

// Latest change at or before time. Changes at the same time resolve
// to the last one recorded.
const string &
VcdSignal::valueAt(VcdTime time) const
{
  auto after = std::upper_bound(changes_.begin(), changes_.end(),
                                time, changeTimeLess);
  if (after == changes_.begin())
    return unknown_value_;
  return (after - 1)->value();
}

VcdTransitions
VcdSignal::transitions() const
{
  VcdTransitions transitions;
  const string *prev_value = &unknown_value_;
  for (const VcdChange &change : changes_) {
    const string &value = change.value();
    if (value != *prev_value) {
      transitions.emplace_back(change.time(), *prev_value, value);
      prev_value = &value;
    }
  }
  return transitions;
}

VcdChangeLog
VcdSignal::changesBetween(VcdTime begin,
                          VcdTime end) const
{
  if (end < begin)
    return VcdChangeLog();
  auto first = std::lower_bound(changes_.begin(), changes_.end(),
                                begin, changeLessTime);
  auto last = std::upper_bound(first, changes_.end(),
                               end, changeTimeLess);
  return VcdChangeLog(first, last);
}

////////////////////////////////////////////////////////////////

const string &
Vcd::valueAt(const string &id,
             VcdTime time) const
{
  return signal(id).valueAt(time);
}

VcdTransitions
Vcd::transitions(const string &id) const
{
  return signal(id).transitions();
}

VcdChangeLog
Vcd::changesBetween(const string &id,
                    VcdTime begin,
                    VcdTime end) const
{
  return signal(id).changesBetween(begin, end);
}

} // namespace
