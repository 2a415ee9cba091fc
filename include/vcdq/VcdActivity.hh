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

// Switching statistics of a signal over [0, time max].
class VcdActivity
{
public:
  VcdActivity();
  VcdActivity(size_t change_count,
              double transition_count,
              VcdTime high_time,
              double duty,
              std::string final_value);
  size_t changeCount() const { return change_count_; }
  // Transitions to or from x/z count 0.5.
  double transitionCount() const { return transition_count_; }
  // Time spent at '1'. Zero for vectors.
  VcdTime highTime() const { return high_time_; }
  // high time / time max.
  double duty() const { return duty_; }
  // Last value, unknown if there are no changes.
  const std::string &finalValue() const { return final_value_; }

private:
  size_t change_count_;
  double transition_count_;
  VcdTime high_time_;
  double duty_;
  std::string final_value_;
};

typedef std::vector<VcdActivity> VcdBitActivities;

VcdActivity
findVcdActivity(const VcdSignal &signal,
                VcdTime time_max);
// Activity of one bit. Bit 0 is the lsb.
// Bit 0 is the lsb. Bits outside the signal width have no activity.
VcdActivity
findVcdBitActivity(const VcdSignal &signal,
                   size_t bit,
                   VcdTime time_max);
// Activity of every bit, lsb first.
VcdBitActivities
findVcdBitActivities(const VcdSignal &signal,
                     VcdTime time_max);

} // namespace
