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


#include "VcdActivity.hh"

#include <utility>

#include "Vcd.hh"

namespace vcdq {

using std::string;

VcdActivity::VcdActivity() :
  change_count_(0),
  transition_count_(0.0),
  high_time_(0),
  duty_(0.0)
{
}

VcdActivity::VcdActivity(size_t change_count,
                         double transition_count,
                         VcdTime high_time,
                         double duty,
                         string final_value) :
  change_count_(change_count),
  transition_count_(transition_count),
  high_time_(high_time),
  duty_(duty),
  final_value_(std::move(final_value))
{
}

static bool
isUnknown(const string &value)
{
  return value.find_first_of("xz") != string::npos;
}

static string
bitValue(const string &value,
         size_t bit)
{
  return value.substr(value.size() - 1 - bit, 1);
}

// Changes before the first recorded value are not transitions.
static VcdActivity
findActivity(const VcdSignal &signal,
             bool is_bit,
             size_t bit,
             VcdTime time_max)
{
  const VcdChangeLog &changes = signal.changes();
  bool is_scalar = is_bit || signal.isScalar();
  if (changes.empty())
    return VcdActivity(0, 0.0, 0, 0.0,
                       is_bit ? string(1, vcd_unknown_char)
                       : signal.unknownValue());
  double transition_count = 0.0;
  string prev_value = is_bit
    ? bitValue(changes[0].value(), bit)
    : changes[0].value();
  VcdTime prev_time = changes[0].time();
  VcdTime high_time = 0;
  for (const VcdChange &change : changes) {
    VcdTime time = change.time();
    string value = is_bit ? bitValue(change.value(), bit) : change.value();
    if (is_scalar && prev_value == "1")
      high_time += time - prev_time;
    if (value != prev_value)
      transition_count += (isUnknown(value) || isUnknown(prev_value))
        ? .5
        : 1.0;
    prev_time = time;
    prev_value = value;
  }
  if (is_scalar && prev_value == "1" && time_max > prev_time)
    high_time += time_max - prev_time;
  double duty = (time_max > 0)
    ? static_cast<double>(high_time) / time_max
    : 0.0;
  return VcdActivity(changes.size(), transition_count, high_time, duty,
                     prev_value);
}

VcdActivity
findVcdActivity(const VcdSignal &signal,
                VcdTime time_max)
{
  return findActivity(signal, false, 0, time_max);
}

VcdActivity
findVcdBitActivity(const VcdSignal &signal,
                   size_t bit,
                   VcdTime time_max)
{
  if (bit >= signal.width())
    return VcdActivity();
  return findActivity(signal, true, bit, time_max);
}

VcdBitActivities
findVcdBitActivities(const VcdSignal &signal,
                     VcdTime time_max)
{
  VcdBitActivities activities;
  for (size_t bit = 0; bit < signal.width(); bit++)
    activities.push_back(findVcdBitActivity(signal, bit, time_max));
  return activities;
}

} // namespace
