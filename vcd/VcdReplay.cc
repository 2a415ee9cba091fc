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


#include "VcdReplay.hh"

#include <algorithm>
#include <cctype>
#include <cinttypes>

#include "Debug.hh"
#include "Variables.hh"
#include "Vcd.hh"
#include "VcdDiagnosticLog.hh"
#include "VcdLex.hh"

namespace vcdq {

using std::string;

VcdReplay::VcdReplay(Vcd *vcd,
                     VcdDiagnosticLog *log,
                     const VcdqState *state) :
  VcdqState(state),
  vcd_(vcd),
  log_(log),
  time_(0),
  time_marker_seen_(false),
  time_max_(0),
  min_delta_time_(0),
  change_count_(0)
{
}

void
VcdReplay::setTime(const VcdToken &token)
{
  VcdTime time = token.time;
  if (time < time_) {
    log_->record(VcdDiagnosticKind::time_ordering_violation,
                 token.line, token.text,
                 "time %" PRId64 " is before the current time %" PRId64,
                 time, time_);
    return;
  }
  if (time_marker_seen_ && time > time_) {
    VcdTime delta = time - time_;
    if (min_delta_time_ == 0 || delta < min_delta_time_)
      min_delta_time_ = delta;
  }
  time_ = time;
  time_marker_seen_ = true;
  time_max_ = std::max(time_max_, time);
  debugPrint(debug_, "vcd_replay", 2, "time %" PRId64, time_);
}

void
VcdReplay::change(const VcdToken &token)
{
  VcdSignal *signal = vcd_->findSignalEdit(token.id);
  if (signal == nullptr) {
    log_->record(VcdDiagnosticKind::unknown_signal_reference,
                 token.line, token.text,
                 "identifier %s is not declared", token.id.c_str());
    return;
  }
  string value = normalizeValue(token, *signal);
  debugPrint(debug_, "vcd_replay", 3, "%" PRId64 " %s %s",
             time_,
             signal->name().c_str(),
             value.c_str());
  signal->appendChange(time_, std::move(value));
  change_count_++;
}

string
VcdReplay::normalizeValue(const VcdToken &token,
                          const VcdSignal &signal)
{
  string value = token.value;
  for (char &ch : value)
    ch = tolower(ch);
  size_t width = signal.width();
  if (value.size() > width) {
    log_->record(VcdDiagnosticKind::value_width_mismatch,
                 token.line, token.text,
                 "value %s is wider than %s width %zu",
                 value.c_str(),
                 signal.name().c_str(),
                 width);
    value.erase(0, value.size() - width);
  }
  else if (value.size() < width) {
    char pad = '0';
    if (variables_->vectorPadPolicy() == VectorPadPolicy::extend
        && (value[0] == 'x' || value[0] == 'z'))
      pad = value[0];
    value.insert(0, width - value.size(), pad);
  }
  return value;
}

void
VcdReplay::finish()
{
  vcd_->time_max_ = time_max_;
  vcd_->min_delta_time_ = min_delta_time_;
  debugPrint(debug_, "vcd_replay", 1, "%zu changes max time %" PRId64,
             change_count_,
             time_max_);
}

} // namespace
