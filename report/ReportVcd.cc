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


#include "ReportVcd.hh"

#include <algorithm>
#include <cinttypes>

#include "Report.hh"
#include "StringUtil.hh"
#include "Vcd.hh"
#include "VcdActivity.hh"

namespace vcdq {

using std::string;

static void
reportVcdHeader(const Vcd &vcd,
                Report *report)
{
  if (!vcd.date().empty())
    report->reportLine("Date: %s", vcd.date().c_str());
  if (!vcd.version().empty())
    report->reportLine("Version: %s", vcd.version().c_str());
  if (!vcd.comment().empty())
    report->reportLine("Comment: %s", vcd.comment().c_str());
  const VcdTimescale &timescale = vcd.timescale();
  report->reportLine("Timescale: %d%s",
                     timescale.magnitude(),
                     timescale.unit().c_str());
  report->reportLine("Max time: %" PRId64, vcd.timeMax());
}

void
reportVcdSignals(const Vcd &vcd,
                 Report *report)
{
  reportVcdHeader(vcd, report);
  report->reportLine("Signals: %zu", vcd.signalCount());
  size_t id_length = 2;
  for (const VcdSignal *signal : vcd.signals())
    id_length = std::max(id_length, signal->id().size());
  for (const VcdSignal *signal : vcd.signals())
    report->reportLine(" %-*s %-9s %5zu %7zu %s",
                       static_cast<int>(id_length),
                       signal->id().c_str(),
                       vcdVarTypeName(signal->type()),
                       signal->width(),
                       signal->changeCount(),
                       signal->name().c_str());
}

void
reportVcdValues(const Vcd &vcd,
                const VcdSignal &signal,
                Report *report)
{
  const VcdTimescale &timescale = vcd.timescale();
  for (const VcdChange &change : signal.changes())
    report->reportLine("%" PRId64 " %.2e %s",
                       change.time(),
                       timescale.timeSeconds(change.time()),
                       change.value().c_str());
}

void
reportVcdValue(const Vcd &,
               const VcdSignal &signal,
               VcdTime time,
               Report *report)
{
  report->reportLine("%s %" PRId64 " %s",
                     signal.name().c_str(),
                     time,
                     signal.valueAt(time).c_str());
}

void
reportVcdTransitions(const Vcd &,
                     const VcdSignal &signal,
                     Report *report)
{
  for (const VcdTransition &transition : signal.transitions())
    report->reportLine("%" PRId64 " %s -> %s",
                       transition.time(),
                       transition.from().c_str(),
                       transition.to().c_str());
}

void
reportVcdWaveforms(const Vcd &vcd,
                   Report *report)
{
  reportVcdHeader(vcd, report);
  report->reportBlankLine();
  // Characters per time sample.
  int zoom = (vcd.maxVarWidth() + 7) / 4;
  VcdTime time_max = vcd.timeMax();
  VcdTime time_delta = vcd.minDeltaTime();
  if (time_delta == 0)
    time_delta = std::max(time_max, static_cast<VcdTime>(1));

  int max_var_name_length = vcd.maxVarNameLength();
  for (const VcdSignal *signal : vcd.signals()) {
    string line;
    stringPrint(line, " %-*s ",
                max_var_name_length,
                signal->name().c_str());
    string prev_value = signal->valueAt(0);
    for (VcdTime time = 0; time < time_max; time += time_delta) {
      const string &value = signal->valueAt(time);
      if (signal->isScalar()) {
        char ch = value[0];
        char prev_ch = prev_value[0];
        if (ch == '0' || ch == '1') {
          for (int z = 0; z < zoom; z++) {
            if (z == 0
                && ch != prev_ch
                && (prev_ch == '0'
                    || prev_ch == '1'))
              line += (prev_ch == '1') ? "╲" : "╱";
            else
              line += (ch == '1') ? "▔" : "▁";
          }
        }
        else {
          stringAppend(line, "%-*c", zoom, ch);
        }
      }
      else {
        // bus
        stringAppend(line, "%-*s", zoom, vcdHexValue(value).c_str());
      }
      prev_value = value;
    }
    trimRight(line);
    report->reportLineString(line);
  }
}

void
reportVcdDiagnostics(const Vcd &vcd,
                     const char *filename,
                     Report *report)
{
  for (const VcdDiagnostic &diag : vcd.diagnostics())
    report->reportLine("%s line %d, %s: %s",
                       filename,
                       diag.line(),
                       diag.kindName(),
                       diag.message().c_str());
  report->reportLine("%zu diagnostics.", vcd.diagnostics().size());
}

void
reportVcdActivity(const Vcd &vcd,
                  Report *report)
{
  int name_length = std::max(vcd.maxVarNameLength(), static_cast<size_t>(6));
  report->reportLine("%-*s %7s %11s %6s %s",
                     name_length, "Signal",
                     "Changes",
                     "Transitions",
                     "Duty",
                     "Final");
  VcdTime time_max = vcd.timeMax();
  for (const VcdSignal *signal : vcd.signals()) {
    VcdActivity activity = findVcdActivity(*signal, time_max);
    string duty = signal->isScalar()
      ? stdstrPrint("%.2f", activity.duty())
      : string("-");
    report->reportLine("%-*s %7zu %11.1f %6s %s",
                       name_length,
                       signal->name().c_str(),
                       activity.changeCount(),
                       activity.transitionCount(),
                       duty.c_str(),
                       activity.finalValue().c_str());
  }
}

////////////////////////////////////////////////////////////////

string
vcdHexValue(const string &value)
{
  static const char hex_digits[] = "0123456789ABCDEF";
  string hex;
  size_t length = value.size();
  for (size_t end = length; end > 0; ) {
    size_t begin = (end >= 4) ? end - 4 : 0;
    int digit = 0;
    bool has_x = false;
    bool all_z = true;
    for (size_t i = begin; i < end; i++) {
      char ch = value[i];
      digit = digit * 2 + (ch == '1' ? 1 : 0);
      if (ch != 'z')
        all_z = false;
      if (ch == 'x' || ch == 'z')
        has_x = true;
    }
    if (all_z)
      hex += 'z';
    else if (has_x)
      hex += 'x';
    else
      hex += hex_digits[digit];
    end = begin;
  }
  std::reverse(hex.begin(), hex.end());
  return hex;
}

} // namespace
