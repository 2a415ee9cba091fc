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

#include "VcdClass.hh"

namespace vcdq {

class Report;

// Header, then one line per signal: id type width changes name.
void
reportVcdSignals(const Vcd &vcd,
                 Report *report);
// Every recorded change of signal.
void
reportVcdValues(const Vcd &vcd,
                const VcdSignal &signal,
                Report *report);
void
reportVcdValue(const Vcd &vcd,
               const VcdSignal &signal,
               VcdTime time,
               Report *report);
void
reportVcdTransitions(const Vcd &vcd,
                     const VcdSignal &signal,
                     Report *report);
// Text waveform of every signal sampled on the minimum time delta.
void
reportVcdWaveforms(const Vcd &vcd,
                   Report *report);
void
reportVcdDiagnostics(const Vcd &vcd,
                     const char *filename,
                     Report *report);
void
reportVcdActivity(const Vcd &vcd,
                  Report *report);

// Binary digits to hex, msb first. A nibble with an x is 'x';
// a nibble that is all z is 'z'.
std::string
vcdHexValue(const std::string &value);

} // namespace
