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

namespace vcdq {

// How vector values shorter than the declared width are widened.
//  zero   - omitted leading digits are '0'.
//  extend - a leading 'x' or 'z' is replicated, otherwise '0'.
enum class VectorPadPolicy { zero, extend };

const char *
vectorPadPolicyName(VectorPadPolicy policy);
// Return false if name is not a policy name.
bool
findVectorPadPolicy(const char *name,
                    // Return value.
                    VectorPadPolicy &policy);

// Settings shared by the reader and the exporters.
// The shell exposes them with set_vcd_variable.
class Variables
{
public:
  Variables();
  // set_vcd_variable pad_policy
  VectorPadPolicy vectorPadPolicy() const { return vector_pad_policy_; }
  void setVectorPadPolicy(VectorPadPolicy policy);
  // set_vcd_variable report_diagnostics
  // Echo each diagnostic as a warning while reading.
  bool reportDiagnostics() const { return report_diagnostics_; }
  void setReportDiagnostics(bool report);
  // set_vcd_variable csv_separator
  char csvSeparator() const { return csv_separator_; }
  void setCsvSeparator(char separator);
  // set_vcd_variable csv_time_units
  // Write csv times in seconds instead of log time units.
  bool csvTimeUnits() const { return csv_time_units_; }
  void setCsvTimeUnits(bool time_units);

private:
  VectorPadPolicy vector_pad_policy_;
  bool report_diagnostics_;
  char csv_separator_;
  bool csv_time_units_;
};

} // namespace
