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


#include "Variables.hh"

#include "StringUtil.hh"

namespace vcdq {

Variables::Variables() :
  vector_pad_policy_(VectorPadPolicy::zero),
  report_diagnostics_(false),
  csv_separator_(','),
  csv_time_units_(false)
{
}

void
Variables::setVectorPadPolicy(VectorPadPolicy policy)
{
  vector_pad_policy_ = policy;
}

void
Variables::setReportDiagnostics(bool report)
{
  report_diagnostics_ = report;
}

void
Variables::setCsvSeparator(char separator)
{
  csv_separator_ = separator;
}

void
Variables::setCsvTimeUnits(bool time_units)
{
  csv_time_units_ = time_units;
}

const char *
vectorPadPolicyName(VectorPadPolicy policy)
{
  switch (policy) {
  case VectorPadPolicy::zero:
    return "zero";
  case VectorPadPolicy::extend:
    return "extend";
  }
  return "unknown";
}

bool
findVectorPadPolicy(const char *name,
                    // Return value.
                    VectorPadPolicy &policy)
{
  if (stringEq(name, "zero")) {
    policy = VectorPadPolicy::zero;
    return true;
  }
  else if (stringEq(name, "extend")) {
    policy = VectorPadPolicy::extend;
    return true;
  }
  else
    return false;
}

} // namespace
