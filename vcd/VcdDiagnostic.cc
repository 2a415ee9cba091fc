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


#include "VcdDiagnostic.hh"

#include "util/EnumNameMap.hh"

namespace vcdq {

static EnumNameMap<VcdDiagnosticKind> vcd_diagnostic_kind_map =
  {{VcdDiagnosticKind::malformed_line, "malformed_line"},
   {VcdDiagnosticKind::duplicate_identifier, "duplicate_identifier"},
   {VcdDiagnosticKind::declaration_after_freeze, "declaration_after_freeze"},
   {VcdDiagnosticKind::time_ordering_violation, "time_ordering_violation"},
   {VcdDiagnosticKind::unknown_signal_reference, "unknown_signal_reference"},
   {VcdDiagnosticKind::duplicate_name, "duplicate_name"},
   {VcdDiagnosticKind::value_width_mismatch, "value_width_mismatch"}
  };

const char *
vcdDiagnosticKindName(VcdDiagnosticKind kind)
{
  return vcd_diagnostic_kind_map.find(kind);
}

int
vcdDiagnosticMsgId(VcdDiagnosticKind kind)
{
  switch (kind) {
  case VcdDiagnosticKind::malformed_line:
    return 1300;
  case VcdDiagnosticKind::duplicate_identifier:
    return 1301;
  case VcdDiagnosticKind::declaration_after_freeze:
    return 1302;
  case VcdDiagnosticKind::time_ordering_violation:
    return 1303;
  case VcdDiagnosticKind::unknown_signal_reference:
    return 1304;
  case VcdDiagnosticKind::duplicate_name:
    return 1305;
  case VcdDiagnosticKind::value_width_mismatch:
    return 1306;
  }
  return 1300;
}

VcdDiagnostic::VcdDiagnostic(VcdDiagnosticKind kind,
                             int line,
                             std::string text,
                             std::string message) :
  kind_(kind),
  line_(line),
  text_(std::move(text)),
  message_(std::move(message))
{
}

const char *
VcdDiagnostic::kindName() const
{
  return vcdDiagnosticKindName(kind_);
}

bool
VcdDiagnostic::operator==(const VcdDiagnostic &diag) const
{
  return kind_ == diag.kind_
    && line_ == diag.line_
    && text_ == diag.text_
    && message_ == diag.message_;
}

size_t
vcdDiagnosticCount(const VcdDiagnostics &diagnostics,
                   VcdDiagnosticKind kind)
{
  size_t count = 0;
  for (const VcdDiagnostic &diag : diagnostics) {
    if (diag.kind() == kind)
      count++;
  }
  return count;
}

} // namespace
