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

namespace vcdq {

// Recoverable problems found while reading a vcd.
// Each one is recorded and reading continues.
enum class VcdDiagnosticKind {
  // Line could not be classified. The line is skipped.
  malformed_line,
  // Identifier declared twice. The first declaration wins.
  duplicate_identifier,
  // Declaration after $enddefinitions. Ignored.
  declaration_after_freeze,
  // Time marker earlier than the current time.
  // Following changes are applied at the current time.
  time_ordering_violation,
  // Change for an undeclared identifier. The change is discarded.
  unknown_signal_reference,
  // Two identifiers declare the same hierarchical name.
  // Name lookup finds the first.
  duplicate_name,
  // Vector value wider than the declared width.
  // The low order digits are kept.
  value_width_mismatch
};

const char *
vcdDiagnosticKindName(VcdDiagnosticKind kind);
// Report message id used when a diagnostic is echoed as a warning.
int
vcdDiagnosticMsgId(VcdDiagnosticKind kind);

class VcdDiagnostic
{
public:
  VcdDiagnostic(VcdDiagnosticKind kind,
                int line,
                std::string text,
                std::string message);
  VcdDiagnosticKind kind() const { return kind_; }
  const char *kindName() const;
  // Input line number, starting at 1.
  int line() const { return line_; }
  // Raw input line.
  const std::string &text() const { return text_; }
  const std::string &message() const { return message_; }
  bool operator==(const VcdDiagnostic &diag) const;

private:
  VcdDiagnosticKind kind_;
  int line_;
  std::string text_;
  std::string message_;
};

typedef std::vector<VcdDiagnostic> VcdDiagnostics;

size_t
vcdDiagnosticCount(const VcdDiagnostics &diagnostics,
                   VcdDiagnosticKind kind);

} // namespace
