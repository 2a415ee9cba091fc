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

class Report;
class Debug;
class Variables;

// Most vcdq components report, debug and read settings.
// This class simplifies the process of copying pointers to the
// components.
class VcdqState
{
public:
  // Make an empty state.
  VcdqState();
  VcdqState(Report *report,
            Debug *debug,
            Variables *variables);
  VcdqState(const VcdqState *state);
  virtual void copyState(const VcdqState *state);
  virtual ~VcdqState() {}
  Report *report() const { return report_; }
  void setReport(Report *report);
  Debug *debug() const { return debug_; }
  void setDebug(Debug *debug);
  Variables *variables() const { return variables_; }
  void setVariables(Variables *variables);

protected:
  Report *report_;
  Debug *debug_;
  Variables *variables_;
};

} // namespace
