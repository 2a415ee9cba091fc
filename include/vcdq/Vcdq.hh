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

#include <memory>
#include <string>

#include "VcdqState.hh"

namespace vcdq {

class Vcd;

// Top level object used by the shell commands.
// Owns the report, debug, variables and the vcd read last.
class Vcdq : public VcdqState
{
public:
  Vcdq();
  virtual ~Vcdq();
  // Singleton used by Tcl commands.
  static Vcdq *vcdq();
  static void setVcdq(Vcdq *vcdq);

  // Replaces the current vcd. Throws on fatal read errors and keeps
  // the previous vcd.
  void readVcd(const char *filename);
  void readVcdString(const std::string &text);
  bool hasVcd() const { return vcd_ != nullptr; }
  // Reports an error if no vcd has been read.
  const Vcd &vcd() const;
  const std::string &vcdFilename() const { return vcd_filename_; }
  void setDebugLevel(const char *what,
                     int level);

protected:
  virtual void makeComponents();
  virtual void makeReport();
  virtual void makeDebug();
  virtual void makeVariables();

  std::unique_ptr<Vcd> vcd_;
  std::string vcd_filename_;

  static Vcdq *vcdq_;
};

} // namespace
