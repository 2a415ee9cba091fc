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

#include <cstdint>
#include <string>
#include <vector>

namespace vcdq {

typedef int64_t VcdTime;
typedef std::vector<std::string> VcdScope;
typedef std::vector<std::string> VcdIdSeq;
typedef std::vector<VcdTime> VcdTimeSeq;

enum class VcdVarType {
  wire,
  reg,
  parameter,
  integer,
  real,
  supply0,
  supply1,
  time,
  tri,
  triand,
  trior,
  trireg,
  tri0,
  tri1,
  wand,
  wor,
  event,
  unknown
};

const char *
vcdVarTypeName(VcdVarType type);
VcdVarType
findVcdVarType(const std::string &name);

class Vcd;
class VcdSignal;
class VcdChange;
class VcdTable;
class VcdTimeGrid;

typedef std::vector<const VcdSignal*> VcdSignalSeq;
typedef std::vector<VcdChange> VcdChangeLog;

// Symbolic unknown value.
constexpr char vcd_unknown_char = 'x';

} // namespace
