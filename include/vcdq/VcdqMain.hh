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

struct Tcl_Interp;

namespace vcdq {

// Tcl init executed inside Tcl_Main.
// Makes the Vcdq object, defines the commands and sources the init
// and command files named on the command line.
int
vcdqTclAppInit(int argc,
               char *argv[],
               const char *init_filename,
               Tcl_Interp *interp);

// Return true and remove flag from argv if it is present.
bool
findCmdLineFlag(int &argc,
		char *argv[],
		const char *flag);
// Return the value following key and remove both from argv.

// Return the Tcl result code.
int
sourceTclFile(const char *filename,
              Tcl_Interp *interp);

bool
isRegularFile(const char *filename);

void
showUsage(const char *prog,
	  const char *init_filename);

} // namespace
