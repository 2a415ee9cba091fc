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


#include "VcdqMain.hh"
#include "VcdqConfig.hh"  // VCDQ_VERSION

#include <cstdio>
#include <tcl.h>

#include "StringUtil.hh"

using vcdq::stringEq;
using vcdq::showUsage;
using vcdq::vcdqTclAppInit;

static int cmd_argc;
static char **cmd_argv;
static const char *init_filename = ".vcdq";

static int
tclAppInit(Tcl_Interp *interp);

int
main(int argc,
     char *argv[])
{
  if (argc == 2 && stringEq(argv[1], "-help")) {
    showUsage(argv[0], init_filename);
    return 0;
  }
  else if (argc == 2 && stringEq(argv[1], "-version")) {
    printf("%s %s\n", VCDQ_VERSION, VCDQ_GIT_SHA1);
    return 0;
  }
  else {
    // Set argc to 1 so Tcl_Main doesn't source any files.
    // Tcl_Main never returns.
    cmd_argc = argc;
    cmd_argv = argv;
    Tcl_Main(1, argv, tclAppInit);
    return 0;
  }
}

static int
tclAppInit(Tcl_Interp *interp)
{
  return vcdqTclAppInit(cmd_argc, cmd_argv, init_filename, interp);
}
