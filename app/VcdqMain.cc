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

#include <cstdio>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <tcl.h>

#include "Machine.hh"
#include "StringUtil.hh"
#include "VcdTcl.hh"
#include "Vcdq.hh"

namespace vcdq {

using std::string;

static void
initVcdqApp(Tcl_Interp *interp);

int
vcdqTclAppInit(int argc,
               char *argv[],
               const char *init_filename,
               Tcl_Interp *interp)
{
  // source init.tcl
  if (Tcl_Init(interp) == TCL_ERROR)
    return TCL_ERROR;

  initVcdqApp(interp);

  if (!findCmdLineFlag(argc, argv, "-no_init")) {
    const char *home = getenv("HOME");
    if (home) {
      string init_path = home;
      init_path += "/";
      init_path += init_filename;
      if (isRegularFile(init_path.c_str()))
        sourceTclFile(init_path.c_str(), interp);
    }
  }

  bool exit_after_cmd_file = findCmdLineFlag(argc, argv, "-exit");

  if (argc > 2
      || (argc > 1 && argv[1][0] == '-')) {
    showUsage(argv[0], init_filename);
    exit(1);
  }
  else {
    if (argc == 2) {
      char *cmd_file = argv[1];
      if (cmd_file) {
	int result = sourceTclFile(cmd_file, interp);
        if (exit_after_cmd_file) {
          int exit_code = (result == TCL_OK) ? EXIT_SUCCESS : EXIT_FAILURE;
          exit(exit_code);
        }
      }
    }
  }
  return TCL_OK;
}

static void
initVcdqApp(Tcl_Interp *interp)
{
  initElapsedTime();
  Vcdq *vcdq = new Vcdq;
  Vcdq::setVcdq(vcdq);
  defineVcdqCmds(interp, vcdq);
}

bool
findCmdLineFlag(int &argc,
		char *argv[],
		const char *flag)
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, flag)) {
      // remove flag from argv.
      for (int j = i + 1; j < argc; j++, i++)
	argv[i] = argv[j];
      argc--;
      return true;
    }
  }
  return false;
}

int
sourceTclFile(const char *filename,
              Tcl_Interp *interp)
{
  int result = Tcl_EvalFile(interp, filename);
  if (result != TCL_OK)
    fprintf(stderr, "Error: %s\n", Tcl_GetStringResult(interp));
  return result;
}

bool
isRegularFile(const char *filename)
{
  struct stat file_stat;
  return stat(filename, &file_stat) == 0
    && S_ISREG(file_stat.st_mode);
}

void
showUsage(const char *prog,
	  const char *init_filename)
{
  printf("Usage: %s [-help] [-version] [-no_init] [-exit] cmd_file\n", prog);
  printf("  -help              show help and exit\n");
  printf("  -version           show version and exit\n");
  printf("  -no_init           do not read %s init file\n", init_filename);
  printf("  -exit              exit after reading cmd_file\n");
  printf("  cmd_file           source cmd_file\n");
}

} // namespace
