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


#include "TclTypeHelpers.hh"

#include <new>

#include "Error.hh"
#include "Report.hh"

namespace vcdq {

bool
tclListStrings(Tcl_Obj *const source,
               Tcl_Interp *interp,
               StringVector &strings)
{
  Tcl_Size argc;
  Tcl_Obj **argv;

  if (Tcl_ListObjGetElements(interp, source, &argc, &argv) == TCL_OK) {
    for (Tcl_Size i = 0; i < argc; i++) {
      strings.push_back(Tcl_GetString(argv[i]));
    }
    return true;
  }
  else
    return false;
}

bool
tclListTimes(Tcl_Obj *const source,
             Tcl_Interp *interp,
             VcdTimeSeq &times)
{
  Tcl_Size argc;
  Tcl_Obj **argv;

  if (Tcl_ListObjGetElements(interp, source, &argc, &argv) == TCL_OK) {
    for (Tcl_Size i = 0; i < argc; i++) {
      VcdTime time;
      if (!tclTimeArg(argv[i], interp, time))
        return false;
      times.push_back(time);
    }
    return true;
  }
  else
    return false;
}

bool
tclTimeArg(Tcl_Obj *const source,
           Tcl_Interp *interp,
           VcdTime &time)
{
  Tcl_WideInt value;
  if (Tcl_GetWideIntFromObj(interp, source, &value) != TCL_OK)
    return false;
  if (value < 0) {
    Tcl_SetObjResult(interp,
                     Tcl_ObjPrintf("time %s is negative.",
                                   Tcl_GetString(source)));
    return false;
  }
  time = value;
  return true;
}

void
tclArgError(Tcl_Interp *interp,
            Report *report,
            int id,
            const char *msg,
            const char *arg)
{
  try {
    report->error(id, msg, arg);
  } catch (const ExceptionMsg &e) {
    Tcl_SetObjResult(interp, Tcl_NewStringObj(e.what(), -1));
  }
}

int
tclCatchExceptions(Tcl_Interp *interp,
                   const std::function<int ()> &cmd)
{
  try {
    return cmd();
  }
  catch (const std::bad_alloc &) {
    Tcl_SetObjResult(interp, Tcl_NewStringObj("Out of memory.", -1));
    return TCL_ERROR;
  }
  catch (const std::exception &e) {
    Tcl_SetObjResult(interp, Tcl_NewStringObj(e.what(), -1));
    return TCL_ERROR;
  }
}

} // namespace
