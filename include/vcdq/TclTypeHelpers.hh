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

#include <functional>
#include <tcl.h>

#include "StringUtil.hh"
#include "VcdClass.hh"

namespace vcdq {

#if TCL_MAJOR_VERSION < 9
    typedef int Tcl_Size;
#endif

class Report;

// Return false and leave an error in the interp result if source is
// not a list.
bool
tclListStrings(Tcl_Obj *const source,
               Tcl_Interp *interp,
               // Return value.
               StringVector &strings);

// Return false and leave an error in the interp result if an element
// is not a non-negative integer.
bool
tclListTimes(Tcl_Obj *const source,
             Tcl_Interp *interp,
             // Return value.
             VcdTimeSeq &times);

bool
tclTimeArg(Tcl_Obj *const source,
           Tcl_Interp *interp,
           // Return value.
           VcdTime &time);

// Format msg/arg with Report::error and leave the message in the
// interp result.
void
tclArgError(Tcl_Interp *interp,
            Report *report,
            int id,
            const char *msg,
            const char *arg);

// Run cmd and turn any exception it throws into an error result.
int
tclCatchExceptions(Tcl_Interp *interp,
                   const std::function<int ()> &cmd);

} // namespace
