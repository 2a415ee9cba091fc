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


#include "VcdTcl.hh"

#include <cstring>
#include <string>

#include "Error.hh"
#include "Report.hh"
#include "ReportVcd.hh"
#include "StringUtil.hh"
#include "TclTypeHelpers.hh"
#include "Variables.hh"
#include "Vcd.hh"
#include "VcdCsv.hh"
#include "VcdTable.hh"
#include "Vcdq.hh"

namespace vcdq {

using std::string;

typedef int (*VcdqCmdProc)(Vcdq *vcdq,
                           Tcl_Interp *interp,
                           int objc,
                           Tcl_Obj *const objv[]);

class VcdqCmd
{
public:
  const char *name;
  const char *usage;
  int min_args;
  // -1 for no limit.
  int max_args;
  VcdqCmdProc proc;
  Vcdq *vcdq;
};

extern "C" {

static int
vcdqCmdProc(ClientData client_data,
            Tcl_Interp *interp,
            int objc,
            Tcl_Obj *const objv[]);
static void
vcdqCmdDelete(ClientData client_data);

} // extern "C"

static int
vcdqCmdProc(ClientData client_data,
            Tcl_Interp *interp,
            int objc,
            Tcl_Obj *const objv[])
{
  VcdqCmd *cmd = static_cast<VcdqCmd*>(client_data);
  int arg_count = objc - 1;
  if (arg_count < cmd->min_args
      || (cmd->max_args >= 0 && arg_count > cmd->max_args)) {
    Tcl_WrongNumArgs(interp, 1, objv, cmd->usage);
    return TCL_ERROR;
  }
  return tclCatchExceptions(interp, [=]() {
    return cmd->proc(cmd->vcdq, interp, objc, objv);
  });
}

static void
vcdqCmdDelete(ClientData client_data)
{
  delete static_cast<VcdqCmd*>(client_data);
}

////////////////////////////////////////////////////////////////

// Identifier, full name or name suffix.
static const VcdSignal &
findSignalArg(const Vcd &vcd,
              const char *arg)
{
  const VcdSignal *signal = vcd.findSignal(arg);
  if (signal == nullptr)
    signal = vcd.findSignalByName(arg);
  if (signal == nullptr)
    signal = vcd.findSignalBySuffix(arg);
  if (signal == nullptr)
    throw VcdUnboundSignal(arg);
  return *signal;
}

static int
readVcdCmd(Vcdq *vcdq,
           Tcl_Interp *,
           int,
           Tcl_Obj *const objv[])
{
  vcdq->readVcd(Tcl_GetString(objv[1]));
  return TCL_OK;
}

static int
reportVcdSignalsCmd(Vcdq *vcdq,
                    Tcl_Interp *,
                    int,
                    Tcl_Obj *const [])
{
  reportVcdSignals(vcdq->vcd(), vcdq->report());
  return TCL_OK;
}

static int
reportVcdValueCmd(Vcdq *vcdq,
                  Tcl_Interp *interp,
                  int,
                  Tcl_Obj *const objv[])
{
  const Vcd &vcd = vcdq->vcd();
  const VcdSignal &signal = findSignalArg(vcd, Tcl_GetString(objv[1]));
  VcdTime time;
  if (!tclTimeArg(objv[2], interp, time))
    return TCL_ERROR;
  reportVcdValue(vcd, signal, time, vcdq->report());
  return TCL_OK;
}

static int
reportVcdChangesCmd(Vcdq *vcdq,
                    Tcl_Interp *,
                    int,
                    Tcl_Obj *const objv[])
{
  const Vcd &vcd = vcdq->vcd();
  const VcdSignal &signal = findSignalArg(vcd, Tcl_GetString(objv[1]));
  reportVcdValues(vcd, signal, vcdq->report());
  return TCL_OK;
}

static int
reportVcdTransitionsCmd(Vcdq *vcdq,
                        Tcl_Interp *,
                        int,
                        Tcl_Obj *const objv[])
{
  const Vcd &vcd = vcdq->vcd();
  const VcdSignal &signal = findSignalArg(vcd, Tcl_GetString(objv[1]));
  reportVcdTransitions(vcd, signal, vcdq->report());
  return TCL_OK;
}

static int
reportVcdWaveformsCmd(Vcdq *vcdq,
                      Tcl_Interp *,
                      int,
                      Tcl_Obj *const [])
{
  reportVcdWaveforms(vcdq->vcd(), vcdq->report());
  return TCL_OK;
}

static int
reportVcdActivityCmd(Vcdq *vcdq,
                     Tcl_Interp *,
                     int,
                     Tcl_Obj *const [])
{
  reportVcdActivity(vcdq->vcd(), vcdq->report());
  return TCL_OK;
}

static int
reportVcdDiagnosticsCmd(Vcdq *vcdq,
                        Tcl_Interp *,
                        int,
                        Tcl_Obj *const [])
{
  reportVcdDiagnostics(vcdq->vcd(), vcdq->vcdFilename().c_str(),
                       vcdq->report());
  return TCL_OK;
}

// write_vcd_csv [-signals signals] [-times times] filename
static int
writeVcdCsvCmd(Vcdq *vcdq,
               Tcl_Interp *interp,
               int objc,
               Tcl_Obj *const objv[])
{
  const Vcd &vcd = vcdq->vcd();
  StringVector signal_args;
  bool has_signals = false;
  VcdTimeSeq times;
  bool has_times = false;
  const char *filename = nullptr;
  for (int i = 1; i < objc; i++) {
    const char *arg = Tcl_GetString(objv[i]);
    if (stringEq(arg, "-signals") && i + 1 < objc) {
      if (!tclListStrings(objv[++i], interp, signal_args))
        return TCL_ERROR;
      has_signals = true;
    }
    else if (stringEq(arg, "-times") && i + 1 < objc) {
      if (!tclListTimes(objv[++i], interp, times))
        return TCL_ERROR;
      has_times = true;
    }
    else if (arg[0] == '-' || filename) {
      tclArgError(interp, vcdq->report(), 1320,
                  "write_vcd_csv unexpected argument %s.", arg);
      return TCL_ERROR;
    }
    else
      filename = arg;
  }
  if (filename == nullptr) {
    Tcl_WrongNumArgs(interp, 1, objv, "?-signals signals? ?-times times? filename");
    return TCL_ERROR;
  }

  VcdIdSeq ids;
  if (has_signals) {
    for (const string &signal_arg : signal_args)
      ids.push_back(findSignalArg(vcd, signal_arg.c_str()).id());
  }
  else {
    for (const VcdSignal *signal : vcd.signals())
      ids.push_back(signal->id());
  }
  VcdTimeGrid grid = has_times
    ? VcdTimeGrid::times(times)
    : VcdTimeGrid::allChangeTimes();
  VcdTable table = vcd.project(ids, grid);
  VcdCsvWriter writer(&vcd, vcdq);
  writer.writeTable(table, filename);
  return TCL_OK;
}

static int
writeVcdSummaryCmd(Vcdq *vcdq,
                   Tcl_Interp *,
                   int,
                   Tcl_Obj *const objv[])
{
  const Vcd &vcd = vcdq->vcd();
  VcdCsvWriter writer(&vcd, vcdq);
  writer.writeSummary(Tcl_GetString(objv[1]));
  return TCL_OK;
}

static int
writeVcdSignalCsvCmd(Vcdq *vcdq,
                     Tcl_Interp *,
                     int,
                     Tcl_Obj *const objv[])
{
  const Vcd &vcd = vcdq->vcd();
  const VcdSignal &signal = findSignalArg(vcd, Tcl_GetString(objv[1]));
  VcdCsvWriter writer(&vcd, vcdq);
  writer.writeSignal(signal, Tcl_GetString(objv[2]));
  return TCL_OK;
}

static int
setVcdVariableCmd(Vcdq *vcdq,
                  Tcl_Interp *interp,
                  int,
                  Tcl_Obj *const objv[])
{
  Variables *variables = vcdq->variables();
  const char *name = Tcl_GetString(objv[1]);
  const char *value = Tcl_GetString(objv[2]);
  if (stringEq(name, "pad_policy")) {
    VectorPadPolicy policy;
    if (!findVectorPadPolicy(value, policy)) {
      tclArgError(interp, vcdq->report(), 1321,
                  "pad_policy %s is not zero or extend.", value);
      return TCL_ERROR;
    }
    variables->setVectorPadPolicy(policy);
  }
  else if (stringEq(name, "report_diagnostics")
           || stringEq(name, "csv_time_units")) {
    int enabled;
    if (Tcl_GetBooleanFromObj(interp, objv[2], &enabled) != TCL_OK)
      return TCL_ERROR;
    if (stringEq(name, "report_diagnostics"))
      variables->setReportDiagnostics(enabled);
    else
      variables->setCsvTimeUnits(enabled);
  }
  else if (stringEq(name, "csv_separator")) {
    if (strlen(value) != 1) {
      tclArgError(interp, vcdq->report(), 1322,
                  "csv_separator %s is not a single character.", value);
      return TCL_ERROR;
    }
    variables->setCsvSeparator(value[0]);
  }
  else {
    tclArgError(interp, vcdq->report(), 1323,
                "unknown variable %s.", name);
    return TCL_ERROR;
  }
  return TCL_OK;
}

static int
setDebugLevelCmd(Vcdq *vcdq,
                 Tcl_Interp *interp,
                 int,
                 Tcl_Obj *const objv[])
{
  int level;
  if (Tcl_GetIntFromObj(interp, objv[2], &level) != TCL_OK)
    return TCL_ERROR;
  vcdq->setDebugLevel(Tcl_GetString(objv[1]), level);
  return TCL_OK;
}

static int
vcdMaxTimeCmd(Vcdq *vcdq,
              Tcl_Interp *interp,
              int,
              Tcl_Obj *const [])
{
  Tcl_SetObjResult(interp, Tcl_NewWideIntObj(vcdq->vcd().timeMax()));
  return TCL_OK;
}

static int
vcdValueCmd(Vcdq *vcdq,
            Tcl_Interp *interp,
            int,
            Tcl_Obj *const objv[])
{
  const Vcd &vcd = vcdq->vcd();
  const VcdSignal &signal = findSignalArg(vcd, Tcl_GetString(objv[1]));
  VcdTime time;
  if (!tclTimeArg(objv[2], interp, time))
    return TCL_ERROR;
  const string &value = signal.valueAt(time);
  Tcl_SetObjResult(interp, Tcl_NewStringObj(value.c_str(), value.size()));
  return TCL_OK;
}

////////////////////////////////////////////////////////////////
static int
logBeginCmd(Vcdq *vcdq,
            Tcl_Interp *,
            int,
            Tcl_Obj *const objv[])
{
  vcdq->report()->logBegin(Tcl_GetString(objv[1]));
  return TCL_OK;
}

static int
logEndCmd(Vcdq *vcdq,
          Tcl_Interp *,
          int,
          Tcl_Obj *const [])
{
  vcdq->report()->logEnd();
  return TCL_OK;
}

static int
redirectFileBeginCmd(Vcdq *vcdq,
                     Tcl_Interp *,
                     int,
                     Tcl_Obj *const objv[])
{
  vcdq->report()->redirectFileBegin(Tcl_GetString(objv[1]));
  return TCL_OK;
}

static int
redirectFileAppendBeginCmd(Vcdq *vcdq,
                           Tcl_Interp *,
                           int,
                           Tcl_Obj *const objv[])
{
  vcdq->report()->redirectFileAppendBegin(Tcl_GetString(objv[1]));
  return TCL_OK;
}

static int
redirectFileEndCmd(Vcdq *vcdq,
                   Tcl_Interp *,
                   int,
                   Tcl_Obj *const [])
{
  vcdq->report()->redirectFileEnd();
  return TCL_OK;
}

// suppress_msg/unsuppress_msg msg_id...
static int
setMsgSuppressed(Vcdq *vcdq,
                 Tcl_Interp *interp,
                 int objc,
                 Tcl_Obj *const objv[],
                 bool suppress)
{
  Report *report = vcdq->report();
  for (int i = 1; i < objc; i++) {
    int id;
    if (Tcl_GetIntFromObj(interp, objv[i], &id) != TCL_OK)
      return TCL_ERROR;
    if (suppress)
      report->suppressMsgId(id);
    else
      report->unsuppressMsgId(id);
  }
  return TCL_OK;
}

static int
suppressMsgCmd(Vcdq *vcdq,
               Tcl_Interp *interp,
               int objc,
               Tcl_Obj *const objv[])
{
  return setMsgSuppressed(vcdq, interp, objc, objv, true);
}

static int
unsuppressMsgCmd(Vcdq *vcdq,
                 Tcl_Interp *interp,
                 int objc,
                 Tcl_Obj *const objv[])
{
  return setMsgSuppressed(vcdq, interp, objc, objv, false);
}


static const VcdqCmd vcdq_cmds[] = {
  {"read_vcd", "filename", 1, 1, readVcdCmd, nullptr},
  {"report_vcd_signals", "", 0, 0, reportVcdSignalsCmd, nullptr},
  {"report_vcd_value", "signal time", 2, 2, reportVcdValueCmd, nullptr},
  {"report_vcd_changes", "signal", 1, 1, reportVcdChangesCmd, nullptr},
  {"report_vcd_transitions", "signal", 1, 1, reportVcdTransitionsCmd, nullptr},
  {"report_vcd_waveforms", "", 0, 0, reportVcdWaveformsCmd, nullptr},
  {"report_vcd_activity", "", 0, 0, reportVcdActivityCmd, nullptr},
  {"report_vcd_diagnostics", "", 0, 0, reportVcdDiagnosticsCmd, nullptr},
  {"write_vcd_csv", "?-signals signals? ?-times times? filename", 1, 5,
   writeVcdCsvCmd, nullptr},
  {"write_vcd_summary", "filename", 1, 1, writeVcdSummaryCmd, nullptr},
  {"write_vcd_signal_csv", "signal filename", 2, 2, writeVcdSignalCsvCmd, nullptr},
  {"set_vcd_variable", "name value", 2, 2, setVcdVariableCmd, nullptr},
  {"set_debug_level", "what level", 2, 2, setDebugLevelCmd, nullptr},
  {"vcd_max_time", "", 0, 0, vcdMaxTimeCmd, nullptr},
  {"vcd_value", "signal time", 2, 2, vcdValueCmd, nullptr},
  {"log_begin", "filename", 1, 1, logBeginCmd, nullptr},
  {"log_end", "", 0, 0, logEndCmd, nullptr},
  {"redirect_file_begin", "filename", 1, 1, redirectFileBeginCmd, nullptr},
  {"redirect_file_append_begin", "filename", 1, 1,
   redirectFileAppendBeginCmd, nullptr},
  {"redirect_file_end", "", 0, 0, redirectFileEndCmd, nullptr},
  {"suppress_msg", "msg_id...", 1, -1, suppressMsgCmd, nullptr},
  {"unsuppress_msg", "msg_id...", 1, -1, unsuppressMsgCmd, nullptr}
};

void
defineVcdqCmds(Tcl_Interp *interp,
               Vcdq *vcdq)
{
  for (const VcdqCmd &cmd_def : vcdq_cmds) {
    VcdqCmd *cmd = new VcdqCmd(cmd_def);
    cmd->vcdq = vcdq;
    Tcl_CreateObjCommand(interp, cmd->name, vcdqCmdProc, cmd, vcdqCmdDelete);
  }
}

} // namespace
