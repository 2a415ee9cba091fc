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


#include "VcdSymbolTable.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "Debug.hh"
#include "StringUtil.hh"
#include "Vcd.hh"
#include "VcdDiagnosticLog.hh"
#include "VcdLex.hh"

namespace vcdq {

using std::string;

VcdSymbolTable::VcdSymbolTable(Vcd *vcd,
                               VcdDiagnosticLog *log,
                               const VcdqState *state) :
  VcdqState(state),
  vcd_(vcd),
  log_(log),
  frozen_(false)
{
}

void
VcdSymbolTable::setHeader(const VcdToken &token)
{
  if (token.key == "timescale")
    setTimescale(token);
  else if (token.key == "date")
    vcd_->date_ = token.name;
  else if (token.key == "version")
    vcd_->version_ = token.name;
  else if (token.key == "comment") {
    if (!vcd_->comment_.empty())
      vcd_->comment_ += ' ';
    vcd_->comment_ += token.name;
  }
}

void
VcdSymbolTable::setTimescale(const VcdToken &token)
{
  VcdTimescale timescale;
  if (parseTimescale(token.name, timescale)) {
    vcd_->timescale_ = timescale;
    debugPrint(debug_, "vcd_parse", 1, "timescale %d%s",
               timescale.magnitude(),
               timescale.unit().c_str());
  }
  else
    log_->record(VcdDiagnosticKind::malformed_line, token.line, token.text,
                 "timescale %s syntax error", token.name.c_str());
}

bool
VcdSymbolTable::parseTimescale(const string &body,
                               VcdTimescale &timescale)
{
  StringVector words;
  split(body, " ", words);
  string magnitude;
  string unit;
  if (words.size() == 1) {
    const string &word = words[0];
    size_t unit_begin = 0;
    while (unit_begin < word.size() && isdigit(word[unit_begin]))
      unit_begin++;
    magnitude = word.substr(0, unit_begin);
    unit = word.substr(unit_begin);
  }
  else if (words.size() == 2) {
    magnitude = words[0];
    unit = words[1];
  }
  else
    return false;

  if (!(magnitude == "1"
        || magnitude == "10"
        || magnitude == "100"))
    return false;
  double unit_scale;
  if (!findVcdTimeUnitScale(unit, unit_scale))
    return false;
  timescale = VcdTimescale(atoi(magnitude.c_str()), unit, unit_scale);
  return true;
}

void
VcdSymbolTable::enterScope(const VcdToken &token)
{
  scope_.push_back(token.name);
  debugPrint(debug_, "vcd_parse", 2, "scope %s %s",
             token.key.c_str(),
             token.name.c_str());
}

void
VcdSymbolTable::exitScope(const VcdToken &token)
{
  if (scope_.empty())
    log_->record(VcdDiagnosticKind::malformed_line, token.line, token.text,
                 "$upscope without a matching $scope");
  else
    scope_.pop_back();
}

void
VcdSymbolTable::declare(const VcdToken &token)
{
  const string &id = token.id;
  if (vcd_->id_index_map_.find(id) != vcd_->id_index_map_.end()) {
    const VcdSignal *prev = vcd_->findSignal(id);
    log_->record(VcdDiagnosticKind::duplicate_identifier, token.line, token.text,
                 "identifier %s is already declared for %s",
                 id.c_str(),
                 prev->name().c_str());
    return;
  }

  VcdVarType type = findVcdVarType(token.key);
  size_t index = vcd_->signals_.size();
  vcd_->signals_.emplace_back(id, scope_, token.name, type, token.width);
  const VcdSignal &signal = vcd_->signals_.back();
  vcd_->id_index_map_[id] = index;
  const string &name = signal.name();
  auto name_itr = vcd_->name_index_map_.find(name);
  if (name_itr == vcd_->name_index_map_.end())
    vcd_->name_index_map_[name] = index;
  else
    log_->record(VcdDiagnosticKind::duplicate_name, token.line, token.text,
                 "%s is already declared with identifier %s",
                 name.c_str(),
                 vcd_->signals_[name_itr->second].id().c_str());

  vcd_->max_var_width_ = std::max(vcd_->max_var_width_, signal.width());
  vcd_->max_var_name_length_ = std::max(vcd_->max_var_name_length_,
                                        name.size());
  debugPrint(debug_, "vcd_parse", 2, "var %s %s %zu %s",
             vcdVarTypeName(type),
             id.c_str(),
             signal.width(),
             name.c_str());
}

void
VcdSymbolTable::freeze()
{
  frozen_ = true;
  debugPrint(debug_, "vcd_parse", 1, "%zu signals declared",
             vcd_->signals_.size());
}

} // namespace
