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


#include "Vcd.hh"

#include "StringUtil.hh"
#include "util/EnumNameMap.hh"

namespace vcdq {

static EnumNameMap<VcdVarType> vcd_var_type_map =
  {{VcdVarType::wire, "wire"},
   {VcdVarType::reg, "reg"},
   {VcdVarType::parameter, "parameter"},
   {VcdVarType::integer, "integer"},
   {VcdVarType::real, "real"},
   {VcdVarType::supply0, "supply0"},
   {VcdVarType::supply1, "supply1"},
   {VcdVarType::time, "time"},
   {VcdVarType::tri, "tri"},
   {VcdVarType::triand, "triand"},
   {VcdVarType::trior, "trior"},
   {VcdVarType::trireg, "trireg"},
   {VcdVarType::tri0, "tri0"},
   {VcdVarType::tri1, "tri1"},
   {VcdVarType::wand, "wand"},
   {VcdVarType::wor, "wor"},
   {VcdVarType::event, "event"},
   {VcdVarType::unknown, "unknown"}
  };

const char *
vcdVarTypeName(VcdVarType type)
{
  return vcd_var_type_map.find(type);
}

VcdVarType
findVcdVarType(const string &name)
{
  return vcd_var_type_map.find(name, VcdVarType::unknown);
}

////////////////////////////////////////////////////////////////

VcdChange::VcdChange(VcdTime time,
                     string value) :
  time_(time),
  value_(std::move(value))
{
}

bool
VcdChange::operator==(const VcdChange &change) const
{
  return time_ == change.time_
    && value_ == change.value_;
}

VcdTransition::VcdTransition(VcdTime time,
                             string from,
                             string to) :
  time_(time),
  from_(std::move(from)),
  to_(std::move(to))
{
}

////////////////////////////////////////////////////////////////

VcdTimescale::VcdTimescale() :
  magnitude_(1),
  unit_("ns"),
  unit_scale_(1e-9)
{
}

VcdTimescale::VcdTimescale(int magnitude,
                           const string &unit,
                           double unit_scale) :
  magnitude_(magnitude),
  unit_(unit),
  unit_scale_(unit_scale)
{
}

bool
findVcdTimeUnitScale(const string &unit,
                     double &unit_scale)
{
  if (unit == "s")
    unit_scale = 1.0;
  else if (unit == "ms")
    unit_scale = 1e-3;
  else if (unit == "us")
    unit_scale = 1e-6;
  else if (unit == "ns")
    unit_scale = 1e-9;
  else if (unit == "ps")
    unit_scale = 1e-12;
  else if (unit == "fs")
    unit_scale = 1e-15;
  else
    return false;
  return true;
}

////////////////////////////////////////////////////////////////

VcdSignal::VcdSignal(const string &id,
                     const VcdScope &scope,
                     const string &leaf_name,
                     VcdVarType type,
                     size_t width) :
  id_(id),
  scope_path_(join(scope, '.')),
  leaf_name_(leaf_name),
  type_(type),
  width_(width),
  unknown_value_(width, vcd_unknown_char)
{
  if (scope_path_.empty())
    name_ = leaf_name_;
  else
    name_ = scope_path_ + '.' + leaf_name_;
}

void
VcdSignal::appendChange(VcdTime time,
                        string value)
{
  changes_.emplace_back(time, std::move(value));
}

const string &
VcdSignal::finalValue() const
{
  if (changes_.empty())
    return unknown_value_;
  return changes_.back().value();
}

////////////////////////////////////////////////////////////////

Vcd::Vcd() :
  time_max_(0),
  min_delta_time_(0),
  max_var_width_(0),
  max_var_name_length_(0)
{
}

VcdSignalSeq
Vcd::signals() const
{
  VcdSignalSeq signals;
  signals.reserve(signals_.size());
  for (const VcdSignal &signal : signals_)
    signals.push_back(&signal);
  return signals;
}

const VcdSignal *
Vcd::findSignal(const string &id) const
{
  auto itr = id_index_map_.find(id);
  if (itr == id_index_map_.end())
    return nullptr;
  return &signals_[itr->second];
}

VcdSignal *
Vcd::findSignalEdit(const string &id)
{
  auto itr = id_index_map_.find(id);
  if (itr == id_index_map_.end())
    return nullptr;
  return &signals_[itr->second];
}

const VcdSignal *
Vcd::findSignalByName(const string &name) const
{
  auto itr = name_index_map_.find(name);
  if (itr == name_index_map_.end())
    return nullptr;
  return &signals_[itr->second];
}

const VcdSignal *
Vcd::findSignalBySuffix(const string &suffix) const
{
  if (suffix.empty())
    return nullptr;
  for (const VcdSignal &signal : signals_) {
    const string &name = signal.name();
    if (stringEndEqual(name, suffix)
        && (name.size() == suffix.size()
            || name[name.size() - suffix.size() - 1] == '.'))
      return &signal;
  }
  return nullptr;
}

const VcdSignal &
Vcd::signal(const string &id) const
{
  const VcdSignal *signal = findSignal(id);
  if (signal == nullptr)
    throw VcdUnboundSignal(id);
  return *signal;
}

////////////////////////////////////////////////////////////////

VcdEmptyInput::VcdEmptyInput(const char *filename) :
  Exception()
{
  msg_ = "vcd ";
  msg_ += filename;
  msg_ += " is empty.";
}

const char *
VcdEmptyInput::what() const noexcept
{
  return msg_.c_str();
}

VcdMissingEndDefinitions::VcdMissingEndDefinitions(const char *filename) :
  Exception()
{
  msg_ = "vcd ";
  msg_ += filename;
  msg_ += " is missing $enddefinitions.";
}

const char *
VcdMissingEndDefinitions::what() const noexcept
{
  return msg_.c_str();
}

VcdUnboundSignal::VcdUnboundSignal(const string &id) :
  Exception(),
  id_(id)
{
  msg_ = "vcd identifier ";
  msg_ += id;
  msg_ += " is not declared.";
}

const char *
VcdUnboundSignal::what() const noexcept
{
  return msg_.c_str();
}

} // namespace
