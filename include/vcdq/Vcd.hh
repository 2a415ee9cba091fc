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

#include <string>
#include <unordered_map>
#include <vector>

#include "Error.hh"
#include "VcdClass.hh"
#include "VcdDiagnostic.hh"

namespace vcdq {

using std::string;
using std::vector;

class VcdSymbolTable;
class VcdReplay;
class VcdTable;

// One recorded value change.
class VcdChange
{
public:
  VcdChange(VcdTime time,
            string value);
  VcdTime time() const { return time_; }
  // 0/1/x/z digits, msb first, one per declared bit.
  const string &value() const { return value_; }
  bool operator==(const VcdChange &change) const;

private:
  VcdTime time_;
  string value_;
};

class VcdTransition
{
public:
  VcdTransition(VcdTime time,
                string from,
                string to);
  VcdTime time() const { return time_; }
  const string &from() const { return from_; }
  const string &to() const { return to_; }

private:
  VcdTime time_;
  string from_;
  string to_;
};

typedef vector<VcdTransition> VcdTransitions;

// $timescale <magnitude> <unit>
class VcdTimescale
{
public:
  // 1ns
  VcdTimescale();
  VcdTimescale(int magnitude,
               const string &unit,
               double unit_scale);
  int magnitude() const { return magnitude_; }
  const string &unit() const { return unit_; }
  // Seconds per unit.
  double unitScale() const { return unit_scale_; }
  // Seconds per log time unit.
  double scale() const { return magnitude_ * unit_scale_; }
  double timeSeconds(VcdTime time) const { return time * scale(); }

private:
  int magnitude_;
  string unit_;
  double unit_scale_;
};

// Return false if unit is not one of s, ms, us, ns, ps, fs.
bool
findVcdTimeUnitScale(const string &unit,
                     // Return value.
                     double &unit_scale);

// Declared signal and its change log.
class VcdSignal
{
public:
  VcdSignal(const string &id,
            const VcdScope &scope,
            const string &leaf_name,
            VcdVarType type,
            size_t width);
  const string &id() const { return id_; }
  // Dot separated scope path and leaf name.
  const string &name() const { return name_; }
  const string &scopePath() const { return scope_path_; }
  const string &leafName() const { return leaf_name_; }
  VcdVarType type() const { return type_; }
  size_t width() const { return width_; }
  bool isScalar() const { return width_ == 1; }
  const VcdChangeLog &changes() const { return changes_; }
  size_t changeCount() const { return changes_.size(); }
  // Width replicated 'x'.
  const string &unknownValue() const { return unknown_value_; }
  // Value of the latest change at or before time.
  // Before the first change the value is unknown.
  const string &valueAt(VcdTime time) const;
  // Value of the last change, or unknown if there are no changes.
  const string &finalValue() const;
  VcdTransitions transitions() const;
  // Changes with begin <= time <= end.
  VcdChangeLog changesBetween(VcdTime begin,
                              VcdTime end) const;

private:
  void appendChange(VcdTime time,
                    string value);

  string id_;
  string name_;
  string scope_path_;
  string leaf_name_;
  VcdVarType type_;
  size_t width_;
  string unknown_value_;
  VcdChangeLog changes_;

  friend class VcdReplay;
};

// Document built by one pass over a vcd.
// Immutable once the reader returns it.
class Vcd
{
public:
  Vcd();
  Vcd(Vcd &&vcd) = default;
  Vcd &operator=(Vcd &&vcd) = default;
  Vcd(const Vcd &vcd) = delete;
  Vcd &operator=(const Vcd &vcd) = delete;

  const string &date() const { return date_; }
  const string &comment() const { return comment_; }
  const string &version() const { return version_; }
  const VcdTimescale &timescale() const { return timescale_; }
  // Largest time marker seen.
  VcdTime timeMax() const { return time_max_; }
  // Smallest positive distance between successive time markers.
  // Zero when there are less than two distinct time markers.
  VcdTime minDeltaTime() const { return min_delta_time_; }
  size_t maxVarWidth() const { return max_var_width_; }
  size_t maxVarNameLength() const { return max_var_name_length_; }
  const VcdDiagnostics &diagnostics() const { return diagnostics_; }

  // Signals in declaration order.
  VcdSignalSeq signals() const;
  size_t signalCount() const { return signals_.size(); }
  // nullptr if id is not declared.
  const VcdSignal *findSignal(const string &id) const;
  // Full dot separated name.
  const VcdSignal *findSignalByName(const string &name) const;
  // First signal in declaration order whose name ends with suffix,
  // case insensitive, on a scope boundary.
  const VcdSignal *findSignalBySuffix(const string &suffix) const;
  // Throws VcdUnboundSignal if id is not declared.
  const VcdSignal &signal(const string &id) const;

  const string &valueAt(const string &id,
                        VcdTime time) const;
  VcdTransitions transitions(const string &id) const;
  VcdChangeLog changesBetween(const string &id,
                              VcdTime begin,
                              VcdTime end) const;
  // Time aligned table of values for the signals in ids.
  VcdTable project(const VcdIdSeq &ids,
                   const VcdTimeGrid &grid) const;

private:
  VcdSignal *findSignalEdit(const string &id);

  string date_;
  string comment_;
  string version_;
  VcdTimescale timescale_;
  VcdTime time_max_;
  VcdTime min_delta_time_;
  size_t max_var_width_;
  size_t max_var_name_length_;
  // Signal arena in declaration order.
  vector<VcdSignal> signals_;
  std::unordered_map<string, size_t> id_index_map_;
  std::unordered_map<string, size_t> name_index_map_;
  VcdDiagnostics diagnostics_;

  friend class VcdSymbolTable;
  friend class VcdReplay;
  friend class VcdParse;
};

////////////////////////////////////////////////////////////////

// Input is missing or has no content.
class VcdEmptyInput : public Exception
{
public:
  explicit VcdEmptyInput(const char *filename);
  const char *what() const noexcept override;

private:
  string msg_;
};

// Input ends without $enddefinitions.
class VcdMissingEndDefinitions : public Exception
{
public:
  explicit VcdMissingEndDefinitions(const char *filename);
  const char *what() const noexcept override;

private:
  string msg_;
};

// Query for an identifier that is not declared.
class VcdUnboundSignal : public Exception
{
public:
  explicit VcdUnboundSignal(const string &id);
  const char *what() const noexcept override;
  const string &id() const { return id_; }

private:
  string id_;
  string msg_;
};

} // namespace
