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


#include "VcdCsv.hh"

#include <cinttypes>

#include "Error.hh"
#include "StringUtil.hh"
#include "Variables.hh"
#include "Vcd.hh"
#include "VcdTable.hh"

namespace vcdq {

using std::string;

VcdCsvWriter::VcdCsvWriter(const Vcd *vcd,
                           const VcdqState *state) :
  VcdqState(state),
  vcd_(vcd),
  separator_(state->variables()->csvSeparator())
{
}

void
VcdCsvWriter::writeTable(const VcdTable &table,
                         const char *filename)
{
  FILE *stream = open(filename);
  StringVector header;
  header.push_back(timeHeader());
  for (const VcdSignal *signal : table.signals())
    header.push_back(signal->name());
  writeRow(stream, header);
  for (const VcdTableRow &row : table.rows()) {
    StringVector fields;
    fields.push_back(timeField(row.time()));
    fields.insert(fields.end(), row.values().begin(), row.values().end());
    writeRow(stream, fields);
  }
  close(stream, filename);
}

void
VcdCsvWriter::writeSignal(const VcdSignal &signal,
                          const char *filename)
{
  FILE *stream = open(filename);
  writeRow(stream, {timeHeader(), signal.name()});
  for (const VcdChange &change : signal.changes())
    writeRow(stream, {timeField(change.time()), change.value()});
  close(stream, filename);
}

void
VcdCsvWriter::writeSummary(const char *filename)
{
  FILE *stream = open(filename);
  writeRow(stream, {"Signal Name", "Width (bits)", "Total Changes",
                    "Current Value"});
  for (const VcdSignal *signal : vcd_->signals())
    writeRow(stream, {signal->name(),
                      std::to_string(signal->width()),
                      std::to_string(signal->changeCount()),
                      signal->finalValue()});
  close(stream, filename);
}

string
VcdCsvWriter::quote(const string &field) const
{
  if (field.find_first_of(string(1, separator_) + "\"\r\n") == string::npos)
    return field;
  string quoted = "\"";
  for (char ch : field) {
    if (ch == '"')
      quoted += '"';
    quoted += ch;
  }
  quoted += '"';
  return quoted;
}

string
VcdCsvWriter::timeHeader() const
{
  if (variables_->csvTimeUnits())
    return "Time (s)";
  const VcdTimescale &timescale = vcd_->timescale();
  return stdstrPrint("Time (%d%s)",
                     timescale.magnitude(),
                     timescale.unit().c_str());
}

string
VcdCsvWriter::timeField(VcdTime time) const
{
  if (variables_->csvTimeUnits())
    return stdstrPrint("%.6e", vcd_->timescale().timeSeconds(time));
  return stdstrPrint("%" PRId64, time);
}

FILE *
VcdCsvWriter::open(const char *filename)
{
  FILE *stream = fopen(filename, "w");
  if (stream == nullptr)
    throw FileNotWritable(filename);
  return stream;
}

void
VcdCsvWriter::close(FILE *stream,
                    const char *filename)
{
  bool failed = ferror(stream) != 0;
  if (fclose(stream) != 0 || failed)
    throw FileNotWritable(filename);
}

void
VcdCsvWriter::writeRow(FILE *stream,
                       const StringVector &fields)
{
  bool first = true;
  for (const string &field : fields) {
    if (!first)
      fputc(separator_, stream);
    fputs(quote(field).c_str(), stream);
    first = false;
  }
  fputc('\n', stream);
}

} // namespace
