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


#include "Vcdq.hh"

#include "Debug.hh"
#include "Report.hh"
#include "ReportStd.hh"
#include "Variables.hh"
#include "Vcd.hh"
#include "VcdReader.hh"

namespace vcdq {

Vcdq *Vcdq::vcdq_;

Vcdq *
Vcdq::vcdq()
{
  return vcdq_;
}

void
Vcdq::setVcdq(Vcdq *vcdq)
{
  vcdq_ = vcdq;
}

Vcdq::Vcdq() :
  VcdqState()
{
  makeComponents();
}

void
Vcdq::makeComponents()
{
  makeReport();
  makeDebug();
  makeVariables();
}

void
Vcdq::makeReport()
{
  report_ = makeReportStd();
}

void
Vcdq::makeDebug()
{
  debug_ = new Debug(report_);
}

void
Vcdq::makeVariables()
{
  variables_ = new Variables;
}

Vcdq::~Vcdq()
{
  vcd_.reset();
  delete variables_;
  delete debug_;
  delete report_;
}

void
Vcdq::readVcd(const char *filename)
{
  Vcd vcd = readVcdFile(filename, this);
  vcd_ = std::make_unique<Vcd>(std::move(vcd));
  vcd_filename_ = filename;
}

void
Vcdq::readVcdString(const std::string &text)
{
  Vcd vcd = vcdq::readVcdString(text, this);
  vcd_ = std::make_unique<Vcd>(std::move(vcd));
  vcd_filename_ = "string";
}

const Vcd &
Vcdq::vcd() const
{
  if (vcd_ == nullptr)
    report_->error(1310, "no vcd has been read.");
  return *vcd_;
}

void
Vcdq::setDebugLevel(const char *what,
                    int level)
{
  debug_->setLevel(what, level);
}

} // namespace
