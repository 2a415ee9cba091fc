#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdio>

#include "Report.hh"
#include "Debug.hh"
#include "Variables.hh"
#include "VcdqState.hh"
#include "Vcd.hh"
#include "VcdReader.hh"
#include "VcdTable.hh"
#include "VcdCsv.hh"
#include "VcdActivity.hh"
#include "ReportVcd.hh"

namespace vcdq {

static const char *report_vcd =
  "$date today $end\n"
  "$timescale 10ps $end\n"
  "$var wire 1 ! a $end\n"
  "$var wire 1 \" b $end\n"
  "$var wire 2 # bus $end\n"
  "$enddefinitions $end\n"
  "#0\n"
  "0!\n"
  "x\"\n"
  "b0 #\n"
  "#5\n"
  "1\"\n"
  "#10\n"
  "1!\n"
  "b1 #\n"
  "#15\n"
  "0\"\n"
  "#20\n"
  "b11 #\n"
  "#30\n"
  "0!\n"
  "#40\n";

static std::string
readFile(const char *filename)
{
  std::ifstream stream(filename);
  std::stringstream text;
  text << stream.rdbuf();
  return text.str();
}

class ReportVcdTest : public ::testing::Test
{
protected:
  ReportVcdTest() :
    debug_(&report_),
    state_(&report_, &debug_, &variables_)
  {
  }

  void SetUp() override
  {
    vcd_ = readVcdString(report_vcd, &state_);
  }

  void TearDown() override
  {
    remove(csv_filename_);
  }

  std::string writeTable(const VcdIdSeq &ids,
                         const VcdTimeGrid &grid)
  {
    VcdCsvWriter writer(&vcd_, &state_);
    writer.writeTable(vcd_.project(ids, grid), csv_filename_);
    return readFile(csv_filename_);
  }

  Report report_;
  Debug debug_;
  Variables variables_;
  VcdqState state_;
  Vcd vcd_;
  const char *csv_filename_ = "/tmp/vcdq_test_report.csv";
};

TEST_F(ReportVcdTest, CsvTable)
{
  EXPECT_EQ(writeTable({"!", "#"}, VcdTimeGrid::allChangeTimes()),
            "Time (10ps),a,bus\n"
            "0,0,00\n"
            "10,1,01\n"
            "20,1,11\n"
            "30,0,11\n");
}

TEST_F(ReportVcdTest, CsvTableExplicitTimes)
{
  EXPECT_EQ(writeTable({"\""}, VcdTimeGrid::times({12, 2, 12})),
            "Time (10ps),b\n"
            "2,x\n"
            "12,1\n");
}

TEST_F(ReportVcdTest, CsvSeparator)
{
  variables_.setCsvSeparator(';');
  EXPECT_EQ(writeTable({"!", "#"}, VcdTimeGrid::times({10})),
            "Time (10ps);a;bus\n"
            "10;1;01\n");
}

TEST_F(ReportVcdTest, CsvTimeUnits)
{
  variables_.setCsvTimeUnits(true);
  EXPECT_EQ(writeTable({"!"}, VcdTimeGrid::times({0, 10})),
            "Time (s),a\n"
            "0.000000e+00,0\n"
            "1.000000e-10,1\n");
}

TEST_F(ReportVcdTest, CsvSignal)
{
  VcdCsvWriter writer(&vcd_, &state_);
  writer.writeSignal(vcd_.signal("#"), csv_filename_);
  EXPECT_EQ(readFile(csv_filename_),
            "Time (10ps),bus\n"
            "0,00\n"
            "10,01\n"
            "20,11\n");
}

TEST_F(ReportVcdTest, CsvSummary)
{
  VcdCsvWriter writer(&vcd_, &state_);
  writer.writeSummary(csv_filename_);
  EXPECT_EQ(readFile(csv_filename_),
            "Signal Name,Width (bits),Total Changes,Current Value\n"
            "a,1,3,0\n"
            "b,1,3,0\n"
            "bus,2,3,11\n");
}

TEST_F(ReportVcdTest, CsvQuote)
{
  VcdCsvWriter writer(&vcd_, &state_);
  EXPECT_EQ(writer.quote("top.a"), "top.a");
  EXPECT_EQ(writer.quote("a,b"), "\"a,b\"");
  EXPECT_EQ(writer.quote("say \"hi\""), "\"say \"\"hi\"\"\"");
  EXPECT_EQ(writer.quote("two\nlines"), "\"two\nlines\"");

  variables_.setCsvSeparator(';');
  VcdCsvWriter writer2(&vcd_, &state_);
  EXPECT_EQ(writer2.quote("a,b"), "a,b");
  EXPECT_EQ(writer2.quote("a;b"), "\"a;b\"");
}

TEST_F(ReportVcdTest, CsvNotWritable)
{
  VcdCsvWriter writer(&vcd_, &state_);
  EXPECT_THROW(writer.writeSummary("/nonexistent_vcdq_dir/summary.csv"),
               FileNotWritable);
}

TEST_F(ReportVcdTest, Activity)
{
  VcdTime time_max = vcd_.timeMax();
  ASSERT_EQ(time_max, 40);

  VcdActivity a = findVcdActivity(vcd_.signal("!"), time_max);
  EXPECT_EQ(a.changeCount(), 3u);
  EXPECT_DOUBLE_EQ(a.transitionCount(), 2.0);
  EXPECT_EQ(a.highTime(), 20);
  EXPECT_DOUBLE_EQ(a.duty(), 0.5);
  EXPECT_EQ(a.finalValue(), "0");

  // x -> 1 counts half.
  VcdActivity b = findVcdActivity(vcd_.signal("\""), time_max);
  EXPECT_DOUBLE_EQ(b.transitionCount(), 1.5);
  EXPECT_EQ(b.highTime(), 10);
  EXPECT_DOUBLE_EQ(b.duty(), 0.25);

  VcdActivity bus = findVcdActivity(vcd_.signal("#"), time_max);
  EXPECT_EQ(bus.changeCount(), 3u);
  EXPECT_DOUBLE_EQ(bus.transitionCount(), 2.0);
  EXPECT_EQ(bus.highTime(), 0);
  EXPECT_DOUBLE_EQ(bus.duty(), 0.0);
  EXPECT_EQ(bus.finalValue(), "11");
}

TEST_F(ReportVcdTest, BitActivity)
{
  VcdBitActivities bits = findVcdBitActivities(vcd_.signal("#"),
                                               vcd_.timeMax());
  ASSERT_EQ(bits.size(), 2u);
  // Bit 0 is the lsb.
  EXPECT_DOUBLE_EQ(bits[0].transitionCount(), 1.0);
  EXPECT_EQ(bits[0].highTime(), 30);
  EXPECT_DOUBLE_EQ(bits[0].duty(), 0.75);
  EXPECT_DOUBLE_EQ(bits[1].transitionCount(), 1.0);
  EXPECT_EQ(bits[1].highTime(), 20);
  EXPECT_EQ(bits[0].finalValue(), "1");
  EXPECT_EQ(bits[1].finalValue(), "1");
}

TEST_F(ReportVcdTest, BitActivityOutsideWidth)
{
  const VcdSignal &bus = vcd_.signal("#");
  for (size_t bit : std::vector<size_t>{2, 64, static_cast<size_t>(-1)}) {
    VcdActivity activity = findVcdBitActivity(bus, bit, vcd_.timeMax());
    EXPECT_EQ(activity.changeCount(), 0u);
    EXPECT_DOUBLE_EQ(activity.transitionCount(), 0.0);
    EXPECT_EQ(activity.highTime(), 0);
  }
  VcdActivity scalar = findVcdBitActivity(vcd_.signal("!"), 1,
                                          vcd_.timeMax());
  EXPECT_EQ(scalar.changeCount(), 0u);
}

TEST_F(ReportVcdTest, ActivityNoChanges)
{
  Vcd vcd = readVcdString("$var wire 1 ! a $end\n"
                          "$enddefinitions $end\n",
                          &state_);
  VcdActivity activity = findVcdActivity(vcd.signal("!"), vcd.timeMax());
  EXPECT_EQ(activity.changeCount(), 0u);
  EXPECT_DOUBLE_EQ(activity.transitionCount(), 0.0);
  EXPECT_DOUBLE_EQ(activity.duty(), 0.0);
  EXPECT_EQ(activity.finalValue(), "x");
}

TEST_F(ReportVcdTest, ReportSignals)
{
  report_.redirectStringBegin();
  reportVcdSignals(vcd_, &report_);
  std::string out = report_.redirectStringEnd();
  EXPECT_EQ(out,
            "Date: today\n"
            "Timescale: 10ps\n"
            "Max time: 40\n"
            "Signals: 3\n"
            " !  wire     " "     1" "       3 a\n"
            " \"  wire     " "     1" "       3 b\n"
            " #  wire     " "     2" "       3 bus\n");
}

TEST_F(ReportVcdTest, ReportValues)
{
  report_.redirectStringBegin();
  reportVcdValues(vcd_, vcd_.signal("!"), &report_);
  std::string out = report_.redirectStringEnd();
  EXPECT_EQ(out,
            "0 0.00e+00 0\n"
            "10 1.00e-10 1\n"
            "30 3.00e-10 0\n");
}

TEST_F(ReportVcdTest, ReportValue)
{
  report_.redirectStringBegin();
  reportVcdValue(vcd_, vcd_.signal("#"), 15, &report_);
  reportVcdValue(vcd_, vcd_.signal("\""), 2, &report_);
  std::string out = report_.redirectStringEnd();
  EXPECT_EQ(out, "bus 15 01\nb 2 x\n");
}

TEST_F(ReportVcdTest, ReportTransitions)
{
  report_.redirectStringBegin();
  reportVcdTransitions(vcd_, vcd_.signal("!"), &report_);
  std::string out = report_.redirectStringEnd();
  EXPECT_EQ(out,
            "0 x -> 0\n"
            "10 0 -> 1\n"
            "30 1 -> 0\n");
}

TEST_F(ReportVcdTest, ReportDiagnostics)
{
  report_.redirectStringBegin();
  reportVcdDiagnostics(vcd_, "test.vcd", &report_);
  EXPECT_EQ(std::string(report_.redirectStringEnd()), "0 diagnostics.\n");

  Vcd vcd = readVcdString("$var wire 1 ! a $end\n"
                          "$enddefinitions $end\n"
                          "1@\n",
                          &state_);
  report_.redirectStringBegin();
  reportVcdDiagnostics(vcd, "test.vcd", &report_);
  EXPECT_EQ(std::string(report_.redirectStringEnd()),
            "test.vcd line 3, unknown_signal_reference: "
            "identifier @ is not declared\n"
            "1 diagnostics.\n");
}

TEST_F(ReportVcdTest, ReportActivity)
{
  report_.redirectStringBegin();
  reportVcdActivity(vcd_, &report_);
  std::string out = report_.redirectStringEnd();
  EXPECT_NE(out.find("Signal"), std::string::npos);
  EXPECT_NE(out.find("Transitions"), std::string::npos);
  EXPECT_NE(out.find("0.50"), std::string::npos);
  EXPECT_NE(out.find("1.5"), std::string::npos);
}

TEST_F(ReportVcdTest, ReportWaveforms)
{
  report_.redirectStringBegin();
  reportVcdWaveforms(vcd_, &report_);
  std::string out = report_.redirectStringEnd();
  EXPECT_NE(out.find("Timescale: 10ps"), std::string::npos);
  EXPECT_NE(out.find(" a "), std::string::npos);
  EXPECT_NE(out.find(" bus "), std::string::npos);
  EXPECT_NE(out.find("▔"), std::string::npos);
  EXPECT_NE(out.find("▁"), std::string::npos);
}

TEST(VcdHexValueTest, Digits)
{
  EXPECT_EQ(vcdHexValue("00001010"), "0A");
  EXPECT_EQ(vcdHexValue("11111"), "1F");
  EXPECT_EQ(vcdHexValue("1"), "1");
  EXPECT_EQ(vcdHexValue(""), "");
}

TEST(VcdHexValueTest, Unknown)
{
  EXPECT_EQ(vcdHexValue("10x1"), "x");
  EXPECT_EQ(vcdHexValue("zzzz"), "z");
  EXPECT_EQ(vcdHexValue("zz01"), "x");
  EXPECT_EQ(vcdHexValue("zzzz0001"), "z1");
}

} // namespace vcdq
