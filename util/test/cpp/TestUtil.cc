#include <gtest/gtest.h>
#include <string>
#include <cstdio>
#include <cstring>
#include "StringUtil.hh"
#include "Report.hh"
#include "ReportStd.hh"
#include "Error.hh"
#include "Debug.hh"
#include "Machine.hh"
#include "Stats.hh"
#include "Variables.hh"
#include "VcdqState.hh"
#include "util/EnumNameMap.hh"

namespace vcdq {

////////////////////////////////////////////////////////////////
// StringUtil tests
////////////////////////////////////////////////////////////////

TEST(StringUtilTest, StringEqEqual)
{
  EXPECT_TRUE(stringEq("hello", "hello"));
  EXPECT_TRUE(stringEq("", ""));
}

TEST(StringUtilTest, StringEqNotEqual)
{
  EXPECT_FALSE(stringEq("hello", "world"));
  EXPECT_FALSE(stringEq("hello", "Hello"));
}

TEST(StringUtilTest, IsDigitsTrue)
{
  EXPECT_TRUE(isDigits("12345"));
  EXPECT_TRUE(isDigits("0"));
}

TEST(StringUtilTest, IsDigitsFalse)
{
  EXPECT_FALSE(isDigits("abc"));
  EXPECT_FALSE(isDigits("123abc"));
  EXPECT_FALSE(isDigits("-1"));
  // Empty string returns true (no non-digit characters)
  EXPECT_TRUE(isDigits(""));
}

TEST(StringUtilTest, StringEndEqual)
{
  EXPECT_TRUE(stringEndEqual("top.cpu.clk", "clk"));
  EXPECT_TRUE(stringEndEqual("top.cpu.clk", "CPU.CLK"));
  EXPECT_TRUE(stringEndEqual("clk", "clk"));
  EXPECT_FALSE(stringEndEqual("clk", "top.clk"));
  EXPECT_FALSE(stringEndEqual("top.cpu.clk", "rst"));
}

TEST(StringUtilTest, SplitBasic)
{
  StringVector tokens;
  split("one,two,three", ",", tokens);
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], "one");
  EXPECT_EQ(tokens[1], "two");
  EXPECT_EQ(tokens[2], "three");
}

TEST(StringUtilTest, SplitRepeatedDelimiters)
{
  StringVector tokens;
  split("  $var \t wire  1 ! clk $end  ", " \t", tokens);
  ASSERT_EQ(tokens.size(), 6u);
  EXPECT_EQ(tokens[0], "$var");
  EXPECT_EQ(tokens[1], "wire");
  EXPECT_EQ(tokens[5], "$end");
}

TEST(StringUtilTest, SplitEmpty)
{
  StringVector tokens;
  split("", " ", tokens);
  EXPECT_TRUE(tokens.empty());
  split("   ", " ", tokens);
  EXPECT_TRUE(tokens.empty());
}

TEST(StringUtilTest, Join)
{
  EXPECT_EQ(join({"top", "cpu", "clk"}, '.'), "top.cpu.clk");
  EXPECT_EQ(join({"clk"}, '.'), "clk");
  EXPECT_EQ(join({}, '.'), "");
}

TEST(StringUtilTest, TrimRight)
{
  std::string str = "value   ";
  trimRight(str);
  EXPECT_EQ(str, "value");
  std::string spaces = "   ";
  trimRight(spaces);
  EXPECT_EQ(spaces, "");
}

TEST(StringUtilTest, StdstrPrint)
{
  EXPECT_EQ(stdstrPrint("%d-%s", 42, "x"), "42-x");
}

TEST(StringUtilTest, StringPrintLong)
{
  std::string arg(1000, 'a');
  std::string str;
  stringPrint(str, "<%s>", arg.c_str());
  EXPECT_EQ(str.size(), 1002u);
  EXPECT_EQ(str.front(), '<');
  EXPECT_EQ(str.back(), '>');
}

TEST(StringUtilTest, StringAppend)
{
  std::string str = "time";
  stringAppend(str, " %d", 10);
  EXPECT_EQ(str, "time 10");
}

////////////////////////////////////////////////////////////////
// EnumNameMap tests
////////////////////////////////////////////////////////////////

enum class TestColor { red, green, blue };

TEST(EnumNameMapTest, FindName)
{
  EnumNameMap<TestColor> color_map = {{TestColor::red, "red"},
                                      {TestColor::green, "green"}};
  EXPECT_STREQ(color_map.find(TestColor::red), "red");
  EXPECT_EQ(color_map.find(TestColor::blue), nullptr);
}

TEST(EnumNameMapTest, FindKey)
{
  EnumNameMap<TestColor> color_map = {{TestColor::red, "red"},
                                      {TestColor::green, "green"}};
  EXPECT_EQ(color_map.find("green", TestColor::blue), TestColor::green);
  EXPECT_EQ(color_map.find("purple", TestColor::blue), TestColor::blue);
  TestColor color;
  bool exists;
  color_map.find("red", color, exists);
  EXPECT_TRUE(exists);
  EXPECT_EQ(color, TestColor::red);
  color_map.find("cyan", color, exists);
  EXPECT_FALSE(exists);
}

////////////////////////////////////////////////////////////////
// Exception tests
////////////////////////////////////////////////////////////////

TEST(ExceptionTest, ExceptionMsg)
{
  ExceptionMsg e("test message", false);
  EXPECT_STREQ(e.what(), "test message");
  EXPECT_FALSE(e.suppressed());
}

TEST(ExceptionTest, ExceptionMsgSuppressed)
{
  ExceptionMsg e("suppressed message", true);
  EXPECT_TRUE(e.suppressed());
}

TEST(ExceptionTest, FileNotReadable)
{
  FileNotReadable e("/no/such/file.vcd");
  std::string what = e.what();
  EXPECT_NE(what.find("cannot read"), std::string::npos);
  EXPECT_NE(what.find("/no/such/file.vcd"), std::string::npos);
}

TEST(ExceptionTest, FileNotWritable)
{
  FileNotWritable e("/no/such/out.csv");
  std::string what = e.what();
  EXPECT_NE(what.find("cannot write"), std::string::npos);
  EXPECT_NE(what.find("/no/such/out.csv"), std::string::npos);
}

TEST(ExceptionTest, CatchAsStdException)
{
  try {
    throw FileNotReadable("a.vcd");
  }
  catch (const std::exception &e) {
    EXPECT_NE(std::string(e.what()).find("a.vcd"), std::string::npos);
  }
}

////////////////////////////////////////////////////////////////
// Report tests
////////////////////////////////////////////////////////////////

TEST(ReportTest, BasicConstruction)
{
  Report report;
  EXPECT_EQ(Report::defaultReport(), &report);
}

TEST(ReportTest, DestructorClearsDefault)
{
  {
    Report report;
    EXPECT_EQ(Report::defaultReport(), &report);
  }
  EXPECT_EQ(Report::defaultReport(), nullptr);
}

TEST(ReportTest, RedirectStringBasic)
{
  Report report;
  report.redirectStringBegin();
  report.reportLineString("hello world");
  const char *result = report.redirectStringEnd();
  EXPECT_STREQ(result, "hello world\n");
}

TEST(ReportTest, RedirectStringMultipleLines)
{
  Report report;
  report.redirectStringBegin();
  report.reportLineString("line1");
  report.reportLineString(std::string("line2"));
  report.reportBlankLine();
  const char *result = report.redirectStringEnd();
  EXPECT_STREQ(result, "line1\nline2\n\n");
}

TEST(ReportTest, ReportLineFormatted)
{
  Report report;
  report.redirectStringBegin();
  report.reportLine("value=%d", 42);
  EXPECT_STREQ(report.redirectStringEnd(), "value=42\n");
}

TEST(ReportTest, ReportLineGrowsBuffer)
{
  Report report;
  std::string arg(5000, 'v');
  report.redirectStringBegin();
  report.reportLine("%s", arg.c_str());
  std::string s(report.redirectStringEnd());
  EXPECT_EQ(s, arg + "\n");
}

TEST(ReportTest, LogToFile)
{
  Report report;
  const char *tmpfile = "/tmp/test_vcdq_report_log.txt";
  report.logBegin(tmpfile);
  report.redirectStringBegin();
  report.reportLineString("log test line");
  report.redirectStringEnd();
  report.reportLineString("logged line");
  report.logEnd();
  FILE *f = fopen(tmpfile, "r");
  ASSERT_NE(f, nullptr);
  char buf[256];
  ASSERT_NE(fgets(buf, sizeof(buf), f), nullptr);
  fclose(f);
  EXPECT_STREQ(buf, "logged line\n");
  std::remove(tmpfile);
}

TEST(ReportTest, RedirectFileAppendBegin)
{
  Report report;
  const char *tmpfile = "/tmp/test_vcdq_report_append.txt";
  report.redirectFileBegin(tmpfile);
  report.reportLineString("first");
  report.redirectFileEnd();
  report.redirectFileAppendBegin(tmpfile);
  report.reportLineString("second");
  report.redirectFileEnd();

  FILE *f = fopen(tmpfile, "r");
  ASSERT_NE(f, nullptr);
  char content[512] = {};
  size_t bytes_read = fread(content, 1, sizeof(content) - 1, f);
  fclose(f);
  EXPECT_GT(bytes_read, 0u);
  EXPECT_STREQ(content, "first\nsecond\n");
  std::remove(tmpfile);
}

TEST(ReportTest, EndWithoutBegin)
{
  ASSERT_NO_THROW(( [&](){
  Report report;
  report.logEnd();
  report.redirectFileEnd();

  }() ));
}

TEST(ReportTest, RedirectFileNotWritable)
{
  Report report;
  EXPECT_THROW(report.redirectFileBegin("/nonexistent/path/file.txt"),
               FileNotWritable);
  EXPECT_THROW(report.redirectFileAppendBegin("/nonexistent/path/file.txt"),
               FileNotWritable);
  EXPECT_THROW(report.logBegin("/nonexistent/path/log.txt"),
               FileNotWritable);
}

TEST(ReportTest, WarnBasic)
{
  Report report;
  report.redirectStringBegin();
  report.warn(100, "something bad %d", 42);
  EXPECT_STREQ(report.redirectStringEnd(), "Warning 100: something bad 42\n");
}

TEST(ReportTest, FileWarn)
{
  Report report;
  report.redirectStringBegin();
  report.fileWarn(101, "test.vcd", 10, "missing %s", "$end");
  EXPECT_STREQ(report.redirectStringEnd(),
               "Warning 101: test.vcd line 10, missing $end\n");
}

TEST(ReportTest, ErrorMessageContent)
{
  Report report;
  try {
    report.error(200, "specific error %s", "info");
    FAIL() << "Expected ExceptionMsg";
  } catch (const ExceptionMsg &e) {
    EXPECT_STREQ(e.what(), "specific error info");
    EXPECT_FALSE(e.suppressed());
  }
}

TEST(ReportTest, SuppressWarn)
{
  Report report;
  EXPECT_FALSE(report.isSuppressed(100));
  report.suppressMsgId(100);
  EXPECT_TRUE(report.isSuppressed(100));
  report.redirectStringBegin();
  report.warn(100, "hidden");
  report.fileWarn(100, "a.vcd", 1, "hidden");
  report.warn(101, "shown");
  EXPECT_STREQ(report.redirectStringEnd(), "Warning 101: shown\n");
  report.unsuppressMsgId(100);
  EXPECT_FALSE(report.isSuppressed(100));
}

TEST(ReportTest, SuppressedErrorStillThrows)
{
  Report report;
  report.suppressMsgId(300);
  try {
    report.error(300, "quiet");
    FAIL() << "Expected ExceptionMsg";
  } catch (const ExceptionMsg &e) {
    EXPECT_TRUE(e.suppressed());
  }
}

TEST(ReportStdTest, MakeReportStd)
{
  Report *report = makeReportStd();
  ASSERT_NE(report, nullptr);
  EXPECT_EQ(Report::defaultReport(), report);
  report->redirectStringBegin();
  report->reportLine("std %s", "line");
  EXPECT_STREQ(report->redirectStringEnd(), "std line\n");
  delete report;
}

////////////////////////////////////////////////////////////////
// Debug tests
////////////////////////////////////////////////////////////////

TEST(DebugTest, BasicConstruction)
{
  Report report;
  Debug debug(&report);
  EXPECT_EQ(debug.level("vcd_parse"), 0);
  EXPECT_EQ(debug.statsLevel(), 0);
}

TEST(DebugTest, SetAndCheckLevel)
{
  Report report;
  Debug debug(&report);
  debug.setLevel("vcd_lex", 3);
  EXPECT_EQ(debug.level("vcd_lex"), 3);
  EXPECT_TRUE(debug.check("vcd_lex", 1));
  EXPECT_TRUE(debug.check("vcd_lex", 3));
  EXPECT_FALSE(debug.check("vcd_lex", 4));
  EXPECT_FALSE(debug.check("vcd_replay", 1));
}

TEST(DebugTest, SetLevelStats)
{
  Report report;
  Debug debug(&report);
  debug.setLevel("stats", 2);
  EXPECT_EQ(debug.statsLevel(), 2);
  EXPECT_FALSE(debug.check("stats", 1));
}

TEST(DebugTest, SetLevelZeroRemoves)
{
  Report report;
  Debug debug(&report);
  debug.setLevel("vcd_parse", 3);
  EXPECT_TRUE(debug.check("vcd_parse", 1));
  debug.setLevel("vcd_parse", 0);
  EXPECT_FALSE(debug.check("vcd_parse", 1));
  EXPECT_EQ(debug.level("vcd_parse"), 0);
}

TEST(DebugTest, DebugPrint)
{
  Report report;
  Debug debug(&report);
  Debug *debug_ptr = &debug;
  report.redirectStringBegin();
  debugPrint(debug_ptr, "vcd_parse", 1, "hidden %d", 1);
  debug.setLevel("vcd_parse", 1);
  debugPrint(debug_ptr, "vcd_parse", 1, "value %d", 42);
  debugPrint(debug_ptr, "vcd_parse", 2, "too deep");
  EXPECT_STREQ(report.redirectStringEnd(), "vcd_parse: value 42\n");
}

////////////////////////////////////////////////////////////////
// Machine and Stats tests
////////////////////////////////////////////////////////////////

TEST(MachineTest, RunTimes)
{
  initElapsedTime();
  EXPECT_GE(elapsedRunTime(), 0.0);
  EXPECT_GE(userRunTime(), 0.0);
  EXPECT_GE(systemRunTime(), 0.0);
}

TEST(StatsTest, SilentWithoutStatsLevel)
{
  Report report;
  Debug debug(&report);
  report.redirectStringBegin();
  Stats stats(&debug, &report);
  stats.report("read vcd");
  EXPECT_STREQ(report.redirectStringEnd(), "");
}

TEST(StatsTest, ReportsStep)
{
  Report report;
  Debug debug(&report);
  debug.setLevel("stats", 1);
  report.redirectStringBegin();
  Stats stats(&debug, &report);
  stats.report("read vcd");
  std::string s(report.redirectStringEnd());
  EXPECT_EQ(s.find("stats:"), 0u);
  EXPECT_NE(s.find("read vcd"), std::string::npos);
}

////////////////////////////////////////////////////////////////
// Variables and VcdqState tests
////////////////////////////////////////////////////////////////

TEST(VariablesTest, Defaults)
{
  Variables variables;
  EXPECT_EQ(variables.vectorPadPolicy(), VectorPadPolicy::zero);
  EXPECT_FALSE(variables.reportDiagnostics());
  EXPECT_EQ(variables.csvSeparator(), ',');
  EXPECT_FALSE(variables.csvTimeUnits());
}

TEST(VariablesTest, Setters)
{
  Variables variables;
  variables.setVectorPadPolicy(VectorPadPolicy::extend);
  variables.setReportDiagnostics(true);
  variables.setCsvSeparator(';');
  variables.setCsvTimeUnits(true);
  EXPECT_EQ(variables.vectorPadPolicy(), VectorPadPolicy::extend);
  EXPECT_TRUE(variables.reportDiagnostics());
  EXPECT_EQ(variables.csvSeparator(), ';');
  EXPECT_TRUE(variables.csvTimeUnits());
}

TEST(VariablesTest, PadPolicyNames)
{
  EXPECT_STREQ(vectorPadPolicyName(VectorPadPolicy::zero), "zero");
  EXPECT_STREQ(vectorPadPolicyName(VectorPadPolicy::extend), "extend");
  VectorPadPolicy policy = VectorPadPolicy::zero;
  EXPECT_TRUE(findVectorPadPolicy("extend", policy));
  EXPECT_EQ(policy, VectorPadPolicy::extend);
  EXPECT_FALSE(findVectorPadPolicy("sign", policy));
  EXPECT_EQ(policy, VectorPadPolicy::extend);
}

TEST(VcdqStateTest, CopyState)
{
  Report report;
  Debug debug(&report);
  Variables variables;
  VcdqState state(&report, &debug, &variables);
  VcdqState copy(&state);
  EXPECT_EQ(copy.report(), &report);
  EXPECT_EQ(copy.debug(), &debug);
  EXPECT_EQ(copy.variables(), &variables);
  VcdqState empty;
  EXPECT_EQ(empty.report(), nullptr);
  empty.copyState(&state);
  EXPECT_EQ(empty.variables(), &variables);
}

} // namespace vcdq
