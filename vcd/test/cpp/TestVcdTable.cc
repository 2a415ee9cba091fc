#include <gtest/gtest.h>
#include <string>
#include "VcdTable.hh"
#include "VcdTestState.hh"

namespace vcdq {

static const char *table_vcd =
  "$var wire 1 ! a $end\n"
  "$var wire 2 # b $end\n"
  "$var wire 1 % c $end\n"
  "$enddefinitions $end\n"
  "#3\n"
  "1!\n"
  "#5\n"
  "b10 #\n"
  "0!\n"
  "#5\n"
  "1!\n"
  "#9\n"
  "b1 #\n";

class VcdTableTest : public VcdTest
{
protected:
  void SetUp() override
  {
    vcd_ = read(table_vcd);
  }

  // Rows ascending, no duplicate times and every row full.
  void checkShape(const VcdTable &table)
  {
    for (size_t row = 0; row < table.rowCount(); row++) {
      EXPECT_EQ(table.rows()[row].values().size(), table.columnCount());
      if (row > 0)
        EXPECT_LT(table.rows()[row - 1].time(), table.rows()[row].time());
    }
  }

  Vcd vcd_;
};

TEST_F(VcdTableTest, AllChangeTimes)
{
  VcdTable table = vcd_.project({"!", "#"}, VcdTimeGrid::allChangeTimes());
  checkShape(table);
  ASSERT_EQ(table.rowCount(), 3u);
  ASSERT_EQ(table.columnCount(), 2u);
  EXPECT_EQ(table.signals()[0]->id(), "!");
  EXPECT_EQ(table.signals()[1]->id(), "#");

  EXPECT_EQ(table.rows()[0].time(), 3);
  EXPECT_EQ(table.value(0, 0), "1");
  EXPECT_EQ(table.value(0, 1), "xx");

  EXPECT_EQ(table.rows()[1].time(), 5);
  EXPECT_EQ(table.value(1, 0), "1");
  EXPECT_EQ(table.value(1, 1), "10");

  EXPECT_EQ(table.rows()[2].time(), 9);
  EXPECT_EQ(table.value(2, 0), "1");
  EXPECT_EQ(table.value(2, 1), "01");
}

TEST_F(VcdTableTest, GridOnlyUsesRequestedSignals)
{
  VcdTable table = vcd_.project({"#"}, VcdTimeGrid::allChangeTimes());
  checkShape(table);
  ASSERT_EQ(table.rowCount(), 2u);
  EXPECT_EQ(table.rows()[0].time(), 5);
  EXPECT_EQ(table.rows()[1].time(), 9);
}

TEST_F(VcdTableTest, ExplicitTimesSortedUnique)
{
  VcdTable table = vcd_.project({"#", "!"},
                                VcdTimeGrid::times({8, 0, 4, 8, 100}));
  checkShape(table);
  ASSERT_EQ(table.rowCount(), 4u);
  EXPECT_EQ(table.rows()[0].time(), 0);
  EXPECT_EQ(table.value(0, 0), "xx");
  EXPECT_EQ(table.value(0, 1), "x");
  EXPECT_EQ(table.rows()[1].time(), 4);
  EXPECT_EQ(table.value(1, 1), "1");
  EXPECT_EQ(table.rows()[2].time(), 8);
  EXPECT_EQ(table.value(2, 0), "10");
  EXPECT_EQ(table.rows()[3].time(), 100);
  EXPECT_EQ(table.value(3, 0), "01");
  EXPECT_EQ(table.value(3, 1), "1");
}

TEST_F(VcdTableTest, SignalWithoutChangesIsUnknown)
{
  VcdTable table = vcd_.project({"%", "!"}, VcdTimeGrid::allChangeTimes());
  checkShape(table);
  ASSERT_EQ(table.rowCount(), 2u);
  for (size_t row = 0; row < table.rowCount(); row++)
    EXPECT_EQ(table.value(row, 0), "x");
}

TEST_F(VcdTableTest, RepeatedColumn)
{
  VcdTable table = vcd_.project({"!", "!"}, VcdTimeGrid::allChangeTimes());
  checkShape(table);
  EXPECT_EQ(table.rowCount(), 2u);
  EXPECT_EQ(table.columnCount(), 2u);
  EXPECT_EQ(table.value(1, 0), table.value(1, 1));
}

TEST_F(VcdTableTest, EmptyProjections)
{
  VcdTable no_signals = vcd_.project({}, VcdTimeGrid::allChangeTimes());
  EXPECT_EQ(no_signals.rowCount(), 0u);
  EXPECT_EQ(no_signals.columnCount(), 0u);

  VcdTable no_times = vcd_.project({"!"}, VcdTimeGrid::times({}));
  EXPECT_EQ(no_times.rowCount(), 0u);
  EXPECT_EQ(no_times.columnCount(), 1u);
}

TEST_F(VcdTableTest, UnboundSignalThrows)
{
  EXPECT_THROW(vcd_.project({"!", "@"}, VcdTimeGrid::allChangeTimes()),
               VcdUnboundSignal);
}

TEST(VcdTimeGridTest, Kinds)
{
  VcdTimeGrid all = VcdTimeGrid::allChangeTimes();
  EXPECT_TRUE(all.isAllChangeTimes());
  VcdTimeGrid times = VcdTimeGrid::times({3, 1});
  EXPECT_FALSE(times.isAllChangeTimes());
  ASSERT_EQ(times.explicitTimes().size(), 2u);
  EXPECT_EQ(times.explicitTimes()[0], 3);
}

} // namespace vcdq
