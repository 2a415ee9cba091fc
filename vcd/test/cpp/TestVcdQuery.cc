#include <gtest/gtest.h>
#include <string>
#include "VcdTestState.hh"

namespace vcdq {

// clk toggles every 5, bus changes at 0, 12, 12 (same time) and 30,
// idle never changes.
static const char *query_vcd =
  "$timescale 1ns $end\n"
  "$scope module top $end\n"
  "$scope module cpu $end\n"
  "$var wire 1 ! clk $end\n"
  "$var wire 8 # bus $end\n"
  "$upscope $end\n"
  "$var wire 1 % idle $end\n"
  "$var wire 1 & CLK_EN $end\n"
  "$upscope $end\n"
  "$enddefinitions $end\n"
  "$dumpvars\n"
  "0!\n"
  "b0 #\n"
  "1&\n"
  "$end\n"
  "#5\n"
  "1!\n"
  "#10\n"
  "0!\n"
  "1&\n"
  "#12\n"
  "b1010 #\n"
  "b11 #\n"
  "#15\n"
  "1!\n"
  "#30\n"
  "bxxxxxxxx #\n";

class VcdQueryTest : public VcdTest
{
protected:
  void SetUp() override
  {
    vcd_ = read(query_vcd);
  }

  Vcd vcd_;
};

TEST_F(VcdQueryTest, BeforeFirstChangeIsUnknown)
{
  Vcd vcd = read("$var wire 1 ! a $end\n"
                 "$var wire 3 # b $end\n"
                 "$enddefinitions $end\n"
                 "#10\n1!\nb101 #\n");
  for (VcdTime time = 0; time < 10; time++) {
    EXPECT_EQ(vcd.valueAt("!", time), "x");
    EXPECT_EQ(vcd.valueAt("#", time), "xxx");
  }
  EXPECT_EQ(vcd.signal("#").unknownValue(), "xxx");
}

TEST_F(VcdQueryTest, HoldsAfterLastChange)
{
  for (const VcdSignal *signal : vcd_.signals()) {
    const std::string &final_value = signal->finalValue();
    for (VcdTime time = vcd_.timeMax(); time < vcd_.timeMax() + 100; time += 7)
      EXPECT_EQ(signal->valueAt(time), final_value);
  }
  EXPECT_EQ(vcd_.valueAt("!", 1000000), "1");
  EXPECT_EQ(vcd_.valueAt("#", 30), "xxxxxxxx");
}

TEST_F(VcdQueryTest, ValueBetweenAdjacentChanges)
{
  for (const VcdSignal *signal : vcd_.signals()) {
    const VcdChangeLog &changes = signal->changes();
    for (size_t i = 0; i + 1 < changes.size(); i++) {
      const VcdChange &change1 = changes[i];
      const VcdChange &change2 = changes[i + 1];
      if (change1.time() < change2.time()) {
        for (VcdTime time = change1.time(); time < change2.time(); time++)
          EXPECT_EQ(signal->valueAt(time), change1.value());
      }
    }
  }
}

TEST_F(VcdQueryTest, SameTimeLastWriteWins)
{
  EXPECT_EQ(vcd_.valueAt("#", 11), "00000000");
  EXPECT_EQ(vcd_.valueAt("#", 12), "00000011");
  EXPECT_EQ(vcd_.valueAt("#", 29), "00000011");
}

TEST_F(VcdQueryTest, NoChangesIsUnknown)
{
  const VcdSignal &idle = vcd_.signal("%");
  EXPECT_EQ(idle.changeCount(), 0u);
  EXPECT_EQ(idle.valueAt(0), "x");
  EXPECT_EQ(idle.valueAt(100), "x");
  EXPECT_EQ(idle.finalValue(), "x");
  EXPECT_TRUE(idle.transitions().empty());
}

TEST_F(VcdQueryTest, DuplicateValuesKept)
{
  const VcdSignal &clk_en = vcd_.signal("&");
  ASSERT_EQ(clk_en.changeCount(), 2u);
  EXPECT_EQ(clk_en.changes()[0], VcdChange(0, "1"));
  EXPECT_EQ(clk_en.changes()[1], VcdChange(10, "1"));
}

TEST_F(VcdQueryTest, Transitions)
{
  VcdTransitions clk = vcd_.transitions("!");
  ASSERT_EQ(clk.size(), 4u);
  EXPECT_EQ(clk[0].time(), 0);
  EXPECT_EQ(clk[0].from(), "x");
  EXPECT_EQ(clk[0].to(), "0");
  EXPECT_EQ(clk[1].time(), 5);
  EXPECT_EQ(clk[1].from(), "0");
  EXPECT_EQ(clk[1].to(), "1");
  EXPECT_EQ(clk[3].time(), 15);

  // Repeated values are not transitions.
  VcdTransitions clk_en = vcd_.transitions("&");
  ASSERT_EQ(clk_en.size(), 1u);
  EXPECT_EQ(clk_en[0].to(), "1");

  VcdTransitions bus = vcd_.transitions("#");
  ASSERT_EQ(bus.size(), 4u);
  EXPECT_EQ(bus[1].to(), "00001010");
  EXPECT_EQ(bus[2].from(), "00001010");
  EXPECT_EQ(bus[2].to(), "00000011");
  EXPECT_EQ(bus[3].to(), "xxxxxxxx");
}

TEST_F(VcdQueryTest, ChangesBetween)
{
  VcdChangeLog changes = vcd_.changesBetween("!", 5, 10);
  ASSERT_EQ(changes.size(), 2u);
  EXPECT_EQ(changes[0], VcdChange(5, "1"));
  EXPECT_EQ(changes[1], VcdChange(10, "0"));

  EXPECT_EQ(vcd_.changesBetween("#", 12, 12).size(), 2u);
  EXPECT_EQ(vcd_.changesBetween("!", 16, 29).size(), 0u);
  EXPECT_EQ(vcd_.changesBetween("!", 0, 1000).size(), 4u);
  EXPECT_TRUE(vcd_.changesBetween("!", 10, 5).empty());
}

TEST_F(VcdQueryTest, UnboundSignal)
{
  EXPECT_THROW(vcd_.valueAt("@", 0), VcdUnboundSignal);
  EXPECT_THROW(vcd_.transitions("@"), VcdUnboundSignal);
  EXPECT_THROW(vcd_.changesBetween("@", 0, 10), VcdUnboundSignal);
  try {
    vcd_.signal("@");
    FAIL() << "Expected VcdUnboundSignal";
  }
  catch (const VcdUnboundSignal &e) {
    EXPECT_EQ(e.id(), "@");
    EXPECT_NE(std::string(e.what()).find("@"), std::string::npos);
  }
  // The vcd is still usable.
  EXPECT_EQ(vcd_.valueAt("!", 5), "1");
}

TEST_F(VcdQueryTest, SignalsInDeclarationOrder)
{
  VcdSignalSeq signals = vcd_.signals();
  ASSERT_EQ(signals.size(), 4u);
  EXPECT_EQ(signals[0]->name(), "top.cpu.clk");
  EXPECT_EQ(signals[1]->name(), "top.cpu.bus");
  EXPECT_EQ(signals[2]->name(), "top.idle");
  EXPECT_EQ(signals[3]->name(), "top.CLK_EN");
  EXPECT_TRUE(signals[0]->isScalar());
  EXPECT_FALSE(signals[1]->isScalar());
}

TEST_F(VcdQueryTest, FindSignal)
{
  EXPECT_EQ(vcd_.findSignal("#")->name(), "top.cpu.bus");
  EXPECT_EQ(vcd_.findSignal("nope"), nullptr);
  EXPECT_EQ(vcd_.findSignalByName("top.idle")->id(), "%");
  EXPECT_EQ(vcd_.findSignalByName("idle"), nullptr);
}

TEST_F(VcdQueryTest, FindSignalBySuffix)
{
  EXPECT_EQ(vcd_.findSignalBySuffix("clk")->id(), "!");
  EXPECT_EQ(vcd_.findSignalBySuffix("CPU.CLK")->id(), "!");
  EXPECT_EQ(vcd_.findSignalBySuffix("clk_en")->id(), "&");
  EXPECT_EQ(vcd_.findSignalBySuffix("top.cpu.bus")->id(), "#");
  // Suffix must start on a scope boundary.
  EXPECT_EQ(vcd_.findSignalBySuffix("lk"), nullptr);
  EXPECT_EQ(vcd_.findSignalBySuffix(""), nullptr);
}

TEST_F(VcdQueryTest, TimeSummary)
{
  EXPECT_EQ(vcd_.timeMax(), 30);
  EXPECT_EQ(vcd_.minDeltaTime(), 2);
  EXPECT_EQ(vcd_.maxVarWidth(), 8u);
}

} // namespace vcdq
