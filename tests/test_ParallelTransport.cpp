#include "ParallelTransport.hpp"
#include "LcdInstructions.hpp"
#include "LcdFakes.hpp"

#include <gtest/gtest.h>

using namespace hdlcd;
using namespace hdlcd::test;

namespace {

class ParallelTransportTest : public ::testing::Test {
protected:
    ParallelTransportTest()
        : board(events)
        , delay(events)
    {}

    ParallelWiring fourBit()
    {
        return ParallelWiring::fourBit(board.line(PIN_RS), board.line(PIN_EN),
                                       board.data(4), board.data(5),
                                       board.data(6), board.data(7));
    }

    ParallelWiring eightBit()
    {
        return ParallelWiring::eightBit(board.line(PIN_RS), board.line(PIN_EN),
                                        board.data(0), board.data(1),
                                        board.data(2), board.data(3),
                                        board.data(4), board.data(5),
                                        board.data(6), board.data(7));
    }

    Timeline  events;
    PinBoard  board;
    FakeDelay delay;
};

} // namespace

TEST_F(ParallelTransportTest, FourBitSendsHighNibbleThenLowNibble)
{
    ParallelTransport transport(fourBit(), delay);

    ASSERT_EQ(LcdStatus::Ok, transport.send(0xA5, LcdMode::Command));

    const Timeline expected = {
        waitUs(1), strobe(0xA0, false), waitUs(50),
        waitUs(1), strobe(0x50, false), waitUs(50)
    };
    EXPECT_EQ(expected, events);
}

TEST_F(ParallelTransportTest, DataModeRaisesRsForBothNibbles)
{
    ParallelTransport transport(fourBit(), delay);

    ASSERT_EQ(LcdStatus::Ok, transport.send('H', LcdMode::Data));

    const Timeline strobes = only(events, Event::Strobe);
    ASSERT_EQ(2u, strobes.size());
    EXPECT_EQ(strobe(0x40, true), strobes[0]);
    EXPECT_EQ(strobe(0x80, true), strobes[1]);
}

TEST_F(ParallelTransportTest, FourBitClearEndsWithTheLongDelay)
{
    ParallelTransport transport(fourBit(), delay);

    ASSERT_EQ(LcdStatus::Ok, transport.send(HD_CLEARDISPLAY, LcdMode::Command));

    const Timeline expected = {
        waitUs(1), strobe(0x00, false), waitUs(50),
        waitUs(1), strobe(0x10, false), waitUs(2000)
    };
    EXPECT_EQ(expected, events);
}

TEST_F(ParallelTransportTest, EightBitIsOnePulse)
{
    ParallelTransport transport(eightBit(), delay);
    EXPECT_EQ(LineWidth::Eight, transport.lineWidth());

    ASSERT_EQ(LcdStatus::Ok, transport.send(0xA5, LcdMode::Command));
    ASSERT_EQ(LcdStatus::Ok, transport.send(HD_RETURNHOME, LcdMode::Command));

    const Timeline expected = {
        waitUs(1), strobe(0xA5, false), waitUs(50),
        waitUs(1), strobe(0x02, false), waitUs(2000)
    };
    EXPECT_EQ(expected, events);
}

TEST_F(ParallelTransportTest, InitNibbleIsASingleHighNibblePulse)
{
    ParallelTransport transport(fourBit(), delay);

    board.set(PIN_RS, true);
    ASSERT_EQ(LcdStatus::Ok, transport.sendInitNibble(0x3));

    const Timeline strobes = only(events, Event::Strobe);
    ASSERT_EQ(1u, strobes.size());
    EXPECT_EQ(strobe(0x30, false), strobes[0]);
}

TEST_F(ParallelTransportTest, EightBitInitNibbleDrivesTheUpperLines)
{
    ParallelTransport transport(eightBit(), delay);

    ASSERT_EQ(LcdStatus::Ok, transport.sendInitNibble(0x3));

    const Timeline strobes = only(events, Event::Strobe);
    ASSERT_EQ(1u, strobes.size());
    EXPECT_EQ(strobe(0x30, false), strobes[0]);
}

TEST_F(ParallelTransportTest, ResetDrivesEveryLineLow)
{
    for (int i = 0; i < PIN_COUNT; ++i) {
        board.set(static_cast<PinId>(i), true);
    }
    events.clear();

    ParallelTransport transport(eightBit().withReadWrite(board.line(PIN_RW)), delay);
    ASSERT_EQ(LcdStatus::Ok, transport.reset());

    EXPECT_FALSE(board.level(PIN_RS));
    EXPECT_FALSE(board.level(PIN_RW));
    EXPECT_FALSE(board.level(PIN_EN));
    for (int n = 0; n < 8; ++n) {
        EXPECT_FALSE(board.level(static_cast<PinId>(PIN_D0 + n))) << "D" << n;
    }
    // EN fell, but reset is not an instruction
    EXPECT_EQ(1u, only(events, Event::Strobe).size());
    EXPECT_TRUE(only(events, Event::WaitUs).empty());
}

TEST_F(ParallelTransportTest, BacklightNeedsALine)
{
    ParallelTransport bare(fourBit(), delay);
    EXPECT_EQ(LcdStatus::Unsupported, bare.setBacklight(State::On));

    ParallelTransport lit(fourBit().withBacklight(board.line(PIN_BL)), delay);
    EXPECT_EQ(LcdStatus::Ok, lit.setBacklight(State::On));
    EXPECT_TRUE(board.level(PIN_BL));
    EXPECT_EQ(LcdStatus::Ok, lit.setBacklight(State::Off));
    EXPECT_FALSE(board.level(PIN_BL));
}

TEST_F(ParallelTransportTest, CustomTimingIsApplied)
{
    LcdTiming slow = LCD_TIMING_DEFAULTS;
    slow.enablePulseUs = 3;
    slow.shortExecUs   = 80;

    ParallelTransport transport(eightBit(), delay, slow);
    ASSERT_EQ(LcdStatus::Ok, transport.send('x', LcdMode::Data));

    const Timeline expected = { waitUs(3), strobe('x', true), waitUs(80) };
    EXPECT_EQ(expected, events);
}

TEST(ParallelWiringTest, CompleteChecksTheLinesTheWidthNeeds)
{
    FakeLine rs, en, d[8];

    ParallelWiring four = ParallelWiring::fourBit(rs, en, d[4], d[5], d[6], d[7]);
    EXPECT_TRUE(four.complete());
    EXPECT_EQ(LineWidth::Four, four.width);
    EXPECT_TRUE(four.rw == nullptr);
    EXPECT_TRUE(four.backlight == nullptr);

    four.enable = nullptr;
    EXPECT_FALSE(four.complete());

    ParallelWiring eight = ParallelWiring::eightBit(rs, en, d[0], d[1], d[2], d[3],
                                                    d[4], d[5], d[6], d[7]);
    EXPECT_TRUE(eight.complete());
    eight.data[2] = nullptr;
    EXPECT_FALSE(eight.complete());

    // a 4-bit wiring relabelled as 8-bit is missing D0..D3
    ParallelWiring relabelled = ParallelWiring::fourBit(rs, en, d[4], d[5], d[6], d[7]);
    relabelled.width = LineWidth::Eight;
    EXPECT_FALSE(relabelled.complete());
}
