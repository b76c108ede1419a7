#include "signal_queue_exception.hpp"
#include "signal_table.hpp"
#include <algorithm>
#include <csignal>
#include <gtest/gtest.h>
#include <iterator>

using namespace sigq;

class SignalTableTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }
};

TEST_F(SignalTableTest, PlatformTableHasCommonSignals)
{
    const auto &table = SignalTable::platform();

    EXPECT_EQ(table.number("HUP"), SIGHUP);
    EXPECT_EQ(table.number("ALRM"), SIGALRM);
    EXPECT_EQ(table.number("USR1"), SIGUSR1);
    EXPECT_EQ(table.number("TERM"), SIGTERM);
    EXPECT_EQ(table.name(SIGCHLD), "CHLD");
    EXPECT_EQ(table.name(SIGQUIT), "QUIT");
}

TEST_F(SignalTableTest, PlatformTableUsesShortNames)
{
    const auto &table = SignalTable::platform();
    EXPECT_FALSE(table.contains("SIGHUP"));
    EXPECT_FALSE(table.contains("hup"));
    EXPECT_FALSE(table.number("ZERO").has_value());
}

TEST_F(SignalTableTest, AliasesMapToNumberButNotBack)
{
    const auto &table = SignalTable::platform();

    EXPECT_EQ(table.number("CLD"), SIGCHLD);
    EXPECT_EQ(table.number("IOT"), SIGABRT);
    EXPECT_EQ(table.name(SIGABRT), "ABRT");
    EXPECT_EQ(table.name(SIGCHLD), "CHLD");
}

TEST_F(SignalTableTest, RealtimeRangeIsListed)
{
    const auto &table = SignalTable::platform();

    EXPECT_EQ(table.number("RTMIN"), SIGRTMIN);
    EXPECT_EQ(table.number("RTMAX"), SIGRTMAX);
    if (SIGRTMAX - SIGRTMIN > 1)
        EXPECT_EQ(table.name(SIGRTMIN + 1), "NUM" + std::to_string(SIGRTMIN + 1));
}

TEST_F(SignalTableTest, NamesAreInListingOrder)
{
    const auto names = SignalTable::platform().names();

    ASSERT_GE(names.size(), 3u);
    EXPECT_EQ(names.front(), "HUP");
    const auto hup = std::find(names.begin(), names.end(), "HUP");
    const auto cld = std::find(names.begin(), names.end(), "CLD");
    ASSERT_NE(cld, names.end());
    EXPECT_LT(std::distance(names.begin(), hup), std::distance(names.begin(), cld));
}

TEST_F(SignalTableTest, UnknownLookupsReturnNothing)
{
    const auto &table = SignalTable::platform();
    EXPECT_FALSE(table.number("NOSUCH").has_value());
    EXPECT_FALSE(table.name(0).has_value());
    EXPECT_FALSE(table.name(-1).has_value());
}

TEST_F(SignalTableTest, CustomTableSkipsInvalidAndDuplicateEntries)
{
    SignalTable table({{"ONE", 1}, {"", 2}, {"NEG", -3}, {"ONE", 4}, {"UNO", 1}});

    EXPECT_EQ(table.names(), (std::vector<std::string>{"ONE", "UNO"}));
    EXPECT_EQ(table.number("ONE"), 1);
    EXPECT_EQ(table.number("UNO"), 1);
    EXPECT_EQ(table.name(1), "ONE");
    EXPECT_FALSE(table.name(4).has_value());
}

TEST_F(SignalTableTest, DefaultTableIsEmpty)
{
    SignalTable table;
    EXPECT_TRUE(table.empty());
    EXPECT_TRUE(table.names().empty());
}
