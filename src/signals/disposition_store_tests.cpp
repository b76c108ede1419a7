#include "disposition_store.hpp"
#include <algorithm>
#include <csignal>
#include <gtest/gtest.h>
#include <stdexcept>
#include <system_error>

using namespace sigq;

namespace {

void first_handler(int) { }
void second_handler(int) { }

struct sigaction make_action(void (*handler)(int))
{
    struct sigaction action{};
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    return action;
}

void (*current_handler(int signo))(int)
{
    struct sigaction current{};
    sigaction(signo, nullptr, &current);
    return current.sa_handler;
}

} // namespace

class DispositionStoreTest : public ::testing::Test {
protected:
    DispositionStore store;

    void SetUp() override
    {
        signal(SIGUSR1, SIG_DFL);
        signal(SIGUSR2, SIG_DFL);
    }

    void TearDown() override
    {
        signal(SIGUSR1, SIG_DFL);
        signal(SIGUSR2, SIG_DFL);
    }
};

TEST_F(DispositionStoreTest, InstallAndRestore)
{
    store.install(SIGUSR1, make_action(first_handler));
    EXPECT_EQ(current_handler(SIGUSR1), &first_handler);
    EXPECT_TRUE(store.contains(SIGUSR1));

    store.restore(SIGUSR1);
    EXPECT_EQ(current_handler(SIGUSR1), SIG_DFL);
    EXPECT_TRUE(store.empty());
}

TEST_F(DispositionStoreTest, SecondInstallKeepsOriginalDisposition)
{
    store.install(SIGUSR1, make_action(first_handler));
    store.install(SIGUSR1, make_action(second_handler));
    EXPECT_EQ(current_handler(SIGUSR1), &second_handler);
    EXPECT_EQ(store.size(), 1u);

    store.restore(SIGUSR1);
    EXPECT_EQ(current_handler(SIGUSR1), SIG_DFL);
}

TEST_F(DispositionStoreTest, RestoresPreviouslyInstalledHandler)
{
    signal(SIGUSR2, first_handler);

    store.install(SIGUSR2, make_action(SIG_IGN));
    EXPECT_EQ(current_handler(SIGUSR2), SIG_IGN);

    store.restore(SIGUSR2);
    EXPECT_EQ(current_handler(SIGUSR2), &first_handler);
}

TEST_F(DispositionStoreTest, SignalsListsInstalledSignals)
{
    store.install(SIGUSR2, make_action(first_handler));
    store.install(SIGUSR1, make_action(first_handler));

    const auto signals = store.signals();
    ASSERT_EQ(signals.size(), 2u);
    EXPECT_NE(std::find(signals.begin(), signals.end(), SIGUSR1), signals.end());
    EXPECT_NE(std::find(signals.begin(), signals.end(), SIGUSR2), signals.end());

    store.restore(SIGUSR1);
    store.restore(SIGUSR2);
}

TEST_F(DispositionStoreTest, RestoreUnknownSignalThrows)
{
    EXPECT_THROW(store.restore(SIGUSR1), std::out_of_range);
}

TEST_F(DispositionStoreTest, InstallOnUncatchableSignalThrows)
{
    EXPECT_THROW(store.install(SIGKILL, make_action(first_handler)), std::system_error);
    EXPECT_FALSE(store.contains(SIGKILL));
}
