#include <gtest/gtest.h>

#include "system/signals.hpp"

#include <csignal>
#include <cstdlib>

namespace uploader {
namespace {

TEST(SignalsTest, FirstSignalOnlyRaisesCancelFlag) {
    g_cancel.store(false);
    InstallSignalHandlers();

    ASSERT_EQ(::raise(SIGTERM), 0);
    EXPECT_TRUE(g_cancel.load());

    g_cancel.store(false);
}

TEST(SignalsDeathTest, SecondSignalTerminatesProcess) {
    EXPECT_EXIT(
        {
            g_cancel.store(false);
            InstallSignalHandlers();
            ::raise(SIGINT);
            ::raise(SIGINT);
            std::exit(0);
        },
        ::testing::KilledBySignal(SIGINT),
        "");
}

} // namespace
} // namespace uploader
