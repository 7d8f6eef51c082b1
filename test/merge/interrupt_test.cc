#include <gtest/gtest.h>
#include <csignal>
#include <signal.h>
#include "../../src/merge/interrupt.h"

using namespace Braid;

namespace {

using Handler = void (*)(int);

Handler CurrentHandler(int signum) {
    struct sigaction current {};
    sigaction(signum, nullptr, &current);
    return current.sa_handler;
}

} // namespace

class InterruptTest : public ::testing::Test {
protected:
    void TearDown() override { RestoreInterruptHandlers(); }

    CancellationToken token_;
};

TEST_F(InterruptTest, OrderedModeKeepsDefaultDisposition) {
    Handler before_int = CurrentHandler(SIGINT);
    Handler before_term = CurrentHandler(SIGTERM);

    EXPECT_FALSE(InstallInterruptHandlers(MergeMode::kOrdered, &token_));
    EXPECT_EQ(CurrentHandler(SIGINT), before_int);
    EXPECT_EQ(CurrentHandler(SIGTERM), before_term);
    EXPECT_FALSE(token_.IsCancelled());
}

TEST_F(InterruptTest, ConcurrentModeCancelsOnSignal) {
    ASSERT_TRUE(InstallInterruptHandlers(MergeMode::kConcurrent, &token_));
    EXPECT_NE(CurrentHandler(SIGINT), SIG_DFL);
    EXPECT_NE(CurrentHandler(SIGTERM), SIG_DFL);

    // The handler runs before raise() returns on the raising thread
    ASSERT_EQ(raise(SIGTERM), 0);
    EXPECT_TRUE(token_.IsCancelled());

    RestoreInterruptHandlers();
    EXPECT_EQ(CurrentHandler(SIGINT), SIG_DFL);
    EXPECT_EQ(CurrentHandler(SIGTERM), SIG_DFL);
}

TEST_F(InterruptTest, RequiresToken) {
    EXPECT_FALSE(InstallInterruptHandlers(MergeMode::kConcurrent, nullptr));
}
