#include "chunkup/upload/lifecycle.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <utility>
#include <vector>

using chunkup::upload::UploadLifecycle;
using chunkup::upload::WriterState;

TEST(UploadLifecycleTest, StartsOpen) {
    UploadLifecycle lifecycle;
    EXPECT_EQ(lifecycle.state(), WriterState::Open);
    EXPECT_TRUE(lifecycle.is_open());
}

TEST(UploadLifecycleTest, EnforcesTransitionOrder) {
    UploadLifecycle lifecycle;
    EXPECT_TRUE(lifecycle.transition_to(WriterState::Committed).is_error());
    EXPECT_TRUE(lifecycle.transition_to(WriterState::Cancelled).is_error());

    EXPECT_TRUE(lifecycle.transition_to(WriterState::Closed).is_ok());
    EXPECT_TRUE(lifecycle.transition_to(WriterState::Closed).is_ok());  // Re-entering is fine
    EXPECT_TRUE(lifecycle.transition_to(WriterState::Committed).is_ok());
    EXPECT_TRUE(lifecycle.transition_to(WriterState::Committed).is_ok());

    auto reopen = lifecycle.transition_to(WriterState::Open);
    EXPECT_TRUE(reopen.is_error());
    EXPECT_EQ(reopen.error().code, chunkup::ErrorCode::InvalidArgument);
}

TEST(UploadLifecycleTest, CancelAllowedAfterCommitButNotTheReverse) {
    UploadLifecycle committed;
    ASSERT_TRUE(committed.transition_to(WriterState::Closed).is_ok());
    ASSERT_TRUE(committed.transition_to(WriterState::Committed).is_ok());
    EXPECT_TRUE(committed.transition_to(WriterState::Cancelled).is_ok());

    UploadLifecycle cancelled;
    ASSERT_TRUE(cancelled.transition_to(WriterState::Closed).is_ok());
    ASSERT_TRUE(cancelled.transition_to(WriterState::Cancelled).is_ok());
    EXPECT_TRUE(cancelled.transition_to(WriterState::Committed).is_error());
    EXPECT_EQ(cancelled.state(), WriterState::Cancelled);
}

TEST(UploadLifecycleTest, ConcurrentTransitionsSettleOnce) {
    UploadLifecycle lifecycle;
    ASSERT_TRUE(lifecycle.transition_to(WriterState::Closed).is_ok());

    std::atomic<int> committed{0};
    std::atomic<int> cancelled{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            if (i % 2 == 0) {
                if (lifecycle.transition_to(WriterState::Committed).is_ok()) {
                    ++committed;
                }
            } else if (lifecycle.transition_to(WriterState::Cancelled).is_ok()) {
                ++cancelled;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto final_state = lifecycle.state();
    EXPECT_TRUE(final_state == WriterState::Committed || final_state == WriterState::Cancelled);
    EXPECT_GE(committed.load() + cancelled.load(), 1);
}

TEST(UploadLifecycleTest, TransitionTable) {
    const std::vector<WriterState> states{WriterState::Open, WriterState::Closed,
                                          WriterState::Committed, WriterState::Cancelled};
    const auto reach = [](UploadLifecycle& lifecycle, WriterState target) {
        if (target == WriterState::Open) {
            return;
        }
        ASSERT_TRUE(lifecycle.transition_to(WriterState::Closed).is_ok());
        if (target != WriterState::Closed) {
            ASSERT_TRUE(lifecycle.transition_to(target).is_ok());
        }
    };

    std::vector<std::pair<WriterState, WriterState>> allowed;
    for (const auto from : states) {
        for (const auto to : states) {
            if (from == to) {
                continue;
            }
            UploadLifecycle lifecycle;
            reach(lifecycle, from);
            if (lifecycle.transition_to(to).is_ok()) {
                allowed.emplace_back(from, to);
            } else {
                EXPECT_EQ(lifecycle.state(), from);
            }
        }
    }

    const std::vector<std::pair<WriterState, WriterState>> expected{
        {WriterState::Open, WriterState::Closed},
        {WriterState::Closed, WriterState::Committed},
        {WriterState::Closed, WriterState::Cancelled},
        {WriterState::Committed, WriterState::Cancelled},
    };
    EXPECT_EQ(allowed, expected);
}
