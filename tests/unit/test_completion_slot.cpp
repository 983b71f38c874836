#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include "utils/completion_slot.hpp"

namespace {

using agentbench::utils::CompletionSlot;

TEST(CompletionSlotTest, FirstResolutionWins) {
    CompletionSlot<int> slot;
    EXPECT_FALSE(slot.Settled());
    EXPECT_TRUE(slot.Resolve(1));
    EXPECT_FALSE(slot.Resolve(2));
    EXPECT_FALSE(slot.Reject(std::make_exception_ptr(std::runtime_error("late"))));
    EXPECT_TRUE(slot.Settled());
    EXPECT_EQ(slot.Take(), 1);
}

TEST(CompletionSlotTest, RejectionIsRethrownByTake) {
    CompletionSlot<int> slot;
    EXPECT_TRUE(slot.Reject(std::make_exception_ptr(std::runtime_error("boom"))));
    EXPECT_FALSE(slot.Resolve(5));
    EXPECT_THROW(slot.Take(), std::runtime_error);
}

TEST(CompletionSlotTest, HooksRunOnceOnSettlement) {
    CompletionSlot<std::string> slot;
    int calls = 0;
    slot.OnSettle([&calls]() { ++calls; });
    slot.OnSettle([&calls]() { ++calls; });
    EXPECT_EQ(calls, 0);

    slot.Resolve("done");
    EXPECT_EQ(calls, 2);
    slot.Resolve("again");
    EXPECT_EQ(calls, 2);
}

TEST(CompletionSlotTest, HookAddedAfterSettlementRunsImmediately) {
    CompletionSlot<int> slot;
    slot.Resolve(7);
    bool ran = false;
    slot.OnSettle([&ran]() { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CompletionSlotTest, HookMayObserveSettledState) {
    CompletionSlot<int> slot;
    bool settled_inside_hook = false;
    slot.OnSettle([&]() { settled_inside_hook = slot.Settled(); });
    slot.Reject(std::make_exception_ptr(std::runtime_error("x")));
    EXPECT_TRUE(settled_inside_hook);
}

}  // namespace
