#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <vector>

import Core;

using namespace Core::Tasks;

TEST(CoreTasks, DispatchRunsEveryTask)
{
    Scheduler::Initialize(2);
    ASSERT_TRUE(Scheduler::IsInitialized());
    EXPECT_EQ(Scheduler::WorkerCount(), 2u);

    std::atomic<int> counter = 0;
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_TRUE(Scheduler::Dispatch([&counter]() { counter++; }));
    }

    Scheduler::WaitForAll();
    EXPECT_EQ(counter, 100);

    Scheduler::Shutdown();
    EXPECT_FALSE(Scheduler::IsInitialized());
}

TEST(CoreTasks, DispatchWithoutSchedulerIsRejected)
{
    ASSERT_FALSE(Scheduler::IsInitialized());

    bool ran = false;
    EXPECT_FALSE(Scheduler::Dispatch([&ran]() { ran = true; }));
    Scheduler::WaitForAll();
    EXPECT_FALSE(ran);
}

TEST(CoreTasks, SharedStateCapture)
{
    Scheduler::Initialize(3);

    auto results = std::make_shared<std::vector<std::atomic<int>>>(16);
    for (int i = 0; i < 16; ++i)
    {
        Scheduler::Dispatch([results, i]() { (*results)[i].store(i * i); });
    }
    Scheduler::WaitForAll();

    for (int i = 0; i < 16; ++i)
        EXPECT_EQ((*results)[i].load(), i * i);

    Scheduler::Shutdown();
}

TEST(CoreTasks, LocalTaskMoveTransfersCallable)
{
    int value = 0;
    LocalTask a([&value]() { value = 42; });
    ASSERT_TRUE(a.Valid());

    LocalTask b(std::move(a));
    EXPECT_FALSE(a.Valid());
    ASSERT_TRUE(b.Valid());

    b();
    EXPECT_EQ(value, 42);
}
