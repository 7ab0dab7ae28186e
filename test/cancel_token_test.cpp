#include <atomic>
#include <thread>
#include <gtest/gtest.h>

#include "cancel_token.hpp"

TEST(CancelTokenTest, WaitForTimesOutWhenNotCancelled)
{
    CancelToken token;

    EXPECT_FALSE(token.IsCancelled());
    EXPECT_FALSE(token.WaitFor(std::chrono::milliseconds(5)));
}

TEST(CancelTokenTest, CancelWakesWaiter)
{
    CancelToken token;
    std::atomic<bool> woken{false};

    std::thread waiter([&]{
        token.Wait();
        woken = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_FALSE(woken);

    token.Cancel();
    waiter.join();
    EXPECT_TRUE(woken);
    EXPECT_TRUE(token.WaitFor(std::chrono::seconds(5)));
}

TEST(CancelTokenTest, CancelIsIdempotent)
{
    CancelToken token;
    int calls = 0;
    CancelCallback callback(token, [&]{ calls++; });

    token.Cancel();
    token.Cancel();

    EXPECT_TRUE(token.IsCancelled());
    EXPECT_EQ(calls, 1);
}

TEST(CancelTokenTest, CallbackRunsOnCancel)
{
    CancelToken token;
    bool called = false;
    CancelCallback callback(token, [&]{ called = true; });

    EXPECT_FALSE(called);
    token.Cancel();
    EXPECT_TRUE(called);
}

TEST(CancelTokenTest, CallbackRunsImmediatelyOnCancelledToken)
{
    CancelToken token;
    token.Cancel();

    bool called = false;
    CancelCallback callback(token, [&]{ called = true; });
    EXPECT_TRUE(called);
}

TEST(CancelTokenTest, RemovedCallbackIsNotCalled)
{
    CancelToken token;
    bool called = false;

    {
        CancelCallback callback(token, [&]{ called = true; });
    }

    token.Cancel();
    EXPECT_FALSE(called);
}

TEST(CancelTokenTest, ParentCancelsChild)
{
    CancelToken parent;
    CancelToken child(parent);
    CancelToken grandchild(child);

    parent.Cancel();

    EXPECT_TRUE(child.IsCancelled());
    EXPECT_TRUE(grandchild.IsCancelled());
}

TEST(CancelTokenTest, ChildDoesNotCancelParent)
{
    CancelToken parent;
    CancelToken child(parent);

    child.Cancel();

    EXPECT_TRUE(child.IsCancelled());
    EXPECT_FALSE(parent.IsCancelled());
}

TEST(CancelTokenTest, ChildOfCancelledParentStartsCancelled)
{
    CancelToken parent;
    parent.Cancel();

    CancelToken child(parent);
    EXPECT_TRUE(child.IsCancelled());
}

TEST(CancelTokenTest, DestroyedChildIsDetachedFromParent)
{
    CancelToken parent;

    {
        CancelToken child(parent);
    }

    parent.Cancel();
    EXPECT_TRUE(parent.IsCancelled());
}
