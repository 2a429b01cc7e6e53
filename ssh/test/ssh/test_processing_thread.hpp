#pragma once

#include <utility/awaiter.hpp>
#include <ssh/async/processing_thread.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace SecureShell::Test
{
    class ProcessingThreadTest : public ::testing::Test
    {};

    TEST_F(ProcessingThreadTest, StartAndStopToggleRunning)
    {
        ProcessingThread processingThread;
        processingThread.start(1ms);
        EXPECT_TRUE(processingThread.isRunning());
        ASSERT_NO_FATAL_FAILURE(processingThread.stop());
        EXPECT_FALSE(processingThread.isRunning());
    }

    TEST_F(ProcessingThreadTest, DestructorStopsRunningThread)
    {
        ProcessingThread processingThread;
        processingThread.start(1ms);
    }

    TEST_F(ProcessingThreadTest, EmptyTaskIsRejected)
    {
        ProcessingThread processingThread;
        EXPECT_FALSE(processingThread.pushTask(std::function<void()>{}));
    }

    TEST_F(ProcessingThreadTest, QueuedTaskRuns)
    {
        Awaiter awaiter{};
        ProcessingThread processingThread;
        processingThread.start(1ms);
        EXPECT_TRUE(processingThread.pushTask([&awaiter] {
            awaiter.arrive();
        }));
        ASSERT_TRUE(awaiter.waitFor());
    }

    TEST_F(ProcessingThreadTest, TasksRunInPushOrder)
    {
        std::vector<int> order{};
        ProcessingThread processingThread;
        processingThread.start(1ms);
        for (int i = 0; i < 10; ++i)
        {
            processingThread.pushTask([&order, i] {
                order.push_back(i);
            });
        }
        ASSERT_TRUE(processingThread.awaitCycle());
        processingThread.stop();
        ASSERT_EQ(order.size(), 10);
        for (int i = 0; i < 10; ++i)
            EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
    }

    TEST_F(ProcessingThreadTest, DestructionRunsRemainingTasks)
    {
        std::atomic_int counter = 0;
        Awaiter awaiter{};
        {
            ProcessingThread processingThread;
            processingThread.start(1ms);
            for (std::size_t i = 0; i < ProcessingThread::maximumTasksProcessableAtOnce * 3; ++i)
            {
                EXPECT_TRUE(processingThread.pushTask([&counter, &awaiter] {
                    if (counter.load() == 0)
                        awaiter.arrive();
                    ++counter;
                }));
            }
            awaiter.wait();
        }
        ASSERT_EQ(static_cast<int>(ProcessingThread::maximumTasksProcessableAtOnce * 3), counter.load());
    }

    TEST_F(ProcessingThreadTest, TasksCanBeQueuedAfterStop)
    {
        ProcessingThread processingThread;
        processingThread.start(1ms);
        processingThread.stop();
        EXPECT_TRUE(processingThread.pushTask([] {}));
    }

    TEST_F(ProcessingThreadTest, PushIsRefusedWhileStopping)
    {
        Awaiter awaiter{};
        ProcessingThread processingThread;
        processingThread.pushTask([&] {
            awaiter.arrive();
            std::this_thread::sleep_for(100ms);
        });
        std::thread asyncStopper{[&] {
            processingThread.stop();
        }};
        awaiter.wait();
        EXPECT_FALSE(processingThread.pushTask([] {}));
        asyncStopper.join();
    }

    TEST_F(ProcessingThreadTest, StopRunsTasksOfNeverStartedThread)
    {
        Awaiter awaiter{};
        ProcessingThread processingThread;
        processingThread.pushTask([&] {
            awaiter.arrive();
        });
        processingThread.stop();
        EXPECT_TRUE(awaiter.waitFor());
    }

    TEST_F(ProcessingThreadTest, PromiseTaskDeliversValue)
    {
        ProcessingThread processingThread;
        processingThread.start(1ms);
        auto future = processingThread.pushPromiseTask([] {
            return 42;
        });
        ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
        EXPECT_EQ(future.get(), 42);
    }

    TEST_F(ProcessingThreadTest, PromiseTaskRunsOnProcessingThread)
    {
        ProcessingThread processingThread;
        processingThread.start(1ms);
        auto future = processingThread.pushPromiseTask([&processingThread] {
            return processingThread.withinProcessingThread();
        });
        EXPECT_TRUE(future.get());
        EXPECT_FALSE(processingThread.withinProcessingThread());
    }

    TEST_F(ProcessingThreadTest, AwaitCycleCanBeRepeated)
    {
        ProcessingThread processingThread;
        processingThread.start(1ms);
        for (int i = 0; i < 5; ++i)
            EXPECT_TRUE(processingThread.awaitCycle());
    }

    TEST_F(ProcessingThreadTest, AwaitCycleFailsWhenNotRunning)
    {
        ProcessingThread processingThread;
        EXPECT_FALSE(processingThread.awaitCycle(10ms));
    }

    TEST_F(ProcessingThreadTest, ThrowingTaskDoesNotEndTheThread)
    {
        Awaiter awaiter{};
        ProcessingThread processingThread;
        processingThread.start(1ms);
        processingThread.pushTask([] {
            throw std::runtime_error{"boom"};
        });
        processingThread.pushTask([&awaiter] {
            awaiter.arrive();
        });
        EXPECT_TRUE(awaiter.waitFor());
        EXPECT_TRUE(processingThread.isRunning());
    }

    TEST_F(ProcessingThreadTest, TasksFromManyThreadsNeverOverlap)
    {
        std::atomic_int running{0};
        std::atomic_int overlaps{0};
        std::atomic_int done{0};
        Awaiter awaiter{4 * 50};

        ProcessingThread processingThread;
        processingThread.start(1ms);
        std::vector<std::thread> pushers{};
        for (int t = 0; t < 4; ++t)
        {
            pushers.emplace_back([&] {
                for (int i = 0; i < 50; ++i)
                {
                    processingThread.pushTask([&] {
                        if (++running > 1)
                            ++overlaps;
                        std::this_thread::yield();
                        --running;
                        ++done;
                        awaiter.arrive();
                    });
                }
            });
        }
        for (auto& pusher : pushers)
            pusher.join();

        ASSERT_TRUE(awaiter.waitFor(5s));
        EXPECT_EQ(done.load(), 200);
        EXPECT_EQ(overlaps.load(), 0);
    }
}
