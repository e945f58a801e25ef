/*
 * Unit tests for the event loop
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "peerroom-event-loop.h"

using namespace peerroom;

class EventLoopTest : public ::testing::Test
{
protected:
	int64_t nowMs = 1000;
	EventLoop loop{[this]() { return nowMs; }};
};

TEST_F(EventLoopTest, RunsTasksInPostingOrder)
{
	std::vector<int> order;
	loop.post([&order]() { order.push_back(1); });
	loop.post([&order]() { order.push_back(2); });
	loop.post([&order]() { order.push_back(3); });

	EXPECT_EQ(loop.pendingTasks(), 3u);
	EXPECT_EQ(loop.runPending(), 3u);
	EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
	EXPECT_EQ(loop.pendingTasks(), 0u);
}

TEST_F(EventLoopTest, TasksPostedWhileRunningAreDrained)
{
	std::vector<int> order;
	loop.post([this, &order]() {
		order.push_back(1);
		loop.post([&order]() { order.push_back(2); });
	});

	EXPECT_EQ(loop.runPending(), 2u);
	EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(EventLoopTest, OneShotTimerFiresWhenDue)
{
	int fired = 0;
	loop.scheduleOnce(500, [&fired]() { fired++; });

	EXPECT_EQ(loop.runPending(), 0u);
	nowMs += 499;
	loop.runPending();
	EXPECT_EQ(fired, 0);

	nowMs += 1;
	loop.runPending();
	EXPECT_EQ(fired, 1);
	EXPECT_EQ(loop.activeTimers(), 0u);

	nowMs += 5000;
	loop.runPending();
	EXPECT_EQ(fired, 1);
}

TEST_F(EventLoopTest, RepeatingTimerDoesNotReplayMissedTicks)
{
	int fired = 0;
	loop.scheduleRepeating(100, [&fired]() { fired++; });

	nowMs += 100;
	loop.runPending();
	EXPECT_EQ(fired, 1);

	nowMs += 1000;
	loop.runPending();
	EXPECT_EQ(fired, 2);

	nowMs += 100;
	loop.runPending();
	EXPECT_EQ(fired, 3);
	EXPECT_EQ(loop.activeTimers(), 1u);
}

TEST_F(EventLoopTest, CancelledTimerNeverFires)
{
	int fired = 0;
	auto id = loop.scheduleRepeating(100, [&fired]() { fired++; });

	EXPECT_TRUE(loop.cancelTimer(id));
	EXPECT_FALSE(loop.cancelTimer(id));

	nowMs += 1000;
	loop.runPending();
	EXPECT_EQ(fired, 0);
	EXPECT_EQ(loop.activeTimers(), 0u);
}

TEST_F(EventLoopTest, TimerCanCancelItself)
{
	int fired = 0;
	EventLoop::TimerId id = 0;
	id = loop.scheduleRepeating(10, [this, &fired, &id]() {
		fired++;
		loop.cancelTimer(id);
	});

	nowMs += 10;
	loop.runPending();
	nowMs += 10;
	loop.runPending();
	EXPECT_EQ(fired, 1);
}

TEST(EventLoopThreadTest, RunProcessesTasksFromOtherThreadsUntilStopped)
{
	EventLoop loop;
	std::atomic<int> count{0};

	std::thread producer([&loop, &count]() {
		for (int i = 0; i < 100; i++) {
			loop.post([&count]() { count++; });
		}
		loop.post([&loop]() { loop.stop(); });
	});

	loop.run();
	producer.join();
	EXPECT_EQ(count.load(), 100);
}

TEST(EventLoopThreadTest, RunWakesForTimers)
{
	EventLoop loop;
	bool fired = false;
	loop.scheduleOnce(20, [&loop, &fired]() {
		fired = true;
		loop.stop();
	});

	loop.run();
	EXPECT_TRUE(fired);
}
