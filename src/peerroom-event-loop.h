/*
 * PeerRoom
 * Single consumer task queue with timers
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace peerroom
{

class EventLoop
{
public:
	using Task = std::function<void()>;
	using Clock = std::function<int64_t()>;
	using TimerId = uint64_t;

	EventLoop();
	explicit EventLoop(Clock clock);

	// Thread-safe. Tasks run in posting order on the thread driving the loop.
	void post(Task task);

	TimerId scheduleOnce(int64_t delayMs, Task task);
	TimerId scheduleRepeating(int64_t intervalMs, Task task);
	bool cancelTimer(TimerId id);

	// Runs queued tasks and due timers until none are left, without blocking.
	size_t runPending();

	// Drives the loop on the calling thread until stop() is called.
	void run();
	void stop();

	int64_t now() const;
	size_t pendingTasks() const;
	size_t activeTimers() const;

private:
	struct Timer {
		int64_t dueMs = 0;
		int64_t intervalMs = 0;
		Task task;
	};

	TimerId addTimer(int64_t delayMs, int64_t intervalMs, Task task);
	bool takeNextLocked(Task &task);
	int64_t nextTimerDelayLocked() const;

	Clock clock_;
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::deque<Task> tasks_;
	std::map<TimerId, Timer> timers_;
	TimerId nextTimerId_ = 1;
	uint64_t generation_ = 0;
	bool stopping_ = false;
};

} // namespace peerroom
