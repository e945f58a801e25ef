/*
 * PeerRoom
 * Single consumer task queue with timers
 */

#include "peerroom-event-loop.h"

#include <algorithm>
#include <chrono>
#include <utility>

#include "peerroom-utils.h"

namespace peerroom
{

EventLoop::EventLoop() : EventLoop(&currentTimeMs) {}

EventLoop::EventLoop(Clock clock) : clock_(std::move(clock)) {}

void EventLoop::post(Task task)
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		tasks_.push_back(std::move(task));
		generation_++;
	}
	cv_.notify_one();
}

EventLoop::TimerId EventLoop::scheduleOnce(int64_t delayMs, Task task)
{
	return addTimer(delayMs, 0, std::move(task));
}

EventLoop::TimerId EventLoop::scheduleRepeating(int64_t intervalMs, Task task)
{
	intervalMs = std::max<int64_t>(intervalMs, 1);
	return addTimer(intervalMs, intervalMs, std::move(task));
}

EventLoop::TimerId EventLoop::addTimer(int64_t delayMs, int64_t intervalMs, Task task)
{
	TimerId id;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		id = nextTimerId_++;
		Timer timer;
		timer.dueMs = clock_() + std::max<int64_t>(delayMs, 0);
		timer.intervalMs = intervalMs;
		timer.task = std::move(task);
		timers_.emplace(id, std::move(timer));
		generation_++;
	}
	cv_.notify_one();
	return id;
}

bool EventLoop::cancelTimer(TimerId id)
{
	std::lock_guard<std::mutex> lock(mutex_);
	generation_++;
	return timers_.erase(id) > 0;
}

bool EventLoop::takeNextLocked(Task &task)
{
	if (!tasks_.empty()) {
		task = std::move(tasks_.front());
		tasks_.pop_front();
		return true;
	}

	const int64_t nowMs = clock_();
	auto due = timers_.end();
	for (auto it = timers_.begin(); it != timers_.end(); ++it) {
		if (it->second.dueMs <= nowMs && (due == timers_.end() || it->second.dueMs < due->second.dueMs)) {
			due = it;
		}
	}
	if (due == timers_.end()) {
		return false;
	}

	if (due->second.intervalMs > 0) {
		task = due->second.task;
		// Rescheduled from now so a stalled loop does not replay missed ticks.
		due->second.dueMs = nowMs + due->second.intervalMs;
	} else {
		task = std::move(due->second.task);
		timers_.erase(due);
	}
	return true;
}

int64_t EventLoop::nextTimerDelayLocked() const
{
	if (timers_.empty()) {
		return -1;
	}

	int64_t earliest = timers_.begin()->second.dueMs;
	for (const auto &entry : timers_) {
		earliest = std::min(earliest, entry.second.dueMs);
	}
	return std::max<int64_t>(earliest - clock_(), 0);
}

size_t EventLoop::runPending()
{
	size_t count = 0;
	while (true) {
		Task task;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (!takeNextLocked(task)) {
				break;
			}
		}
		if (task) {
			task();
		}
		count++;
	}
	return count;
}

void EventLoop::run()
{
	while (true) {
		{
			std::unique_lock<std::mutex> lock(mutex_);
			if (stopping_) {
				break;
			}
			if (tasks_.empty()) {
				const uint64_t seen = generation_;
				const int64_t waitMs = nextTimerDelayLocked();
				auto woken = [this, seen] { return stopping_ || generation_ != seen; };
				if (waitMs < 0) {
					cv_.wait(lock, woken);
				} else if (waitMs > 0) {
					cv_.wait_for(lock, std::chrono::milliseconds(waitMs), woken);
				}
			}
			if (stopping_) {
				break;
			}
		}
		runPending();
	}
}

void EventLoop::stop()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stopping_ = true;
		generation_++;
	}
	cv_.notify_all();
}

int64_t EventLoop::now() const
{
	return clock_();
}

size_t EventLoop::pendingTasks() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return tasks_.size();
}

size_t EventLoop::activeTimers() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return timers_.size();
}

} // namespace peerroom
