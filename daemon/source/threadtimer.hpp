#pragma once

#include <atomic>
#include <chrono>

/// @brief Idle timer for worker threads. Measures how long it has been since the owning thread last did useful work.
class ThreadTimer
{
private:
	using Clock = std::chrono::steady_clock;

	std::atomic<Clock::rep> LastActivity{0};
	std::chrono::milliseconds TimeoutLength;

public:
	explicit ThreadTimer(std::chrono::milliseconds TimeoutLength = std::chrono::seconds{1}) : TimeoutLength{TimeoutLength} {}

	const std::chrono::milliseconds &GetTimeoutLength() const { return TimeoutLength; }
	void ResetTimeout();
	bool TimedOut() const;
	std::chrono::milliseconds GetIdleTime() const;
};
