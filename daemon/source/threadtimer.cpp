#include <atomic>
#include <chrono>
#include "threadtimer.hpp"

void ThreadTimer::ResetTimeout()
{
	LastActivity = Clock::now().time_since_epoch().count();
}

std::chrono::milliseconds ThreadTimer::GetIdleTime() const
{
	Clock::time_point Last{Clock::duration{LastActivity.load()}};
	return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - Last);
}

bool ThreadTimer::TimedOut() const
{
	return GetIdleTime() > TimeoutLength;
}
