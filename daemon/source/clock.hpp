#pragma once

#include <chrono>

class IClock
{
public:
	using TimePoint = std::chrono::steady_clock::time_point;

	IClock() = default;
	virtual ~IClock() = default;
	IClock(const IClock &) = delete;
	IClock &operator=(const IClock &) = delete;

	virtual TimePoint Now() const = 0;
};

class SteadyClock : public IClock
{
public:
	virtual TimePoint Now() const override { return std::chrono::steady_clock::now(); }
};
