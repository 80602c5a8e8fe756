#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>

/// @brief Remembers when each app key last passed verification. Entries for different keys are independent.
class GraceTracker
{
public:
	using TimePoint = std::chrono::steady_clock::time_point;

private:
	mutable std::mutex EntriesMutex;
	std::map<std::string, TimePoint, std::less<>> VerifiedAt{};

public:
	GraceTracker() = default;
	GraceTracker(const GraceTracker &) = delete;
	GraceTracker &operator=(const GraceTracker &) = delete;

	/// @brief True if AppKey was verified less than GracePeriod before Now. An expired entry is dropped.
	bool IsInGrace(const std::string &AppKey, TimePoint Now, std::chrono::seconds GracePeriod);
	void Record(const std::string &AppKey, TimePoint Now);
	void Clear();
	size_t Size() const;
};
