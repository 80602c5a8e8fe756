#include <mutex>
#include "gracetracker.hpp"

bool GraceTracker::IsInGrace(const std::string &AppKey, TimePoint Now, std::chrono::seconds GracePeriod)
{
	std::scoped_lock EntriesLock{EntriesMutex};
	auto Entry{VerifiedAt.find(AppKey)};
	if (Entry == VerifiedAt.end())
	{
		return false;
	}
	if (Now - Entry->second < GracePeriod)
	{
		return true;
	}
	VerifiedAt.erase(Entry);
	return false;
}

void GraceTracker::Record(const std::string &AppKey, TimePoint Now)
{
	std::scoped_lock EntriesLock{EntriesMutex};
	VerifiedAt.insert_or_assign(AppKey, Now);
}

void GraceTracker::Clear()
{
	std::scoped_lock EntriesLock{EntriesMutex};
	VerifiedAt.clear();
}

size_t GraceTracker::Size() const
{
	std::scoped_lock EntriesLock{EntriesMutex};
	return VerifiedAt.size();
}
