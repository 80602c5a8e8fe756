#include <algorithm>
#include <mutex>
#include <string>
#include "lockpolicy.hpp"
#include "utility.hpp"

LockPolicy::LockPolicy(const std::vector<std::string> &RawKeywords, std::chrono::seconds GracePeriod, unsigned MaxAttempts, std::chrono::seconds VerifyTimeout)
	 : GracePeriod{std::max(GracePeriod, std::chrono::seconds{0})},
		MaxAttempts{std::max(MaxAttempts, 1u)},
		VerifyTimeout{std::max(VerifyTimeout, std::chrono::seconds{0})}
{
	for (const auto &RawKeyword : RawKeywords)
	{
		std::string Keyword{Utility::ToLower(Utility::Trim(RawKeyword))};
		if (!Keyword.empty() && std::find(Keywords.begin(), Keywords.end(), Keyword) == Keywords.end())
		{
			Keywords.emplace_back(std::move(Keyword));
		}
	}
}

std::optional<std::string> PolicyMatcher::Match(const LockPolicy &Policy, const std::string_view &DisplayName)
{
	if (DisplayName.empty())
	{
		return std::nullopt;
	}
	const std::string Folded{Utility::FoldForMatching(DisplayName)};
	for (const auto &Keyword : Policy.GetKeywords())
	{
		if (Folded.find(Utility::FoldForMatching(Keyword)) != std::string::npos)
		{
			return Keyword;
		}
	}
	return std::nullopt;
}

std::shared_ptr<const LockPolicy> PolicyStore::Snapshot() const
{
	std::scoped_lock SnapshotLock{SnapshotMutex};
	return Active;
}

void PolicyStore::Reload(LockPolicy NewPolicy)
{
	auto Replacement{std::make_shared<const LockPolicy>(std::move(NewPolicy))};
	std::scoped_lock SnapshotLock{SnapshotMutex};
	Active.swap(Replacement);
}
