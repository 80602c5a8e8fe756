#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "config_constants.hpp"

/// @brief Immutable set of protected-app keywords plus the parameters of a lock session.
/// Keywords are lowercase, unique, and kept in configured order because the first match wins.
class LockPolicy
{
private:
	std::vector<std::string> Keywords{};
	std::chrono::seconds GracePeriod{ConfigConstants::DefaultValues::gracePeriod};
	unsigned MaxAttempts{ConfigConstants::DefaultValues::maxAttempts};
	std::chrono::seconds VerifyTimeout{ConfigConstants::DefaultValues::verifyTimeout};

public:
	LockPolicy() = default;

	/// @brief Normalizes keywords (trimmed, lowercased, empty and duplicate entries dropped) and clamps MaxAttempts to at least 1 and durations to at least 0.
	LockPolicy(const std::vector<std::string> &RawKeywords, std::chrono::seconds GracePeriod, unsigned MaxAttempts, std::chrono::seconds VerifyTimeout = ConfigConstants::DefaultValues::verifyTimeout);

	const std::vector<std::string> &GetKeywords() const { return Keywords; }
	std::chrono::seconds GetGracePeriod() const { return GracePeriod; }
	unsigned GetMaxAttempts() const { return MaxAttempts; }
	std::chrono::seconds GetVerifyTimeout() const { return VerifyTimeout; }
	bool Empty() const { return Keywords.empty(); }

	bool operator==(const LockPolicy &) const = default;
};

namespace PolicyMatcher
{
	/// @brief Returns the first policy keyword contained in the display name, ignoring case and treating "-", "_" and " " alike.
	std::optional<std::string> Match(const LockPolicy &Policy, const std::string_view &DisplayName);
}

/// @brief Holds the active LockPolicy snapshot. Reload swaps the snapshot wholesale; holders of an older snapshot keep it alive.
class PolicyStore
{
private:
	mutable std::mutex SnapshotMutex;
	std::shared_ptr<const LockPolicy> Active;

public:
	PolicyStore() : Active{std::make_shared<const LockPolicy>()} {}
	explicit PolicyStore(LockPolicy Initial) : Active{std::make_shared<const LockPolicy>(std::move(Initial))} {}
	PolicyStore(const PolicyStore &) = delete;
	PolicyStore &operator=(const PolicyStore &) = delete;

	std::shared_ptr<const LockPolicy> Snapshot() const;
	void Reload(LockPolicy NewPolicy);
};
