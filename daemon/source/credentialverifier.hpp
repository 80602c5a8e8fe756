#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <sys/types.h>

enum class VerificationOutcome
{
	Success,
	WrongCredential,
	Cancelled,
	Unavailable,
	TimedOut
};

std::string_view ToString(const VerificationOutcome Outcome);

struct VerificationRequest
{
	std::uint64_t SessionId{0};
	::pid_t ProcessId{0};
	std::string AppKey{};
	std::string Prompt{};
	unsigned Attempt{1};
	unsigned MaxAttempts{1};

	unsigned RemainingAttempts() const { return Attempt > MaxAttempts ? 0 : MaxAttempts - Attempt + 1; }
};

struct VerificationResult
{
	VerificationOutcome Outcome{VerificationOutcome::Unavailable};
	std::string Reason{};
};

using VerificationCallback = std::function<void(const VerificationRequest &, const VerificationResult &)>;

/// @brief Collects and checks a credential. Verify returns immediately and reports through the callback at some later point, possibly from another thread, possibly never.
class ICredentialVerifier
{
public:
	ICredentialVerifier() = default;
	virtual ~ICredentialVerifier() = default;
	ICredentialVerifier(const ICredentialVerifier &) = delete;
	ICredentialVerifier &operator=(const ICredentialVerifier &) = delete;

	virtual void Verify(const VerificationRequest &Request, VerificationCallback Callback) = 0;

	/// @brief Withdraws the prompt for a session. A callback may still arrive afterwards.
	virtual void Cancel(std::uint64_t SessionId) = 0;
};
