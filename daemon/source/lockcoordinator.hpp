#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "clock.hpp"
#include "credentialverifier.hpp"
#include "gracetracker.hpp"
#include "lockpolicy.hpp"
#include "logwriter.hpp"
#include "processactuator.hpp"
#include "processevent.hpp"

enum class LockState
{
	Idle,
	Suspended,
	Verifying,
	ResolvedOk,
	ResolvedFail
};

std::string_view ToString(const LockState State);

/// @brief What OnEvent did with an event. Busy events were dropped because the app already has a session; the source may deliver them again later.
enum class EventDisposition
{
	NotProtected,
	InGrace,
	AlreadyIntercepting,
	Busy,
	Intercepted,
	Vanished
};

/// @brief One interception in progress. At most one exists per app key.
struct PendingVerification
{
	std::string AppKey{};
	::pid_t ProcessId{0};
	std::string DisplayName{};
	std::string RelaunchTarget{};
	IClock::TimePoint StartedAt{};
	IClock::TimePoint Deadline{};
	unsigned Attempt{1};
	std::uint64_t SessionId{0};
	LockState State{LockState::Idle};
	std::shared_ptr<const LockPolicy> Policy{}; // the snapshot captured when interception began
};

/// @brief Decides, for each process event, whether to intercept, and drives the suspend / verify / restore-or-terminate sequence.
///
/// Sessions are tracked per app key, so verifications for different apps run concurrently while events for an app that already
/// has a session are dropped. All session and grace state is guarded by one mutex. Actuator calls happen under that mutex;
/// verifier calls never do, because a verifier may report back on the calling thread.
class LockCoordinator
{
private:
	PolicyStore &Policies;
	GraceTracker &Grace;
	IProcessActuator &Actuator;
	ICredentialVerifier &Verifier;
	const IClock &Clock;
	ILogWriter &Log;

	mutable std::mutex StateMutex;
	std::map<std::string, PendingVerification, std::less<>> Pending{};
	std::map<::pid_t, std::string> ActivePids{};
	std::map<::pid_t, std::string> GraceSeenPids{};
	std::uint64_t NextSessionId{1};

	VerificationRequest MakeRequest(const PendingVerification &Session) const;
	void IssueVerification(const VerificationRequest &Request);
	void EndSession(std::map<std::string, PendingVerification, std::less<>>::iterator Session);
	void Grant(std::map<std::string, PendingVerification, std::less<>>::iterator Session);
	void Deny(std::map<std::string, PendingVerification, std::less<>>::iterator Session, const VerificationOutcome Outcome, const std::string_view &Reason);
	void Abandon(std::map<std::string, PendingVerification, std::less<>>::iterator Session, const std::string_view &Reason);
	bool TargetVanished(const PendingVerification &Session);
	void Audit(const std::string_view &Decision, const PendingVerification &Session, const std::string_view &Detail = "");

public:
	LockCoordinator(PolicyStore &Policies, GraceTracker &Grace, IProcessActuator &Actuator, ICredentialVerifier &Verifier, const IClock &Clock, ILogWriter &Log);
	~LockCoordinator() = default;
	LockCoordinator(const LockCoordinator &) = delete;
	LockCoordinator &operator=(const LockCoordinator &) = delete;
	LockCoordinator(LockCoordinator &&) = delete;
	LockCoordinator &operator=(LockCoordinator &&) = delete;

	/// @brief Entry point for the notification source. Safe to call from any thread.
	EventDisposition OnEvent(const ProcessEvent &Event);

	/// @brief Completion path for the credential verifier. Results that do not match the live session are discarded.
	void OnVerifyResult(const VerificationRequest &Request, const VerificationResult &Result);

	/// @brief Notification that a process is gone. An interception for it ends without restore or terminate.
	void OnProcessExited(::pid_t ProcessId);

	/// @brief Fails sessions whose verification deadline passed and drops sessions whose process disappeared.
	void CheckDeadlines();

	/// @brief Resolves every open session fail-closed. Used when the daemon stops.
	void Shutdown();

	LockState GetState(const std::string &AppKey) const;
	std::optional<PendingVerification> GetPending(const std::string &AppKey) const;
	size_t PendingCount() const;
};
