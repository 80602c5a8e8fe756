#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include "lockcoordinator.hpp"

// coordinator logging constants
constexpr const std::string_view AlreadyIntercepting{"Process already under interception"};
constexpr const std::string_view InGracePeriod{"Protected app within grace period"};
constexpr const std::string_view SessionBusy{"Verification already in progress, event dropped"};
constexpr const std::string_view Intercepting{"Intercepting protected app"};
constexpr const std::string_view SuspendFailed{"Suspend failed, continuing with verification"};
constexpr const std::string_view RequestingVerification{"Requesting verification"};
constexpr const std::string_view StaleResult{"Discarding stale verification result"};
constexpr const std::string_view RetryingVerification{"Wrong credential, prompting again"};
constexpr const std::string_view RestoreFailed{"Restore failed"};
constexpr const std::string_view TerminateFailed{"Terminate failed"};
constexpr const std::string_view AccessGranted{"Access granted"};
constexpr const std::string_view AccessDenied{"Access denied"};
constexpr const std::string_view SessionAbandoned{"Interception abandoned"};

// audit decisions
constexpr const std::string_view AuditGranted{"granted"};
constexpr const std::string_view AuditDenied{"denied"};
constexpr const std::string_view AuditAbandoned{"abandoned"};

using SessionIterator = std::map<std::string, PendingVerification, std::less<>>::iterator;

std::string_view ToString(const LockState State)
{
	switch (State)
	{
	case LockState::Idle:
		return "idle";
	case LockState::Suspended:
		return "suspended";
	case LockState::Verifying:
		return "verifying";
	case LockState::ResolvedOk:
		return "resolved-ok";
	case LockState::ResolvedFail:
		return "resolved-fail";
	}
	return "unknown";
}

static std::string DescribeSession(const PendingVerification &Session)
{
	std::string Description{Session.AppKey};
	Description.append(", pid ").append(std::to_string(Session.ProcessId));
	return Description;
}

LockCoordinator::LockCoordinator(PolicyStore &Policies, GraceTracker &Grace, IProcessActuator &Actuator, ICredentialVerifier &Verifier, const IClock &Clock, ILogWriter &Log)
	 : Policies{Policies}, Grace{Grace}, Actuator{Actuator}, Verifier{Verifier}, Clock{Clock}, Log{Log}
{
}

VerificationRequest LockCoordinator::MakeRequest(const PendingVerification &Session) const
{
	VerificationRequest Request{};
	Request.SessionId = Session.SessionId;
	Request.ProcessId = Session.ProcessId;
	Request.AppKey = Session.AppKey;
	Request.Prompt = Session.DisplayName;
	Request.Attempt = Session.Attempt;
	Request.MaxAttempts = Session.Policy->GetMaxAttempts();
	return Request;
}

void LockCoordinator::IssueVerification(const VerificationRequest &Request)
{
	Log.WriteInfoAnnotated(RequestingVerification, Request.AppKey, std::to_string(Request.RemainingAttempts()) + " attempt(s) remaining");
	Verifier.Verify(Request, [this](const VerificationRequest &Answered, const VerificationResult &Result)
						 { OnVerifyResult(Answered, Result); });
}

void LockCoordinator::Audit(const std::string_view &Decision, const PendingVerification &Session, const std::string_view &Detail)
{
	std::string Record{Decision};
	Record.append(" app=").append(Session.AppKey);
	Record.append(" pid=").append(std::to_string(Session.ProcessId));
	Record.append(" name=\"").append(Session.DisplayName).append(1, '"');
	Record.append(" attempt=").append(std::to_string(Session.Attempt));
	if (!Detail.empty())
	{
		Record.append(" reason=\"").append(Detail).append(1, '"');
	}
	Log.WriteAudit(Record);
}

// callers hold StateMutex
void LockCoordinator::EndSession(SessionIterator Session)
{
	auto Active{ActivePids.find(Session->second.ProcessId)};
	if (Active != ActivePids.end() && Active->second == Session->first)
	{
		ActivePids.erase(Active);
	}
	Pending.erase(Session);
}

bool LockCoordinator::TargetVanished(const PendingVerification &Session)
{
	return Actuator.PreservesProcess() && !Actuator.IsAlive(Session.ProcessId);
}

void LockCoordinator::Grant(SessionIterator Session)
{
	PendingVerification &Current{Session->second};
	Current.State = LockState::ResolvedOk;
	if (Actuator.PreservesProcess())
	{
		ActionResult Restored{Actuator.Restore(Current.ProcessId)};
		if (Restored == ActionResult::NoSuchProcess)
		{
			Abandon(Session, "process exited before it could be restored");
			return;
		}
		if (Restored != ActionResult::Ok)
		{
			Log.WriteWarnAnnotated(RestoreFailed, DescribeSession(Current), ToString(Restored));
		}
	}
	else
	{
		ActionResult Relaunched{Actuator.Relaunch(Current.RelaunchTarget)};
		if (Relaunched != ActionResult::Ok)
		{
			Log.WriteWarnAnnotated(RestoreFailed, DescribeSession(Current), ToString(Relaunched));
		}
	}
	Grace.Record(Current.AppKey, Clock.Now());
	Log.WriteInfoAnnotated(AccessGranted, DescribeSession(Current));
	Audit(AuditGranted, Current);
	EndSession(Session);
}

void LockCoordinator::Deny(SessionIterator Session, const VerificationOutcome Outcome, const std::string_view &Reason)
{
	PendingVerification &Current{Session->second};
	Current.State = LockState::ResolvedFail;
	if (Actuator.PreservesProcess())
	{
		ActionResult Terminated{Actuator.Terminate(Current.ProcessId)};
		if (Terminated != ActionResult::Ok)
		{
			Log.WriteWarnAnnotated(TerminateFailed, DescribeSession(Current), ToString(Terminated));
		}
	}
	std::string Detail{ToString(Outcome)};
	if (!Reason.empty())
	{
		Detail.append(": ").append(Reason);
	}
	Log.WriteWarnAnnotated(AccessDenied, DescribeSession(Current), Detail);
	Audit(AuditDenied, Current, Detail);
	EndSession(Session);
}

void LockCoordinator::Abandon(SessionIterator Session, const std::string_view &Reason)
{
	Log.WriteInfoAnnotated(SessionAbandoned, DescribeSession(Session->second), Reason);
	Audit(AuditAbandoned, Session->second, Reason);
	EndSession(Session);
}

EventDisposition LockCoordinator::OnEvent(const ProcessEvent &Event)
{
	EventDisposition Disposition{EventDisposition::Intercepted};
	std::vector<std::uint64_t> Withdrawn{};
	std::optional<VerificationRequest> Request{};
	{
		std::scoped_lock StateLock{StateMutex};
		const auto Now{Clock.Now()};
		const auto Policy{Policies.Snapshot()};

		if (ActivePids.contains(Event.ProcessId))
		{
			Log.WriteDebugAnnotated(AlreadyIntercepting, std::to_string(Event.ProcessId));
			return EventDisposition::AlreadyIntercepting;
		}

		auto Seen{GraceSeenPids.find(Event.ProcessId)};
		if (Seen != GraceSeenPids.end())
		{
			if (Grace.IsInGrace(Seen->second, Now, Policy->GetGracePeriod()))
			{
				return EventDisposition::InGrace;
			}
			GraceSeenPids.erase(Seen);
		}

		auto AppKey{PolicyMatcher::Match(*Policy, Event.DisplayName)};
		if (!AppKey.has_value())
		{
			return EventDisposition::NotProtected;
		}

		if (Grace.IsInGrace(AppKey.value(), Now, Policy->GetGracePeriod()))
		{
			GraceSeenPids.insert_or_assign(Event.ProcessId, AppKey.value());
			Log.WriteDebugAnnotated(InGracePeriod, AppKey.value(), std::to_string(Event.ProcessId));
			return EventDisposition::InGrace;
		}

		auto Existing{Pending.find(AppKey.value())};
		if (Existing != Pending.end())
		{
			const PendingVerification &Current{Existing->second};
			bool InFlight{Current.State == LockState::Suspended || Current.State == LockState::Verifying};
			if (InFlight && Current.ProcessId != Event.ProcessId && TargetVanished(Current))
			{
				Withdrawn.push_back(Current.SessionId);
				Abandon(Existing, "superseded by a new process");
			}
			else
			{
				Log.WriteDebugAnnotated(SessionBusy, AppKey.value(), std::to_string(Event.ProcessId));
				return EventDisposition::Busy;
			}
		}

		PendingVerification Session{};
		Session.AppKey = AppKey.value();
		Session.ProcessId = Event.ProcessId;
		Session.DisplayName = Event.DisplayName;
		Session.RelaunchTarget = Event.ExecutablePath.empty() ? Event.DisplayName : Event.ExecutablePath;
		Session.StartedAt = Now;
		Session.Attempt = 1;
		Session.SessionId = NextSessionId++;
		Session.State = LockState::Suspended;
		Session.Policy = Policy;
		auto [Inserted, Created]{Pending.emplace(AppKey.value(), std::move(Session))};
		ActivePids.insert_or_assign(Event.ProcessId, AppKey.value());

		Log.WriteInfoAnnotated(Intercepting, DescribeSession(Inserted->second), ToString(Event.Kind));
		ActionResult Suspended{Actuator.Suspend(Event.ProcessId)};
		if (Suspended == ActionResult::NoSuchProcess && Actuator.PreservesProcess())
		{
			Abandon(Inserted, "process exited before it could be suspended");
			Disposition = EventDisposition::Vanished;
		}
		else
		{
			if (Suspended != ActionResult::Ok && Actuator.PreservesProcess())
			{
				Log.WriteWarnAnnotated(SuspendFailed, DescribeSession(Inserted->second), ToString(Suspended));
			}
			Inserted->second.State = LockState::Verifying;
			Inserted->second.Deadline = Now + Policy->GetVerifyTimeout();
			Request = MakeRequest(Inserted->second);
		}
	}

	for (auto SessionId : Withdrawn)
	{
		Verifier.Cancel(SessionId);
	}
	if (Request.has_value())
	{
		IssueVerification(Request.value());
	}
	return Disposition;
}

void LockCoordinator::OnVerifyResult(const VerificationRequest &Request, const VerificationResult &Result)
{
	std::optional<VerificationRequest> Retry{};
	{
		std::scoped_lock StateLock{StateMutex};
		auto Session{Pending.find(Request.AppKey)};
		if (Session == Pending.end() ||
			 Session->second.SessionId != Request.SessionId ||
			 Session->second.ProcessId != Request.ProcessId ||
			 Session->second.Attempt != Request.Attempt ||
			 Session->second.State != LockState::Verifying)
		{
			Log.WriteDebugAnnotated(StaleResult, Request.AppKey, ToString(Result.Outcome));
			return;
		}

		if (TargetVanished(Session->second))
		{
			Abandon(Session, "process exited during verification");
			return;
		}

		PendingVerification &Current{Session->second};
		switch (Result.Outcome)
		{
		case VerificationOutcome::Success:
			Grant(Session);
			break;
		case VerificationOutcome::WrongCredential:
			if (Current.Attempt < Current.Policy->GetMaxAttempts())
			{
				++Current.Attempt;
				Current.Deadline = Clock.Now() + Current.Policy->GetVerifyTimeout();
				Log.WriteInfoAnnotated(RetryingVerification, DescribeSession(Current), std::to_string(Current.Attempt));
				Retry = MakeRequest(Current);
			}
			else
			{
				Deny(Session, Result.Outcome, "attempts exhausted");
			}
			break;
		default:
			Deny(Session, Result.Outcome, Result.Reason);
			break;
		}
	}

	if (Retry.has_value())
	{
		IssueVerification(Retry.value());
	}
}

void LockCoordinator::OnProcessExited(::pid_t ProcessId)
{
	std::optional<std::uint64_t> Withdrawn{};
	{
		std::scoped_lock StateLock{StateMutex};
		GraceSeenPids.erase(ProcessId);
		if (!Actuator.PreservesProcess())
		{
			return; // the process was ended on purpose, the session continues until the verifier answers
		}
		auto Active{ActivePids.find(ProcessId)};
		if (Active == ActivePids.end())
		{
			return;
		}
		auto Session{Pending.find(Active->second)};
		if (Session != Pending.end() && Session->second.ProcessId == ProcessId)
		{
			Withdrawn = Session->second.SessionId;
			Abandon(Session, "process exited");
		}
		else
		{
			ActivePids.erase(Active);
		}
	}

	if (Withdrawn.has_value())
	{
		Verifier.Cancel(Withdrawn.value());
	}
}

void LockCoordinator::CheckDeadlines()
{
	std::vector<std::uint64_t> Withdrawn{};
	{
		std::scoped_lock StateLock{StateMutex};
		const auto Now{Clock.Now()};
		for (auto Next{Pending.begin()}; Next != Pending.end();)
		{
			auto Session{Next++};
			if (TargetVanished(Session->second))
			{
				Withdrawn.push_back(Session->second.SessionId);
				Abandon(Session, "process exited");
			}
			else if (Session->second.State == LockState::Verifying && Now >= Session->second.Deadline)
			{
				Withdrawn.push_back(Session->second.SessionId);
				auto Timeout{std::chrono::duration_cast<std::chrono::seconds>(Session->second.Policy->GetVerifyTimeout())};
				Deny(Session, VerificationOutcome::TimedOut, "no answer within " + std::to_string(Timeout.count()) + "s");
			}
		}
	}

	for (auto SessionId : Withdrawn)
	{
		Verifier.Cancel(SessionId);
	}
}

void LockCoordinator::Shutdown()
{
	std::vector<std::uint64_t> Withdrawn{};
	{
		std::scoped_lock StateLock{StateMutex};
		while (!Pending.empty())
		{
			Withdrawn.push_back(Pending.begin()->second.SessionId);
			Deny(Pending.begin(), VerificationOutcome::Cancelled, "daemon stopping");
		}
		ActivePids.clear();
		GraceSeenPids.clear();
	}

	for (auto SessionId : Withdrawn)
	{
		Verifier.Cancel(SessionId);
	}
}

LockState LockCoordinator::GetState(const std::string &AppKey) const
{
	std::scoped_lock StateLock{StateMutex};
	auto Session{Pending.find(AppKey)};
	return Session == Pending.end() ? LockState::Idle : Session->second.State;
}

std::optional<PendingVerification> LockCoordinator::GetPending(const std::string &AppKey) const
{
	std::scoped_lock StateLock{StateMutex};
	auto Session{Pending.find(AppKey)};
	if (Session == Pending.end())
	{
		return std::nullopt;
	}
	return Session->second;
}

size_t LockCoordinator::PendingCount() const
{
	std::scoped_lock StateLock{StateMutex};
	return Pending.size();
}
