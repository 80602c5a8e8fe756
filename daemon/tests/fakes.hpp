#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "clock.hpp"
#include "credentialverifier.hpp"
#include "logwriter.hpp"
#include "processactuator.hpp"

class ManualClock : public IClock
{
private:
	mutable std::mutex TimeMutex;
	TimePoint Current{};

public:
	virtual TimePoint Now() const override
	{
		std::scoped_lock TimeLock{TimeMutex};
		return Current;
	}

	/// @brief Moves to an absolute offset from the clock's origin
	void SetSeconds(long Seconds)
	{
		std::scoped_lock TimeLock{TimeMutex};
		Current = TimePoint{} + std::chrono::seconds{Seconds};
	}

	void Advance(std::chrono::seconds Interval)
	{
		std::scoped_lock TimeLock{TimeMutex};
		Current += Interval;
	}
};

struct ActuatorCall
{
	std::string Action{};
	::pid_t ProcessId{0};
	std::string Target{};
};

class RecordingActuator : public IProcessActuator
{
private:
	mutable std::mutex CallsMutex;
	std::vector<ActuatorCall> Calls{};
	std::set<::pid_t> Dead{};
	std::map<std::string, ActionResult, std::less<>> Results{};
	bool Preserves;

	ActionResult Record(const std::string &Action, ::pid_t ProcessId, const std::string &Target = "")
	{
		std::scoped_lock CallsLock{CallsMutex};
		Calls.push_back(ActuatorCall{Action, ProcessId, Target});
		auto Configured{Results.find(Action)};
		return Configured == Results.end() ? ActionResult::Ok : Configured->second;
	}

public:
	explicit RecordingActuator(bool PreservesProcess = true) : Preserves{PreservesProcess} {}

	virtual ActionResult Suspend(::pid_t ProcessId) override { return Record("suspend", ProcessId); }
	virtual ActionResult Restore(::pid_t ProcessId) override { return Record("restore", ProcessId); }
	virtual ActionResult Terminate(::pid_t ProcessId) override { return Record("terminate", ProcessId); }
	virtual ActionResult Relaunch(const std::string &Target) override { return Record("relaunch", 0, Target); }
	virtual bool IsAlive(::pid_t ProcessId) override
	{
		std::scoped_lock CallsLock{CallsMutex};
		return !Dead.contains(ProcessId);
	}
	virtual bool PreservesProcess() const override { return Preserves; }

	void SetResult(const std::string &Action, ActionResult Result)
	{
		std::scoped_lock CallsLock{CallsMutex};
		Results.insert_or_assign(Action, Result);
	}

	void Kill(::pid_t ProcessId)
	{
		std::scoped_lock CallsLock{CallsMutex};
		Dead.insert(ProcessId);
	}

	std::vector<ActuatorCall> GetCalls() const
	{
		std::scoped_lock CallsLock{CallsMutex};
		return Calls;
	}

	size_t CountCalls(const std::string &Action, ::pid_t ProcessId) const
	{
		std::scoped_lock CallsLock{CallsMutex};
		return static_cast<size_t>(std::count_if(Calls.begin(), Calls.end(), [&](const ActuatorCall &Call)
															  { return Call.Action == Action && Call.ProcessId == ProcessId; }));
	}

	size_t CountCalls(const std::string &Action) const
	{
		std::scoped_lock CallsLock{CallsMutex};
		return static_cast<size_t>(std::count_if(Calls.begin(), Calls.end(), [&](const ActuatorCall &Call)
															  { return Call.Action == Action; }));
	}
};

/// @brief Holds every request until the test answers it.
class DeferredVerifier : public ICredentialVerifier
{
private:
	struct Outstanding
	{
		VerificationRequest Request{};
		VerificationCallback Callback{};
	};

	mutable std::mutex RequestsMutex;
	std::vector<Outstanding> Requests{};
	std::vector<std::uint64_t> Cancelled{};

public:
	virtual void Verify(const VerificationRequest &Request, VerificationCallback Callback) override
	{
		std::scoped_lock RequestsLock{RequestsMutex};
		Requests.push_back(Outstanding{Request, std::move(Callback)});
	}

	virtual void Cancel(std::uint64_t SessionId) override
	{
		std::scoped_lock RequestsLock{RequestsMutex};
		Cancelled.push_back(SessionId);
	}

	size_t RequestCount() const
	{
		std::scoped_lock RequestsLock{RequestsMutex};
		return Requests.size();
	}

	VerificationRequest GetRequest(size_t Index) const
	{
		std::scoped_lock RequestsLock{RequestsMutex};
		return Requests.at(Index).Request;
	}

	VerificationRequest LastRequest() const
	{
		std::scoped_lock RequestsLock{RequestsMutex};
		return Requests.back().Request;
	}

	/// @brief Answers a request. The callback runs without the verifier's lock held, the way a real backend reports.
	void Answer(size_t Index, VerificationOutcome Outcome, const std::string &Reason = "")
	{
		Outstanding Answered{};
		{
			std::scoped_lock RequestsLock{RequestsMutex};
			Answered = Requests.at(Index);
		}
		Answered.Callback(Answered.Request, VerificationResult{Outcome, Reason});
	}

	void AnswerLast(VerificationOutcome Outcome, const std::string &Reason = "")
	{
		Answer(RequestCount() - 1, Outcome, Reason);
	}

	std::vector<std::uint64_t> GetCancelled() const
	{
		std::scoped_lock RequestsLock{RequestsMutex};
		return Cancelled;
	}
};

class CapturingLogWriter : public ILogWriter
{
private:
	mutable std::mutex EntriesMutex;
	std::vector<std::pair<LogLevels, std::string>> Entries{};
	std::vector<std::string> AuditRecords{};

public:
	virtual bool ShouldWrite(const LogLevels) const override { return true; }
	virtual void WriteEntry(const LogLevels Severity, const std::string_view &Message) override
	{
		std::scoped_lock EntriesLock{EntriesMutex};
		Entries.emplace_back(Severity, std::string{Message});
	}
	virtual void WriteAudit(const std::string_view &Record) override
	{
		std::scoped_lock EntriesLock{EntriesMutex};
		AuditRecords.emplace_back(Record);
	}

	std::vector<std::string> GetAudit() const
	{
		std::scoped_lock EntriesLock{EntriesMutex};
		return AuditRecords;
	}

	bool Contains(const LogLevels Severity, const std::string_view &Fragment) const
	{
		std::scoped_lock EntriesLock{EntriesMutex};
		return std::any_of(Entries.begin(), Entries.end(), [&](const auto &Entry)
								 { return Entry.first == Severity && Entry.second.find(Fragment) != std::string::npos; });
	}
};
