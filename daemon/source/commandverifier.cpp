#include <cerrno>
#include <algorithm>
#include <csignal>
#include <cstring>
#include <mutex>
#include <spawn.h>
#include <string>
#include <sys/wait.h>
#include "commandverifier.hpp"

extern char **environ;

constexpr const int ExitVerified{0};
constexpr const int ExitWrongCredential{1};
constexpr const int ExitCommandNotFound{127};
constexpr const size_t CancelledSessionMemory{256};

// verifier logging constants
constexpr const std::string_view StartHelper{"Starting credential prompt"};
constexpr const std::string_view HelperFailed{"Credential prompt could not be started"};
constexpr const std::string_view HelperExited{"Credential prompt finished"};
constexpr const std::string_view CancelHelper{"Withdrawing credential prompt"};
constexpr const std::string_view NoCommand{"No credential prompt command configured"};
constexpr const std::string_view SessionWithdrawn{"Credential prompt not started, session was withdrawn"};

CommandVerifier::CommandVerifier(ILogWriter &Log, std::vector<std::string> Command) : Log{Log}, Command{std::move(Command)}
{
}

CommandVerifier::~CommandVerifier()
{
	Shutdown();
}

VerificationResult CommandVerifier::RunHelper(Job &CurrentJob, const VerificationRequest &Request)
{
	if (Command.empty())
	{
		Log.WriteError(NoCommand);
		return VerificationResult{VerificationOutcome::Unavailable, std::string{NoCommand}};
	}

	std::vector<std::string> Arguments{Command};
	Arguments.push_back(Request.Prompt);
	Arguments.push_back(std::to_string(Request.RemainingAttempts()));
	std::vector<char *> ArgumentPointers{};
	for (auto &Argument : Arguments)
	{
		ArgumentPointers.push_back(Argument.data());
	}
	ArgumentPointers.push_back(nullptr);

	::posix_spawnattr_t Attributes;
	::posix_spawnattr_init(&Attributes);
	::sigset_t EmptySet;
	::sigemptyset(&EmptySet);
	::posix_spawnattr_setsigmask(&Attributes, &EmptySet);
	::posix_spawnattr_setflags(&Attributes, POSIX_SPAWN_SETSIGMASK);

	Log.WriteDebugAnnotated(StartHelper, Request.AppKey, std::to_string(Request.Attempt) + "/" + std::to_string(Request.MaxAttempts));
	::pid_t HelperId{0};
	int SpawnResult{::posix_spawnp(&HelperId, Arguments.front().c_str(), nullptr, &Attributes, ArgumentPointers.data(), environ)};
	::posix_spawnattr_destroy(&Attributes);
	if (SpawnResult != 0)
	{
		Log.WriteErrorAnnotated(HelperFailed, Arguments.front(), std::strerror(SpawnResult));
		return VerificationResult{VerificationOutcome::Unavailable, std::strerror(SpawnResult)};
	}

	CurrentJob.HelperId = HelperId;
	if (CurrentJob.CancelRequested)
	{
		::kill(HelperId, SIGTERM); // cancelled while the helper was starting
	}

	int Status{0};
	::pid_t Waited{0};
	do
	{
		Waited = ::waitpid(HelperId, &Status, 0);
	} while (Waited < 0 && errno == EINTR);
	CurrentJob.HelperId = 0;

	if (Waited < 0)
	{
		return VerificationResult{VerificationOutcome::Unavailable, std::strerror(errno)};
	}
	if (WIFEXITED(Status))
	{
		int ExitCode{WEXITSTATUS(Status)};
		Log.WriteDebugAnnotated(HelperExited, Request.AppKey, std::to_string(ExitCode));
		switch (ExitCode)
		{
		case ExitVerified:
			return VerificationResult{VerificationOutcome::Success, {}};
		case ExitWrongCredential:
			return VerificationResult{VerificationOutcome::WrongCredential, "wrong credential"};
		case ExitCommandNotFound:
			return VerificationResult{VerificationOutcome::Unavailable, "prompt command not found"};
		default:
			return VerificationResult{VerificationOutcome::Cancelled, "prompt exited with status " + std::to_string(ExitCode)};
		}
	}
	return VerificationResult{VerificationOutcome::Cancelled, "prompt terminated by signal " + std::to_string(WIFSIGNALED(Status) ? WTERMSIG(Status) : 0)};
}

// callers hold JobsMutex
void CommandVerifier::PruneFinishedJobs()
{
	Jobs.remove_if([](const std::unique_ptr<Job> &Candidate)
						{ return Candidate->Finished.load(); });
}

void CommandVerifier::Verify(const VerificationRequest &Request, VerificationCallback Callback)
{
	std::scoped_lock JobsLock{JobsMutex};
	if (ShuttingDown)
	{
		return;
	}
	if (std::find(CancelledSessions.cbegin(), CancelledSessions.cend(), Request.SessionId) != CancelledSessions.cend())
	{
		Log.WriteDebugAnnotated(SessionWithdrawn, Request.AppKey, std::to_string(Request.SessionId));
		return;
	}
	PruneFinishedJobs();

	auto NewJob{std::make_unique<Job>()};
	NewJob->SessionId = Request.SessionId;
	Job &CurrentJob{*NewJob};
	Jobs.push_back(std::move(NewJob));
	CurrentJob.Worker = std::jthread([this, &CurrentJob, Request, Callback{std::move(Callback)}]()
												{
													VerificationResult Result{RunHelper(CurrentJob, Request)};
													Callback(Request, Result);
													CurrentJob.Finished = true; });
}

void CommandVerifier::Cancel(std::uint64_t SessionId)
{
	std::scoped_lock JobsLock{JobsMutex};
	// a retry for this session may still be on its way to Verify
	if (std::find(CancelledSessions.cbegin(), CancelledSessions.cend(), SessionId) == CancelledSessions.cend())
	{
		CancelledSessions.push_back(SessionId);
		if (CancelledSessions.size() > CancelledSessionMemory)
		{
			CancelledSessions.pop_front();
		}
	}
	for (auto &Candidate : Jobs)
	{
		if (Candidate->SessionId == SessionId && !Candidate->Finished)
		{
			Candidate->CancelRequested = true;
			::pid_t HelperId{Candidate->HelperId.load()};
			if (HelperId > 0)
			{
				Log.WriteDebugAnnotated(CancelHelper, std::to_string(SessionId), std::to_string(HelperId));
				::kill(HelperId, SIGTERM);
			}
		}
	}
}

void CommandVerifier::Shutdown()
{
	std::list<std::unique_ptr<Job>> Stopping{};
	{
		std::scoped_lock JobsLock{JobsMutex};
		ShuttingDown = true;
		Stopping.swap(Jobs);
		for (auto &Candidate : Stopping)
		{
			Candidate->CancelRequested = true;
			::pid_t HelperId{Candidate->HelperId.load()};
			if (HelperId > 0)
			{
				::kill(HelperId, SIGTERM);
			}
		}
	}
	Stopping.clear(); // joins the workers outside the lock
}
