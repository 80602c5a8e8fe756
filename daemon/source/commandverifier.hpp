#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>
#include "credentialverifier.hpp"
#include "logwriter.hpp"

/// @brief Runs an external prompt helper per verification request.
/// The helper receives the prompt label and the number of remaining attempts as its last two arguments and reports through its exit status:
/// 0 verified, 1 wrong credential, anything else (or death by signal) cancelled. A helper that cannot be started means the backend is unavailable.
class CommandVerifier : public ICredentialVerifier
{
private:
	struct Job
	{
		std::uint64_t SessionId{0};
		std::atomic<::pid_t> HelperId{0};
		std::atomic<bool> CancelRequested{false};
		std::atomic<bool> Finished{false};
		std::jthread Worker{};
	};

	ILogWriter &Log;
	std::vector<std::string> Command;
	std::mutex JobsMutex;
	std::list<std::unique_ptr<Job>> Jobs{};
	std::deque<std::uint64_t> CancelledSessions{}; // most recent last
	bool ShuttingDown{false};

	VerificationResult RunHelper(Job &CurrentJob, const VerificationRequest &Request);
	void PruneFinishedJobs();

public:
	CommandVerifier(ILogWriter &Log, std::vector<std::string> Command);
	virtual ~CommandVerifier();

	virtual void Verify(const VerificationRequest &Request, VerificationCallback Callback) override;

	/// @brief Withdraws the session's prompt. The session id is remembered, so a request for it that arrives later starts no helper.
	virtual void Cancel(std::uint64_t SessionId) override;

	/// @brief Stops every helper and waits for the workers. Callbacks may still run while this executes, but must not call Verify.
	void Shutdown();
};
