#pragma once

#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>
#include "logwriter.hpp"
#include "processactuator.hpp"

enum class SuspendMode
{
	Stop, // SIGSTOP now, SIGCONT on success
	Kill  // SIGKILL now, relaunch on success
};

/// @brief Process actuator built on kill(2) and posix_spawn(3).
class SignalProcessActuator : public IProcessActuator
{
private:
	ILogWriter &Log;
	SuspendMode Mode;
	std::string ProcRoot;
	std::mutex ChildrenMutex;
	std::vector<::pid_t> LaunchedChildren{};

	ActionResult SendSignal(::pid_t ProcessId, int Signal, const std::string_view &Activity);

public:
	SignalProcessActuator(ILogWriter &Log, SuspendMode Mode, std::string ProcRoot);
	virtual ~SignalProcessActuator() = default;

	virtual ActionResult Suspend(::pid_t ProcessId) override;
	virtual ActionResult Restore(::pid_t ProcessId) override;
	virtual ActionResult Terminate(::pid_t ProcessId) override;
	virtual ActionResult Relaunch(const std::string &Target) override;
	virtual bool IsAlive(::pid_t ProcessId) override;
	virtual bool PreservesProcess() const override { return Mode == SuspendMode::Stop; }

	/// @brief Collects exit statuses of relaunched applications so they do not linger as zombies.
	void ReapChildren();
};
