#pragma once

#include <string>
#include <string_view>
#include <sys/types.h>

enum class ActionResult
{
	Ok,
	NoSuchProcess,
	PermissionDenied,
	Failed
};

std::string_view ToString(const ActionResult Result);

/// @brief Neutralizes and restores target processes on behalf of the lock coordinator.
class IProcessActuator
{
public:
	IProcessActuator() = default;
	virtual ~IProcessActuator() = default;
	IProcessActuator(const IProcessActuator &) = delete;
	IProcessActuator &operator=(const IProcessActuator &) = delete;

	virtual ActionResult Suspend(::pid_t ProcessId) = 0;
	virtual ActionResult Restore(::pid_t ProcessId) = 0;
	virtual ActionResult Terminate(::pid_t ProcessId) = 0;
	virtual ActionResult Relaunch(const std::string &Target) = 0;
	virtual bool IsAlive(::pid_t ProcessId) = 0;

	/// @brief False when Suspend ends the process, in which case a granted session is restored with Relaunch and liveness is not tracked.
	virtual bool PreservesProcess() const = 0;
};
