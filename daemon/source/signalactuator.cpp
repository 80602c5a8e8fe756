#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <spawn.h>
#include <string>
#include <sys/wait.h>
#include "signalactuator.hpp"
#include "utility.hpp"

extern char **environ;

// actuator logging constants
constexpr const std::string_view SuspendProcess{"Suspend process"};
constexpr const std::string_view RestoreProcess{"Restore process"};
constexpr const std::string_view TerminateProcess{"Terminate process"};
constexpr const std::string_view RelaunchApplication{"Relaunch application"};
constexpr const std::string_view ReapedChild{"Relaunched application exited"};
constexpr const std::string_view ReadProcessState{"Read process state"};

static ActionResult FromErrno(int ErrorCode)
{
	switch (ErrorCode)
	{
	case 0:
		return ActionResult::Ok;
	case ESRCH:
		return ActionResult::NoSuchProcess;
	case EPERM:
		return ActionResult::PermissionDenied;
	default:
		return ActionResult::Failed;
	}
}

SignalProcessActuator::SignalProcessActuator(ILogWriter &Log, SuspendMode Mode, std::string ProcRoot)
	 : Log{Log}, Mode{Mode}, ProcRoot{std::move(ProcRoot)}
{
}

ActionResult SignalProcessActuator::SendSignal(::pid_t ProcessId, int Signal, const std::string_view &Activity)
{
	if (ProcessId <= 0)
	{
		return ActionResult::NoSuchProcess; // kill(2) treats 0 and negative ids as process groups
	}
	ActionResult Result{FromErrno(::kill(ProcessId, Signal) == 0 ? 0 : errno)};
	if (Result == ActionResult::Ok)
	{
		Log.WriteDebugAnnotated(Activity, std::to_string(ProcessId));
	}
	else
	{
		Log.WriteWarnAnnotated(Activity, std::to_string(ProcessId), ToString(Result));
	}
	return Result;
}

ActionResult SignalProcessActuator::Suspend(::pid_t ProcessId)
{
	return SendSignal(ProcessId, Mode == SuspendMode::Stop ? SIGSTOP : SIGKILL, SuspendProcess);
}

ActionResult SignalProcessActuator::Restore(::pid_t ProcessId)
{
	return SendSignal(ProcessId, SIGCONT, RestoreProcess);
}

ActionResult SignalProcessActuator::Terminate(::pid_t ProcessId)
{
	return SendSignal(ProcessId, SIGKILL, TerminateProcess); // SIGKILL is delivered to stopped processes too
}

ActionResult SignalProcessActuator::Relaunch(const std::string &Target)
{
	if (Target.empty())
	{
		Log.WriteWarnAnnotated(RelaunchApplication, Target, "no executable known");
		return ActionResult::Failed;
	}

	// the daemon blocks every signal in its threads, the application must not inherit that mask
	::posix_spawnattr_t Attributes;
	::posix_spawnattr_init(&Attributes);
	::sigset_t EmptySet;
	::sigemptyset(&EmptySet);
	::sigset_t DefaultSet;
	::sigemptyset(&DefaultSet);
	for (int Signal : {SIGHUP, SIGINT, SIGQUIT, SIGTERM, SIGPIPE, SIGCHLD})
	{
		::sigaddset(&DefaultSet, Signal);
	}
	::posix_spawnattr_setsigmask(&Attributes, &EmptySet);
	::posix_spawnattr_setsigdefault(&Attributes, &DefaultSet);
	::posix_spawnattr_setflags(&Attributes, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSID);

	std::string Program{Target};
	char *Arguments[]{Program.data(), nullptr};
	::pid_t ChildId{0};
	int SpawnResult{::posix_spawnp(&ChildId, Program.c_str(), nullptr, &Attributes, Arguments, environ)};
	::posix_spawnattr_destroy(&Attributes);

	if (SpawnResult != 0)
	{
		Log.WriteErrorAnnotated(RelaunchApplication, Target, std::strerror(SpawnResult));
		return FromErrno(SpawnResult) == ActionResult::PermissionDenied ? ActionResult::PermissionDenied : ActionResult::Failed;
	}

	Log.WriteInfoAnnotated(RelaunchApplication, Target, std::to_string(ChildId));
	std::scoped_lock ChildrenLock{ChildrenMutex};
	LaunchedChildren.push_back(ChildId);
	return ActionResult::Ok;
}

bool SignalProcessActuator::IsAlive(::pid_t ProcessId)
{
	if (ProcessId <= 0)
	{
		return false;
	}
	std::filesystem::path StatPath{ProcRoot};
	StatPath /= std::to_string(ProcessId);
	StatPath /= "stat";
	auto StatContent{Utility::ReadSmallFile(StatPath.string())};
	if (!StatContent.has_value())
	{
		return false;
	}
	auto Stat{Utility::ParseProcStat(StatContent.value())};
	if (!Stat.has_value())
	{
		Log.WriteWarnAnnotated(ReadProcessState, StatPath.string(), "unrecognized format");
		return true; // unreadable is not proof of exit
	}
	return Stat->State != 'Z' && Stat->State != 'X' && Stat->State != 'x';
}

void SignalProcessActuator::ReapChildren()
{
	std::scoped_lock ChildrenLock{ChildrenMutex};
	std::erase_if(LaunchedChildren, [this](::pid_t ChildId)
					  {
						  int Status{0};
						  ::pid_t Reaped{::waitpid(ChildId, &Status, WNOHANG)};
						  if (Reaped == ChildId)
						  {
							  Log.WriteDebugAnnotated(ReapedChild, std::to_string(ChildId));
							  return true;
						  }
						  return Reaped < 0; // ECHILD, someone else collected it
					  });
}
