#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>
#include "clock.hpp"
#include "commandverifier.hpp"
#include "config.hpp"
#include "daemon.hpp"
#include "gracetracker.hpp"
#include "instancelock.hpp"
#include "lockcoordinator.hpp"
#include "processscanner.hpp"
#include "signalactuator.hpp"
#include "signalhandler.hpp"

// service logging constants
constexpr const std::string_view DaemonStarted{"Daemon started"};
constexpr const std::string_view DaemonStopped{"Daemon stopped"};
constexpr const std::string_view AnotherInstanceRunning{"Unable to acquire instance lock"};
constexpr const std::string_view SignalHandlerStarted{"Signal handler started"};
constexpr const std::string_view ProcessingConfigReloadRequest{"Processing configuration reload request"};
constexpr const std::string_view PolicyReloaded{"Lock policy reloaded, protected keywords"};
constexpr const std::string_view RestartRequired{"Setting changed but only takes effect after a restart"};
constexpr const std::string_view NothingProtected{"No applications are protected"};
constexpr const std::string_view ResolvingOpenSessions{"Resolving open interceptions before exit"};

/// @brief Resolves open sessions and joins the prompt workers when Run leaves its scope, on any path.
/// Declared after the coordinator, so the workers that call back into it are gone before it is destroyed.
class SessionResolver
{
private:
	LockCoordinator &Coordinator;
	CommandVerifier &Verifier;

public:
	SessionResolver(LockCoordinator &Coordinator, CommandVerifier &Verifier) : Coordinator{Coordinator}, Verifier{Verifier} {}
	~SessionResolver() { Resolve(); }
	SessionResolver(const SessionResolver &) = delete;
	SessionResolver &operator=(const SessionResolver &) = delete;

	void Resolve()
	{
		Coordinator.Shutdown();
		Verifier.Shutdown();
	}
};

void AppLockerDaemon::ReloadConfiguration(PolicyStore &Policies)
{
	Log->WriteDebug(ProcessingConfigReloadRequest);

	Configuration NewConfig{};
	NewConfig.Load(ConfigPath); // a failed load yields an empty policy, which the diagnostics report
	NewConfig.WriteDiagnostics(*Log);
	for (const std::string_view &Setting : Config.StartupSettingsChanged(NewConfig))
	{
		Log->WriteWarnAnnotated(RestartRequired, Setting);
	}

	Config.Policy = NewConfig.Policy;
	Config.PollInterval = NewConfig.PollInterval;
	Policies.Reload(Config.Policy);
	Log->WriteInfoAnnotated(PolicyReloaded, std::to_string(Config.Policy.GetKeywords().size()));
	if (Config.Policy.Empty())
	{
		Log->WriteWarn(NothingProtected);
	}
}

int AppLockerDaemon::Run()
{
	SystemSignalHandler::BlockAllSignals();

	Config.Load(ConfigPath);
	Log = Config.CreateLogWriter();
	Config.WriteDiagnostics(*Log);

	InstanceLock Lock{Config.RuntimeDirectory};
	if (!Lock())
	{
		Log->WriteFatalAnnotated(AnotherInstanceRunning, Lock.GetLockPath());
		return 1;
	}
	Log->WriteInfoAnnotated(DaemonStarted, std::to_string(::getpid()));
	if (Config.Policy.Empty())
	{
		Log->WriteWarn(NothingProtected);
	}

	PolicyStore Policies{Config.Policy};
	GraceTracker Grace{};
	SteadyClock Clock{};
	SignalProcessActuator Actuator{*Log, Config.Suspend, Config.ProcRoot};
	CommandVerifier Verifier{*Log, Config.VerifierCommand};
	LockCoordinator Coordinator{Policies, Grace, Actuator, Verifier, Clock, *Log};
	SessionResolver Resolver{Coordinator, Verifier};
	ProcessScanner Scanner{Config.ProcRoot, *Log, Config.LockRunningApps, ::getpid()};

	SystemSignalHandler SignalHandler{};
	SignalHandler.Start();
	Log->WriteDebug(SignalHandlerStarted);

	std::set<::pid_t> Deferred{}; // events dropped as Busy, delivered again on the next tick
	while (!SignalHandler.StopRequested)
	{
		if (SignalHandler.ReloadRequested)
		{
			ReloadConfiguration(Policies);
			SignalHandler.ReloadRequested = false;
		}

		ScanResult Scan{Scanner.Scan()};
		for (const ::pid_t ProcessId : Scan.Exited)
		{
			Deferred.erase(ProcessId);
			Coordinator.OnProcessExited(ProcessId);
		}

		std::vector<ProcessEvent> Events{};
		for (const ::pid_t ProcessId : Deferred)
		{
			std::optional<ProcessEvent> Event{Scanner.Refresh(ProcessId)};
			if (Event)
			{
				Events.emplace_back(std::move(Event.value()));
			}
		}
		Deferred.clear();
		Events.insert(Events.end(), Scan.Launched.begin(), Scan.Launched.end());

		for (const ProcessEvent &Event : Events)
		{
			if (Coordinator.OnEvent(Event) == EventDisposition::Busy)
			{
				Deferred.insert(Event.ProcessId);
			}
		}

		Coordinator.CheckDeadlines();
		Actuator.ReapChildren();
		SignalHandler.WaitForAttention(Config.PollInterval);
	}

	Log->WriteInfo(ResolvingOpenSessions);
	Resolver.Resolve();
	SignalHandler.Stop();
	Log->WriteInfo(DaemonStopped);
	return 0;
}
