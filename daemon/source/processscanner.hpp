#pragma once

#include <optional>
#include <set>
#include <string>
#include <sys/types.h>
#include <vector>
#include "logwriter.hpp"
#include "processevent.hpp"

struct ScanResult
{
	std::vector<ProcessEvent> Launched{};
	std::vector<::pid_t> Exited{};
};

/// @brief Notification source that polls a procfs tree and reports processes that appeared or disappeared since the previous scan.
class ProcessScanner
{
private:
	std::string ProcRoot;
	ILogWriter &Log;
	bool ReportExisting;
	bool FirstScan{true};
	::pid_t OwnPid;
	std::set<::pid_t> KnownPids{};

	std::optional<ProcessEvent> ReadProcess(::pid_t ProcessId) const;

public:
	/// @param ReportExisting If false, processes present at the first scan are recorded without being reported.
	ProcessScanner(std::string ProcRoot, ILogWriter &Log, bool ReportExisting, ::pid_t OwnPid);
	~ProcessScanner() = default; // assumes Log outlives this object
	ProcessScanner(const ProcessScanner &) = delete;
	ProcessScanner &operator=(const ProcessScanner &) = delete;

	ScanResult Scan();

	/// @brief Re-reads one process, for sources that need to deliver an event again.
	std::optional<ProcessEvent> Refresh(::pid_t ProcessId) const { return ReadProcess(ProcessId); }
};
