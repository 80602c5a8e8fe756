#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include "processscanner.hpp"
#include "utility.hpp"

constexpr const size_t KernelCommLength{15}; // TASK_COMM_LEN - 1

// scanner logging constants
constexpr const std::string_view ScanProcRoot{"Scanning process table"};
constexpr const std::string_view ProcessAppeared{"Process appeared"};

ProcessScanner::ProcessScanner(std::string ProcRoot, ILogWriter &Log, bool ReportExisting, ::pid_t OwnPid)
	 : ProcRoot{std::move(ProcRoot)}, Log{Log}, ReportExisting{ReportExisting}, OwnPid{OwnPid}
{
}

std::optional<ProcessEvent> ProcessScanner::ReadProcess(::pid_t ProcessId) const
{
	std::filesystem::path ProcessPath{ProcRoot};
	ProcessPath /= std::to_string(ProcessId);

	auto Comm{Utility::ReadSmallFile((ProcessPath / "comm").string())};
	if (!Comm.has_value())
	{
		return std::nullopt; // exited between listing and reading
	}
	std::string DisplayName{Utility::Trim(Comm.value())};

	std::string ArgumentZero{};
	auto CommandLine{Utility::ReadSmallFile((ProcessPath / "cmdline").string())};
	if (CommandLine.has_value())
	{
		ArgumentZero = Utility::FirstCommandLineArgument(CommandLine.value());
	}

	// comm is truncated by the kernel; the executable name from argv[0] carries the rest
	if (DisplayName.size() >= KernelCommLength)
	{
		std::string_view Base{Utility::BaseName(ArgumentZero)};
		if (Base.size() > DisplayName.size() && Base.starts_with(DisplayName))
		{
			DisplayName = Base;
		}
	}

	std::error_code ErrorCode{};
	std::string ExecutablePath{std::filesystem::read_symlink(ProcessPath / "exe", ErrorCode).string()};
	if (ErrorCode.value() != 0)
	{
		ExecutablePath = ArgumentZero;
	}

	return ProcessEvent::Create(ProcessId, DisplayName, ProcessEventKind::Launch, ExecutablePath);
}

ScanResult ProcessScanner::Scan()
{
	ScanResult Result{};
	std::set<::pid_t> CurrentPids{};

	std::error_code ErrorCode{};
	// increment reports a readdir failure through ErrorCode
	for (std::filesystem::directory_iterator Entries{ProcRoot, ErrorCode}; !ErrorCode && Entries != std::filesystem::directory_iterator{}; Entries.increment(ErrorCode))
	{
		auto ProcessId{Utility::ParsePid(Entries->path().filename().string())};
		if (!ProcessId.has_value() || ProcessId.value() == OwnPid)
		{
			continue;
		}
		CurrentPids.insert(ProcessId.value());
		if (KnownPids.contains(ProcessId.value()) || (FirstScan && !ReportExisting))
		{
			continue;
		}
		auto Event{ReadProcess(ProcessId.value())};
		if (Event.has_value())
		{
			Log.WriteDebugAnnotated(ProcessAppeared, Event->DisplayName, std::to_string(Event->ProcessId));
			Result.Launched.push_back(std::move(Event.value()));
		}
		else
		{
			CurrentPids.erase(ProcessId.value());
		}
	}
	if (ErrorCode.value() != 0)
	{
		Log.WriteErrorAnnotated(ScanProcRoot, ProcRoot, ErrorCode.message());
		return Result; // keep the previous view rather than reporting every process as exited
	}

	for (auto KnownPid : KnownPids)
	{
		if (!CurrentPids.contains(KnownPid))
		{
			Result.Exited.push_back(KnownPid);
		}
	}
	KnownPids.swap(CurrentPids);
	FirstScan = false;
	return Result;
}
