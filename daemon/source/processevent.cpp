#include <limits>
#include "processevent.hpp"
#include "utility.hpp"

std::string_view ToString(const ProcessEventKind Kind)
{
	switch (Kind)
	{
	case ProcessEventKind::Launch:
		return "launch";
	case ProcessEventKind::Activate:
		return "activate";
	}
	return "unknown";
}

std::optional<ProcessEvent> ProcessEvent::Create(long long ProcessId, const std::string_view &DisplayName, ProcessEventKind Kind, const std::string_view &ExecutablePath)
{
	if (ProcessId <= 0 || ProcessId > std::numeric_limits<::pid_t>::max())
	{
		return std::nullopt;
	}
	return ProcessEvent{static_cast<::pid_t>(ProcessId), Utility::RemoveNonPrintableCharacters(DisplayName), std::string{ExecutablePath}, Kind};
}
