#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

enum class ProcessEventKind
{
	Launch,
	Activate
};

std::string_view ToString(const ProcessEventKind Kind);

/// @brief A validated process notification. Only ProcessEvent::Create builds one, so downstream code never sees a malformed payload.
class ProcessEvent
{
private:
	ProcessEvent(::pid_t ProcessId, std::string DisplayName, std::string ExecutablePath, ProcessEventKind Kind)
		 : ProcessId{ProcessId}, DisplayName{std::move(DisplayName)}, ExecutablePath{std::move(ExecutablePath)}, Kind{Kind} {}

public:
	::pid_t ProcessId;
	std::string DisplayName;
	std::string ExecutablePath; // empty when unknown
	ProcessEventKind Kind;

	/// @brief Rejects non-positive process ids. Non-printable characters are stripped from the display name; an empty name is allowed and simply matches nothing.
	static std::optional<ProcessEvent> Create(long long ProcessId, const std::string_view &DisplayName, ProcessEventKind Kind, const std::string_view &ExecutablePath = {});
};
