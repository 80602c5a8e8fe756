#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace Utility
{
	/// @brief Checks if a string is composed only of digits
	/// @param s
	/// @return True if no non-digit characters found, false at the first non-digit character. An empty string is not digits-only.
	bool IsDigitsOnly(const std::string_view &s);

	std::string ToLower(const std::string_view &s);

	/// @brief Lowercases s and turns '-' and '_' into spaces, so "Chat App", "chat-app" and "chat_app" compare equal
	std::string FoldForMatching(const std::string_view &s);
	std::string_view Trim(const std::string_view &s);
	void RemoveNonPrintableCharacters(std::string &s);
	std::string RemoveNonPrintableCharacters(const std::string_view &sv);

	/// @brief Last path component of s, or s itself if it contains no '/'
	std::string_view BaseName(const std::string_view &s);

	/// @brief First NUL-delimited element of a /proc/<pid>/cmdline buffer
	std::string_view FirstCommandLineArgument(const std::string_view &CommandLine);

	/// @brief Parses a pid from a /proc directory name
	std::optional<::pid_t> ParsePid(const std::string_view &s);

	struct ProcStat
	{
		std::string Name{};
		char State{'?'};
	};

	/// @brief Parses "pid (comm) state ..." from /proc/<pid>/stat. The comm field may itself contain spaces and parentheses, so the closing parenthesis is the last one on the line.
	std::optional<ProcStat> ParseProcStat(const std::string_view &StatLine);

	/// @brief Reads a small text file whole. Returns nothing if the file cannot be opened.
	std::optional<std::string> ReadSmallFile(const std::string &Path);
}
