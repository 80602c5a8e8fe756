#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include "utility.hpp"

constexpr const std::string_view Whitespace{" \t\r\n"};

bool Utility::IsDigitsOnly(const std::string_view &s)
{
	return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c)
												{ return std::isdigit(c); });
}

std::string Utility::ToLower(const std::string_view &s)
{
	std::string Lowered{s};
	std::transform(Lowered.begin(), Lowered.end(), Lowered.begin(), [](unsigned char c)
						{ return static_cast<char>(std::tolower(c)); });
	return Lowered;
}

std::string Utility::FoldForMatching(const std::string_view &s)
{
	std::string Folded{ToLower(s)};
	std::replace_if(Folded.begin(), Folded.end(), [](char c)
						 { return c == '-' || c == '_'; },
						 ' ');
	return Folded;
}

std::string_view Utility::Trim(const std::string_view &s)
{
	auto Start{s.find_first_not_of(Whitespace)};
	if (Start == std::string_view::npos)
	{
		return std::string_view{};
	}
	auto End{s.find_last_not_of(Whitespace)};
	return s.substr(Start, End + 1 - Start);
}

void Utility::RemoveNonPrintableCharacters(std::string &s)
{
	s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c)
								  { return !std::isprint(c); }),
			  s.end());
}

std::string Utility::RemoveNonPrintableCharacters(const std::string_view &sv)
{
	std::string s{sv};
	RemoveNonPrintableCharacters(s);
	return s;
}

std::string_view Utility::BaseName(const std::string_view &s)
{
	auto Separator{s.find_last_of('/')};
	if (Separator == std::string_view::npos)
	{
		return s;
	}
	return s.substr(Separator + 1);
}

std::string_view Utility::FirstCommandLineArgument(const std::string_view &CommandLine)
{
	return CommandLine.substr(0, CommandLine.find('\0'));
}

std::optional<::pid_t> Utility::ParsePid(const std::string_view &s)
{
	if (!IsDigitsOnly(s))
	{
		return std::nullopt;
	}
	::pid_t Pid{0};
	auto [End, ErrorCode]{std::from_chars(s.data(), s.data() + s.size(), Pid)};
	if (ErrorCode != std::errc{} || End != s.data() + s.size() || Pid <= 0)
	{
		return std::nullopt;
	}
	return Pid;
}

std::optional<Utility::ProcStat> Utility::ParseProcStat(const std::string_view &StatLine)
{
	auto Open{StatLine.find('(')};
	auto Close{StatLine.rfind(')')};
	if (Open == std::string_view::npos || Close == std::string_view::npos || Close < Open)
	{
		return std::nullopt;
	}
	auto Remainder{Trim(StatLine.substr(Close + 1))};
	if (Remainder.empty())
	{
		return std::nullopt;
	}
	return ProcStat{std::string{StatLine.substr(Open + 1, Close - Open - 1)}, Remainder.front()};
}

std::optional<std::string> Utility::ReadSmallFile(const std::string &Path)
{
	std::ifstream Input{Path, std::ios::binary};
	if (!Input.is_open())
	{
		return std::nullopt;
	}
	std::string Content{std::istreambuf_iterator<char>{Input}, std::istreambuf_iterator<char>{}};
	if (Input.bad())
	{
		return std::nullopt;
	}
	return Content;
}
