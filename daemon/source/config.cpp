#include <cerrno>
#include <concepts>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <type_traits>
#include "config_constants.hpp"
#include "config.hpp"
#include "logwriter.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

constexpr const std::string_view ConfigurationMissing{"Configuration file not found, no applications are protected"};
constexpr const std::string_view ConfigurationUnparsable{"Unable to parse configuration file, no applications are protected"};
constexpr const std::string_view WrongType{"has the wrong type, using default"};
constexpr const std::string_view OutOfRange{"is out of range, using default"};
constexpr const std::string_view UnknownValue{"has an unknown value, using default"};
constexpr const std::string_view NotATable{"is not a table, using defaults for the whole section"};
constexpr const std::string_view AppsNotStrings{"must be an array of strings, no applications are protected"};

// log levels
static const std::map<const std::string_view, const LogLevels> LogLevelsMap{
	 {ConfigConstants::Values::none, LogLevels::None},
	 {ConfigConstants::Values::debug, LogLevels::Debug},
	 {ConfigConstants::Values::info, LogLevels::Info},
	 {ConfigConstants::Values::warn, LogLevels::Warn},
	 {ConfigConstants::Values::error, LogLevels::Error},
	 {ConfigConstants::Values::fatal, LogLevels::Fatal}};

static const std::map<const std::string_view, const SuspendMode> SuspendModesMap{
	 {ConfigConstants::Values::stop, SuspendMode::Stop},
	 {ConfigConstants::Values::kill, SuspendMode::Kill}};

template <typename T>
concept has_size = requires(T t) {
	{ t.size() } -> std::convertible_to<std::size_t>;
};

template <typename T>
bool HasUsableValue(const T &Value)
{
	if constexpr (std::is_class_v<T>)
	{
		if constexpr (std::is_same_v<T, std::string>)
		{
			return !Value.empty();
		}
		else if constexpr (has_size<T>)
		{
			return Value.size() > 0;
		}
		else if constexpr (std::is_same_v<T, std::optional<typename T::value_type>>)
		{
			return Value.has_value() && HasUsableValue(Value.value());
		}
		else
		{
			static_assert(sizeof(T) == 0, "Unsupported type");
		}
	}
	else
	{
		return true;
	}
	return false;
}

template <typename ValueType>
static std::string_view LookupName(const std::map<const std::string_view, const ValueType> &Map, const ValueType Value)
{
	for (const auto &[Name, MappedValue] : Map)
	{
		if (MappedValue == Value)
		{
			return Name;
		}
	}
	return {};
}

static std::string FieldName(const std::string_view &Header, const std::string_view &KeyName)
{
	std::string Name{Header};
	if (!KeyName.empty())
	{
		Name.append(1, '.').append(KeyName);
	}
	return Name;
}

static void AddDiagnostic(std::vector<std::string> &Diagnostics, const std::string_view &Header, const std::string_view &KeyName, const std::string_view &Problem)
{
	std::string Message{FieldName(Header, KeyName)};
	Message.append(1, ' ').append(Problem);
	Diagnostics.emplace_back(std::move(Message));
}

static toml::table GetSection(const toml::table &TomlConfig, const std::string_view &Header, std::vector<std::string> &Diagnostics)
{
	if (const toml::table *Section{TomlConfig[Header].as_table()})
	{
		return *Section;
	}
	if (TomlConfig.contains(Header))
	{
		AddDiagnostic(Diagnostics, Header, "", NotATable);
	}
	return toml::table{};
}

/// @brief Reads a scalar; a present value of the wrong type or one that fails IsValid leaves a diagnostic and yields DefaultValue.
template <typename ReturnType, typename Validator>
ReturnType GetConfigurationValueOrDefault(const toml::table &TomlTable, const std::string_view &Header, const std::string_view &KeyName, ReturnType DefaultValue, std::vector<std::string> &Diagnostics, Validator IsValid)
{
	if (!TomlTable.contains(KeyName))
	{
		return DefaultValue;
	}
	std::optional<ReturnType> OptVal{TomlTable[KeyName].value_exact<ReturnType>()};
	if (!OptVal)
	{
		AddDiagnostic(Diagnostics, Header, KeyName, WrongType);
		return DefaultValue;
	}
	if (!HasUsableValue(OptVal) || !IsValid(OptVal.value()))
	{
		AddDiagnostic(Diagnostics, Header, KeyName, OutOfRange);
		return DefaultValue;
	}
	return OptVal.value();
}

template <typename ReturnType>
ReturnType GetConfigurationValueOrDefault(const toml::table &TomlTable, const std::string_view &Header, const std::string_view &KeyName, ReturnType DefaultValue, std::vector<std::string> &Diagnostics)
{
	return GetConfigurationValueOrDefault(TomlTable, Header, KeyName, std::move(DefaultValue), Diagnostics, [](const ReturnType &)
														{ return true; });
}

template <typename MappedType>
MappedType GetMappedValueOrDefault(const toml::table &TomlTable, const std::string_view &Header, const std::string_view &KeyName, const std::map<const std::string_view, const MappedType> &Map, const std::string_view &DefaultName, std::vector<std::string> &Diagnostics)
{
	const std::string Name{GetConfigurationValueOrDefault(TomlTable, Header, KeyName, std::string{DefaultName}, Diagnostics)};
	auto Found{Map.find(Name)};
	if (Found == Map.end())
	{
		AddDiagnostic(Diagnostics, Header, KeyName, UnknownValue);
		return Map.at(DefaultName);
	}
	return Found->second;
}

/// @brief Reads an array of strings. Any element that is not a string rejects the whole array.
static std::optional<std::vector<std::string>> GetStringArray(const toml::table &TomlTable, const std::string_view &KeyName)
{
	const toml::array *Array{TomlTable[KeyName].as_array()};
	if (Array == nullptr)
	{
		return std::nullopt;
	}
	std::vector<std::string> OutVector{};
	for (const toml::node &Element : *Array)
	{
		std::optional<std::string> Value{Element.value_exact<std::string>()};
		if (!Value)
		{
			return std::nullopt;
		}
		OutVector.emplace_back(std::move(Value.value()));
	}
	return OutVector;
}

static void ReadDaemonSection(Configuration &Config, const toml::table &TomlConfig, std::vector<std::string> &Diagnostics)
{
	using namespace ConfigConstants;
	const toml::table Section{GetSection(TomlConfig, Headers::daemon, Diagnostics)};

	Config.PollInterval = std::chrono::milliseconds{GetConfigurationValueOrDefault(Section, Headers::daemon, Fields::pollInterval, std::int64_t{DefaultValues::pollIntervalMilliseconds}, Diagnostics, [](std::int64_t Value)
																											  { return Value >= DefaultValues::minimumPollIntervalMilliseconds; })};
	Config.ProcRoot = GetConfigurationValueOrDefault(Section, Headers::daemon, Fields::procRoot, std::string{DefaultValues::procRoot}, Diagnostics);
	Config.RuntimeDirectory = GetConfigurationValueOrDefault(Section, Headers::daemon, Fields::runtimeDirectory, std::string{DefaultValues::runtimeDirectory}, Diagnostics);
	Config.LockRunningApps = GetConfigurationValueOrDefault(Section, Headers::daemon, Fields::lockRunningApps, DefaultValues::lockRunningApps, Diagnostics);
}

static void ReadLoggingSection(Configuration &Config, const toml::table &TomlConfig, std::vector<std::string> &Diagnostics)
{
	using namespace ConfigConstants;
	const toml::table Section{GetSection(TomlConfig, Headers::logging, Diagnostics)};

	Config.LoggingEnabled = GetConfigurationValueOrDefault(Section, Headers::logging, Fields::enabled, true, Diagnostics);
	Config.LogLevel = GetMappedValueOrDefault(Section, Headers::logging, Fields::level, LogLevelsMap, DefaultValues::logLevel, Diagnostics);
	Config.LogDirectory = GetConfigurationValueOrDefault(Section, Headers::logging, Fields::directory, std::string{DefaultValues::logDirectory}, Diagnostics);
	Config.AuditEnabled = GetConfigurationValueOrDefault(Section, Headers::logging, Fields::audit, true, Diagnostics);
	Config.SyslogFallback = GetConfigurationValueOrDefault(Section, Headers::logging, Fields::syslogFallback, true, Diagnostics);
}

static void ReadLockSection(Configuration &Config, const toml::table &TomlConfig, std::vector<std::string> &Diagnostics)
{
	using namespace ConfigConstants;
	const toml::table Section{GetSection(TomlConfig, Headers::lock, Diagnostics)};

	std::vector<std::string> Apps{};
	if (Section.contains(Fields::apps))
	{
		std::optional<std::vector<std::string>> ConfiguredApps{GetStringArray(Section, Fields::apps)};
		if (ConfiguredApps)
		{
			Apps = std::move(ConfiguredApps.value());
		}
		else
		{
			AddDiagnostic(Diagnostics, Headers::lock, Fields::apps, AppsNotStrings);
		}
	}

	const std::int64_t GracePeriod{GetConfigurationValueOrDefault(Section, Headers::lock, Fields::gracePeriod, std::int64_t{DefaultValues::gracePeriod.count()}, Diagnostics, [](std::int64_t Value)
																					  { return Value >= 0; })};
	const std::int64_t MaxAttempts{GetConfigurationValueOrDefault(Section, Headers::lock, Fields::maxAttempts, std::int64_t{DefaultValues::maxAttempts}, Diagnostics, [](std::int64_t Value)
																					  { return Value >= 1 && Value <= 1000; })};
	const std::int64_t VerifyTimeout{GetConfigurationValueOrDefault(Section, Headers::lock, Fields::verifyTimeout, std::int64_t{DefaultValues::verifyTimeout.count()}, Diagnostics, [](std::int64_t Value)
																						 { return Value >= 1; })};
	Config.Policy = LockPolicy{Apps, std::chrono::seconds{GracePeriod}, static_cast<unsigned>(MaxAttempts), std::chrono::seconds{VerifyTimeout}};
	Config.Suspend = GetMappedValueOrDefault(Section, Headers::lock, Fields::suspendMode, SuspendModesMap, DefaultValues::suspendMode, Diagnostics);
}

static void ReadVerifierSection(Configuration &Config, const toml::table &TomlConfig, std::vector<std::string> &Diagnostics)
{
	using namespace ConfigConstants;
	const toml::table Section{GetSection(TomlConfig, Headers::verifier, Diagnostics)};

	if (!Section.contains(Fields::command))
	{
		return;
	}
	if (Section[Fields::command].is_string())
	{
		std::string Command{GetConfigurationValueOrDefault(Section, Headers::verifier, Fields::command, std::string{DefaultValues::verifierCommand}, Diagnostics)};
		Config.VerifierCommand = {Command};
		return;
	}
	std::optional<std::vector<std::string>> Command{GetStringArray(Section, Fields::command)};
	if (!Command)
	{
		AddDiagnostic(Diagnostics, Headers::verifier, Fields::command, WrongType);
	}
	else if (!HasUsableValue(Command) || Command.value().front().empty())
	{
		AddDiagnostic(Diagnostics, Headers::verifier, Fields::command, OutOfRange);
	}
	else
	{
		Config.VerifierCommand = std::move(Command.value());
	}
}

static void ReadTomlConfig(Configuration &Config, const toml::table &TomlConfig, std::vector<std::string> &Diagnostics)
{
	ReadDaemonSection(Config, TomlConfig, Diagnostics);
	ReadLoggingSection(Config, TomlConfig, Diagnostics);
	ReadLockSection(Config, TomlConfig, Diagnostics);
	ReadVerifierSection(Config, TomlConfig, Diagnostics);
}

static std::string DescribeParseError(const std::string_view &SourceName, const toml::parse_error &Error)
{
	std::ostringstream ErrorText{};
	ErrorText << ConfigurationUnparsable << " (" << SourceName << "): " << Error;
	return ErrorText.str();
}

bool Configuration::LoadFromString(const std::string_view &Document, const std::string_view &SourceName)
{
	*this = Configuration{};
	toml::parse_result TomlParseResult{toml::parse(Document, SourceName)};
	if (!TomlParseResult)
	{
		Diagnostics.emplace_back(DescribeParseError(SourceName, TomlParseResult.error()));
		return false;
	}
	ReadTomlConfig(*this, TomlParseResult.table(), Diagnostics);
	return true;
}

bool Configuration::Load(const std::string_view &FilePath)
{
	*this = Configuration{};
	std::error_code ErrorCode{};
	if (!std::filesystem::is_regular_file(FilePath, ErrorCode))
	{
		std::string Message{ConfigurationMissing};
		Message.append(" (").append(FilePath).append(1, ')');
		Diagnostics.emplace_back(std::move(Message));
		return false;
	}

	toml::parse_result TomlParseResult{toml::parse_file(FilePath)};
	if (!TomlParseResult)
	{
		Diagnostics.emplace_back(DescribeParseError(FilePath, TomlParseResult.error()));
		return false;
	}
	ReadTomlConfig(*this, TomlParseResult.table(), Diagnostics);
	return true;
}

std::unique_ptr<ILogWriter> Configuration::CreateLogWriter() const
{
	if (!LoggingEnabled)
	{
		return LogWriterFactory::CreateEmptyLogWriter();
	}
	const std::string_view AuditFileName{AuditEnabled ? ConfigConstants::AuditFileName : ""};
	return LogWriterFactory::CreateLogWriter(LogLevel, LogDirectory, ConfigConstants::DaemonLogFileName, AuditFileName, SyslogFallback);
}

std::string Configuration::ToToml() const
{
	using namespace ConfigConstants;

	toml::array Apps{};
	for (const std::string &Keyword : Policy.GetKeywords())
	{
		Apps.push_back(Keyword);
	}
	toml::array Command{};
	for (const std::string &Argument : VerifierCommand)
	{
		Command.push_back(Argument);
	}

	toml::table TomlConfig{
		 {Headers::daemon, toml::table{
									{Fields::pollInterval, static_cast<std::int64_t>(PollInterval.count())},
									{Fields::procRoot, ProcRoot},
									{Fields::runtimeDirectory, RuntimeDirectory},
									{Fields::lockRunningApps, LockRunningApps}}},
		 {Headers::logging, toml::table{
									 {Fields::enabled, LoggingEnabled},
									 {Fields::level, std::string{LookupName(LogLevelsMap, LogLevel)}},
									 {Fields::directory, LogDirectory},
									 {Fields::audit, AuditEnabled},
									 {Fields::syslogFallback, SyslogFallback}}},
		 {Headers::lock, toml::table{
								 {Fields::apps, std::move(Apps)},
								 {Fields::gracePeriod, static_cast<std::int64_t>(Policy.GetGracePeriod().count())},
								 {Fields::maxAttempts, static_cast<std::int64_t>(Policy.GetMaxAttempts())},
								 {Fields::verifyTimeout, static_cast<std::int64_t>(Policy.GetVerifyTimeout().count())},
								 {Fields::suspendMode, std::string{LookupName(SuspendModesMap, Suspend)}}}},
		 {Headers::verifier, toml::table{
									  {Fields::command, std::move(Command)}}}};

	std::ostringstream Document{};
	Document << TomlConfig << '\n';
	return Document.str();
}

int Configuration::Save(const std::string &FilePath) const
{
	const std::string Document{ToToml()};
	std::FILE *File{std::fopen(FilePath.c_str(), "w")};
	if (File == nullptr)
	{
		return errno;
	}
	int Result{0};
	if (std::fwrite(Document.data(), sizeof(char), Document.size(), File) != Document.size())
	{
		Result = errno != 0 ? errno : EIO;
	}
	if (std::fclose(File) != 0 && Result == 0)
	{
		Result = errno;
	}
	return Result;
}

void Configuration::WriteDiagnostics(ILogWriter &Log) const
{
	for (const std::string &Diagnostic : Diagnostics)
	{
		Log.WriteWarn(Diagnostic);
	}
}

std::vector<std::string_view> Configuration::StartupSettingsChanged(const Configuration &Other) const
{
	using namespace ConfigConstants;
	std::vector<std::string_view> Changed{};
	if (ProcRoot != Other.ProcRoot)
	{
		Changed.emplace_back(Fields::procRoot);
	}
	if (RuntimeDirectory != Other.RuntimeDirectory)
	{
		Changed.emplace_back(Fields::runtimeDirectory);
	}
	if (LockRunningApps != Other.LockRunningApps)
	{
		Changed.emplace_back(Fields::lockRunningApps);
	}
	if (LoggingEnabled != Other.LoggingEnabled || LogLevel != Other.LogLevel || LogDirectory != Other.LogDirectory || AuditEnabled != Other.AuditEnabled || SyslogFallback != Other.SyslogFallback)
	{
		Changed.emplace_back(Headers::logging);
	}
	if (Suspend != Other.Suspend)
	{
		Changed.emplace_back(Fields::suspendMode);
	}
	if (VerifierCommand != Other.VerifierCommand)
	{
		Changed.emplace_back(Fields::command);
	}
	return Changed;
}

bool Configuration::operator==(const Configuration &Other) const
{
	return PollInterval == Other.PollInterval &&
			 Policy == Other.Policy &&
			 StartupSettingsChanged(Other).empty();
}
