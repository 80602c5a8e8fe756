#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "config_constants.hpp"
#include "lockpolicy.hpp"
#include "logwriter.hpp"
#include "signalactuator.hpp"

class Configuration
{
private:
	std::vector<std::string> Diagnostics{};

public:
	// [daemon]
	std::chrono::milliseconds PollInterval{ConfigConstants::DefaultValues::pollIntervalMilliseconds};
	std::string ProcRoot{ConfigConstants::DefaultValues::procRoot};
	std::string RuntimeDirectory{ConfigConstants::DefaultValues::runtimeDirectory};
	bool LockRunningApps{ConfigConstants::DefaultValues::lockRunningApps};

	// [logging]
	bool LoggingEnabled{true};
	LogLevels LogLevel{LogLevels::Info};
	std::string LogDirectory{ConfigConstants::DefaultValues::logDirectory};
	bool AuditEnabled{true};
	bool SyslogFallback{true};

	// [lock]
	LockPolicy Policy{};
	SuspendMode Suspend{SuspendMode::Stop};

	// [verifier]
	std::vector<std::string> VerifierCommand{std::string{ConfigConstants::DefaultValues::verifierCommand}};

	Configuration() = default;
	~Configuration() = default;

	/// @brief Loads settings from a TOML file. Anything missing or unusable falls back to its default and leaves a diagnostic.
	/// A missing or unparsable file yields the defaults, which protect no apps.
	/// @return true when the file was read and parsed
	bool Load(const std::string_view &FilePath = ConfigConstants::ConfigFilePath);
	bool LoadFromString(const std::string_view &Document, const std::string_view &SourceName = "string");

	/// @brief Generates a log writer based on the loaded logging settings.
	std::unique_ptr<ILogWriter> CreateLogWriter() const;

	/// @brief Normalized TOML document. Loading it again yields the same settings.
	std::string ToToml() const;

	/// @return 0 on success, otherwise an errno value
	int Save(const std::string &FilePath) const;

	const std::vector<std::string> &GetDiagnostics() const { return Diagnostics; }
	void WriteDiagnostics(ILogWriter &Log) const;

	/// @brief Names the settings that differ from Other and only take effect at startup.
	std::vector<std::string_view> StartupSettingsChanged(const Configuration &Other) const;

	/// @brief Compares settings; diagnostics are ignored.
	bool operator==(const Configuration &Other) const;
};
