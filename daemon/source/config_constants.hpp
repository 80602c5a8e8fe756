#pragma once

#define __APPLOCKER_PACKAGE_NAME__ "applocker"

#include <chrono>
#include <string>
#include <string_view>

namespace ConfigConstants
{
	constexpr const std::string_view packagename{__APPLOCKER_PACKAGE_NAME__};
	constexpr const std::string_view appname{__APPLOCKER_PACKAGE_NAME__ "d\0"}; // used in C APIs, do not assume NUL-termination
	constexpr const std::string_view ConfigFilePath{"/etc/" __APPLOCKER_PACKAGE_NAME__ "/" __APPLOCKER_PACKAGE_NAME__ "d.toml"};
	constexpr const std::string_view DaemonLogFileName{"daemon.log"};
	constexpr const std::string_view DaemonLockFileName{"daemon.lock"};
	constexpr const std::string_view AuditFileName{"audit.log"};

	namespace Headers
	{
		constexpr const std::string_view daemon{"daemon"};
		constexpr const std::string_view logging{"logging"};
		constexpr const std::string_view lock{"lock"};
		constexpr const std::string_view verifier{"verifier"};
	};

	namespace Fields
	{
		constexpr const std::string_view pollInterval{"poll_interval_ms"};
		constexpr const std::string_view procRoot{"proc_root"};
		constexpr const std::string_view runtimeDirectory{"runtime_directory"};
		constexpr const std::string_view lockRunningApps{"lock_running_apps"};
		constexpr const std::string_view enabled{"enabled"};
		constexpr const std::string_view level{"level"};
		constexpr const std::string_view directory{"directory"};
		constexpr const std::string_view audit{"audit"};
		constexpr const std::string_view syslogFallback{"syslog_fallback"};
		constexpr const std::string_view apps{"apps"};
		constexpr const std::string_view gracePeriod{"grace_period"};
		constexpr const std::string_view maxAttempts{"max_attempts"};
		constexpr const std::string_view verifyTimeout{"verify_timeout"};
		constexpr const std::string_view suspendMode{"suspend_mode"};
		constexpr const std::string_view command{"command"};
	};

	namespace Values
	{
		constexpr const std::string_view none{"none"};
		constexpr const std::string_view debug{"debug"};
		constexpr const std::string_view info{"info"};
		constexpr const std::string_view warn{"warn"};
		constexpr const std::string_view error{"error"};
		constexpr const std::string_view fatal{"fatal"};
		constexpr const std::string_view stop{"stop"};
		constexpr const std::string_view kill{"kill"};
	};

	namespace DefaultValues
	{
		constexpr const long pollIntervalMilliseconds{300};
		constexpr const long minimumPollIntervalMilliseconds{10};
		constexpr const std::string_view procRoot{"/proc"};
		constexpr const std::string_view runtimeDirectory{"/run/" __APPLOCKER_PACKAGE_NAME__};
		constexpr const bool lockRunningApps{true};
		constexpr const std::string_view logLevel{Values::info};
		constexpr const std::string_view logDirectory{"/var/log/" __APPLOCKER_PACKAGE_NAME__};
		constexpr const std::chrono::seconds gracePeriod{30};
		constexpr const unsigned maxAttempts{3};
		constexpr const std::chrono::seconds verifyTimeout{60};
		constexpr const std::string_view suspendMode{Values::stop};
		constexpr const std::string_view verifierCommand{"/usr/libexec/" __APPLOCKER_PACKAGE_NAME__ "/" __APPLOCKER_PACKAGE_NAME__ "-prompt"};
	};
}
