#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "config.hpp"
#include "lockpolicy.hpp"
#include "logwriter.hpp"

class AppLockerDaemon
{
private:
	std::string ConfigPath;
	Configuration Config{};
	std::unique_ptr<ILogWriter> Log{nullptr};

	void ReloadConfiguration(PolicyStore &Policies);

public:
	explicit AppLockerDaemon(std::string ConfigPath) : ConfigPath{std::move(ConfigPath)} {}
	~AppLockerDaemon() = default;
	AppLockerDaemon(const AppLockerDaemon &) = delete;
	AppLockerDaemon &operator=(const AppLockerDaemon &) = delete;
	AppLockerDaemon(AppLockerDaemon &&) = default;
	AppLockerDaemon &operator=(AppLockerDaemon &&) = default;

	/// @return process exit status
	int Run();
};
