#include <iostream>
#include <string>
#include <string_view>
#include "config.hpp"
#include "config_constants.hpp"
#include "daemon.hpp"

static void PrintUsage(const char *ProgramName)
{
	std::cerr << "Usage: " << ProgramName << " [--config PATH] [--print-config]" << std::endl;
}

int main(int argc, char *argv[])
{
	std::string ConfigPath{ConfigConstants::ConfigFilePath};
	bool PrintConfig{false};

	for (int Index{1}; Index < argc; ++Index)
	{
		const std::string_view Argument{argv[Index]};
		if (Argument == "--config" && Index + 1 < argc)
		{
			ConfigPath = argv[++Index];
		}
		else if (Argument == "--print-config")
		{
			PrintConfig = true;
		}
		else
		{
			PrintUsage(argv[0]);
			return 2;
		}
	}

	if (PrintConfig)
	{
		Configuration Config{};
		Config.Load(ConfigPath);
		for (const std::string &Diagnostic : Config.GetDiagnostics())
		{
			std::cerr << Diagnostic << std::endl;
		}
		std::cout << Config.ToToml();
		return 0;
	}

	AppLockerDaemon Daemon{ConfigPath};
	return Daemon.Run();
}
