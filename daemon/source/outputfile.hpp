#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include "threadtimer.hpp"

/// @brief Append-only text file that opens on demand and closes itself after a period without writes.
class OutputFile
{
private:
	std::string DirectoryName;
	std::string FileName;
	::mode_t FileMode;

	FILE *File{nullptr};

	int PrepareFile();
	void Cleanup(std::stop_token StopToken);

	std::condition_variable CleanupWaitCondition;
	std::mutex CleanupMutex;
	std::mutex WriterMutex;
	ThreadTimer CloseTimer{std::chrono::seconds{5}};
	std::jthread CleanupThread{};
	std::atomic<bool> FileClosed{true};

public:
	OutputFile(std::string DirectoryName, std::string FileName, const ::mode_t FileMode = 0640)
		 : DirectoryName{std::move(DirectoryName)}, FileName{std::move(FileName)}, FileMode{FileMode} {}
	~OutputFile();
	OutputFile(const OutputFile &other) = delete;
	OutputFile(OutputFile &&other) = delete;
	OutputFile &operator=(const OutputFile &other) = delete;
	OutputFile &operator=(OutputFile &&other) = delete;

	bool IsEnabled() const { return !FileName.empty(); }
	std::string GetFilePath() const;

	/// @brief Appends one line to the file, opening it first if needed.
	/// @return 0 on success, otherwise an errno value
	int Write(const std::string_view &Message, const bool WithStamp = false);
};
