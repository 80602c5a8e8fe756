#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include "outputfile.hpp"

OutputFile::~OutputFile()
{
	CleanupThread.request_stop();
	CleanupWaitCondition.notify_one();
	if (CleanupThread.joinable())
	{
		CleanupThread.join();
	}
	if (File != nullptr)
	{
		std::fclose(File);
		File = nullptr;
	}
}

std::string OutputFile::GetFilePath() const
{
	std::filesystem::path FullPath{DirectoryName};
	FullPath /= FileName;
	return FullPath.string();
}

int OutputFile::PrepareFile()
{
	if (!IsEnabled())
	{
		return ENOENT;
	}

	std::error_code ErrorCode{};
	std::filesystem::create_directories(DirectoryName, ErrorCode);
	if (ErrorCode.value() != 0)
	{
		return ErrorCode.value();
	}

	int Descriptor{::open(GetFilePath().c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, FileMode)};
	if (Descriptor < 0)
	{
		return errno;
	}
	File = ::fdopen(Descriptor, "a");
	if (File == nullptr)
	{
		int FdOpenError{errno};
		::close(Descriptor);
		return FdOpenError;
	}
	return 0;
}

void OutputFile::Cleanup(std::stop_token StopToken)
{
	{
		std::unique_lock TimedLock{CleanupMutex};
		while (!CloseTimer.TimedOut() && !StopToken.stop_requested())
		{
			CleanupWaitCondition.wait_for(TimedLock, CloseTimer.GetTimeoutLength(), [this, &StopToken]
													{ return StopToken.stop_requested() || CloseTimer.TimedOut(); });
		}
	}

	std::scoped_lock WriterLock{WriterMutex}; // a write racing the close finishes first
	if (StopToken.stop_requested())
	{
		return; // destructor closes the file
	}
	if (File != nullptr)
	{
		std::fclose(File);
	}
	File = nullptr;
	FileClosed = true;
}

int OutputFile::Write(const std::string_view &Message, const bool WithStamp)
{
	std::unique_lock WriterLock(WriterMutex);

	int FileActionResult{0};
	if (File == nullptr)
	{
		FileActionResult = PrepareFile();
	}

	if (FileActionResult == 0)
	{
		errno = 0;
		if (WithStamp)
		{
			std::time_t CurrentTime{std::time(nullptr)};
			std::tm TimeInfo{};
			::localtime_r(&CurrentTime, &TimeInfo);
			char TimeBuffer[64];
			std::strftime(TimeBuffer, sizeof(TimeBuffer), "%Y-%m-%d %H:%M:%S", &TimeInfo);
			std::fprintf(File, "[%s]: ", TimeBuffer);
		}
		if (std::fwrite(Message.data(), sizeof(char), Message.size(), File) == Message.size() && std::fputc('\n', File) != EOF && std::fflush(File) == 0)
		{
			CloseTimer.ResetTimeout();
			FileActionResult = 0;
		}
		else
		{
			FileActionResult = errno != 0 ? errno : EIO;
			std::clearerr(File);
		}
	}

	if (File != nullptr && FileClosed)
	{
		FileClosed = false;
		CloseTimer.ResetTimeout();
		if (CleanupThread.joinable())
		{
			WriterLock.unlock(); // the previous cleanup thread may be waiting on the writer lock to exit
			CleanupThread.join();
			WriterLock.lock();
		}
		CleanupThread = std::jthread([this](std::stop_token StopToken)
											 { Cleanup(StopToken); });
	}
	return FileActionResult;
}
