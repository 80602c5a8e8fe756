#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <queue>
#include <string_view>
#include <syslog.h>
#include <thread>
#include <utility>
#include "config_constants.hpp"
#include "logwriter.hpp"
#include "threadtimer.hpp"

constexpr const std::string_view FailedWriteFile{"Failed to write file"};
constexpr const std::string_view AuditPrefix{"[AUDIT] "};

std::string FormatMessage(const std::string_view &Message, const LogLevels Severity)
{
	std::string FormattedMessage;
	switch (Severity)
	{
	case LogLevels::Debug:
		FormattedMessage = "[DEBUG]";
		break;
	case LogLevels::Info:
		FormattedMessage = "[INFO]";
		break;
	case LogLevels::Warn:
		FormattedMessage = "[WARN]";
		break;
	case LogLevels::Error:
		FormattedMessage = "[ERROR]";
		break;
	case LogLevels::Fatal:
		FormattedMessage = "[FATAL]";
		break;
	default:
		FormattedMessage = "[INFO]";
		break;
	}
	FormattedMessage.push_back(' ');
	FormattedMessage.append(Message);
	return FormattedMessage;
}

static void WriteToSysLog(const std::string &Message, const LogLevels Severity)
{
	int SysLogLevel{0};
	switch (Severity)
	{
	case LogLevels::Debug:
		SysLogLevel = LOG_DEBUG;
		break;
	case LogLevels::Info:
		SysLogLevel = LOG_INFO;
		break;
	case LogLevels::Warn:
		SysLogLevel = LOG_WARNING;
		break;
	case LogLevels::Error:
		SysLogLevel = LOG_ERR;
		break;
	case LogLevels::Fatal:
		SysLogLevel = LOG_CRIT;
		break;
	default:
		SysLogLevel = LOG_INFO;
		break;
	}
	::syslog(SysLogLevel, "%s", Message.c_str());
}

ActiveLogWriter::ActiveLogWriter(const LogLevels MinimumSeverity, const std::string_view &LogDirectory, const std::string_view &LogFileName, const std::string_view &AuditFileName, const bool FallbackToSyslog)
	 : MinimumSeverity(MinimumSeverity),
		FallbackToSyslog{FallbackToSyslog},
		LogFile{std::string{LogDirectory}, std::string{LogFileName}},
		AuditFile{std::string{LogDirectory}, std::string{AuditFileName}, 0600}
{
	::openlog(ConfigConstants::appname.data(), LOG_PID, LOG_DAEMON);
}

ActiveLogWriter::~ActiveLogWriter()
{
	WriterThread.request_stop();
	SignalWriter(false);
	if (WriterThread.joinable())
	{
		WriterThread.join();
	}
	::closelog();
}

// returns true if anything was written
bool ActiveLogWriter::DrainQueues(bool &UseSyslog)
{
	std::queue<std::string> LocalAuditQueue{};
	std::queue<std::pair<LogLevels, std::string>> LocalLogQueue{};
	{
		std::scoped_lock QueueLock{QueueMutex};
		LocalAuditQueue.swap(AuditQueue);
		LocalLogQueue.swap(LogQueue);
	}
	bool Wrote{!LocalAuditQueue.empty() || !LocalLogQueue.empty()};

	while (!LocalAuditQueue.empty())
	{
		int AuditFileErrorCode{AuditFile.IsEnabled() ? AuditFile.Write(LocalAuditQueue.front(), true) : 0};
		if (AuditFileErrorCode && FallbackToSyslog)
		{
			std::string AuditRecord{AuditPrefix};
			AuditRecord.append(LocalAuditQueue.front());
			WriteToSysLog(AuditRecord, LogLevels::Info);
		}
		LocalAuditQueue.pop();
	}

	while (!LocalLogQueue.empty())
	{
		auto &[Severity, Message]{LocalLogQueue.front()};
		std::string FormattedMessage{FormatMessage(Message, Severity)};
		if (UseSyslog)
		{
			WriteToSysLog(FormattedMessage, Severity);
		}
		else
		{
			int LogFileErrorCode{LogFile.Write(FormattedMessage, true)};
			if (LogFileErrorCode)
			{
				UseSyslog = FallbackToSyslog;
				if (UseSyslog)
				{
					std::string FileError{FailedWriteFile};
					FileError.append(" (").append(LogFile.GetFilePath()).append("): ").append(std::strerror(LogFileErrorCode));
					WriteToSysLog(FormatMessage(FileError, LogLevels::Error), LogLevels::Error);
					continue; // the file error is reported first, then the original entry goes to syslog
				}
			}
		}
		LocalLogQueue.pop();
	}
	return Wrote;
}

void ActiveLogWriter::Writer(std::stop_token StopToken)
{
	WriteTimer.ResetTimeout();
	bool UseSyslog{false};
	while (true)
	{
		{
			std::unique_lock WriterLock(WriterMutex);
			WriterCondition.wait_for(WriterLock, WriteTimer.GetTimeoutLength(), [this, &StopToken]
											 {
												std::scoped_lock CheckLock{QueueMutex};
												return StopToken.stop_requested() ||
												!LogQueue.empty() ||
												!AuditQueue.empty() ||
												WriteTimer.TimedOut(); });
		}

		if (DrainQueues(UseSyslog))
		{
			WriteTimer.ResetTimeout();
		}

		if (StopToken.stop_requested() || WriteTimer.TimedOut())
		{
			std::scoped_lock QueueLock{QueueMutex};
			if (LogQueue.empty() && AuditQueue.empty())
			{
				WriterExited = true; // set under the queue lock so a concurrent writer restarts the thread
				return;
			}
		}
	}
}

void ActiveLogWriter::SignalWriter(const bool StartWriter)
{
	if (WriterExited && StartWriter)
	{
		WriterExited = false;
		WriterThread = std::jthread([this](std::stop_token StopToken)
											 { Writer(StopToken); });
	}
	WriterCondition.notify_one();
}

void ActiveLogWriter::WriteEntry(const LogLevels Severity, const std::string_view &Message)
{
	if (ShouldWrite(Severity))
	{
		std::scoped_lock QueueLock(QueueMutex);
		LogQueue.emplace(Severity, std::string{Message});
		SignalWriter(true);
	}
}

void ActiveLogWriter::WriteAudit(const std::string_view &Record)
{
	if (!AuditFile.IsEnabled())
	{
		return;
	}
	std::scoped_lock QueueLock(QueueMutex);
	AuditQueue.emplace(Record);
	SignalWriter(true);
}

std::unique_ptr<ILogWriter> LogWriterFactory::CreateLogWriter(const LogLevels MinimumSeverity, const std::string_view &LogDirectory, const std::string_view &LogFileName, const std::string_view &AuditFileName, const bool FallbackToSyslog)
{
	if (MinimumSeverity != LogLevels::None || !AuditFileName.empty())
	{
		return std::make_unique<ActiveLogWriter>(MinimumSeverity, LogDirectory, LogFileName, AuditFileName, FallbackToSyslog);
	}
	return std::make_unique<PassiveLogWriter>();
}
