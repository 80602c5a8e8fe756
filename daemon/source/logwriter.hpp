#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include "outputfile.hpp"
#include "threadtimer.hpp"

enum class LogLevels
{
	None,
	Debug,
	Info,
	Warn,
	Error,
	Fatal
};

class ILogWriter
{
public:
	ILogWriter() = default;
	virtual ~ILogWriter() = default;
	ILogWriter(const ILogWriter &) = delete;
	ILogWriter &operator=(const ILogWriter &) = delete;
	ILogWriter(ILogWriter &&) = default;
	ILogWriter &operator=(ILogWriter &&) = default;
	virtual bool ShouldWrite(const LogLevels Severity) const = 0;
	virtual void WriteEntry(const LogLevels, const std::string_view &Message) = 0;
	void WriteDebug(const std::string_view &Message) { WriteEntry(LogLevels::Debug, Message); }
	void WriteInfo(const std::string_view &Message) { WriteEntry(LogLevels::Info, Message); }
	void WriteWarn(const std::string_view &Message) { WriteEntry(LogLevels::Warn, Message); }
	void WriteError(const std::string_view &Message) { WriteEntry(LogLevels::Error, Message); }
	void WriteFatal(const std::string_view &Message) { WriteEntry(LogLevels::Fatal, Message); }

	/// @brief Records an access decision. Audit records are kept apart from the diagnostic log and are not filtered by severity.
	virtual void WriteAudit(const std::string_view &Record) = 0;

	void WriteAnnotatedEntry(const LogLevels Severity, const std::string_view &ProcessMessage, const std::string_view &Item, const std::string_view &ErrorMessage = "")
	{
		if (ShouldWrite(Severity))
		{
			std::string Message{ProcessMessage};
			Message.append(" (").append(Item).append(1, ')');
			if (!ErrorMessage.empty())
			{
				Message.append(": ").append(ErrorMessage);
			}
			WriteEntry(Severity, Message);
		}
	}

	void WriteDebugAnnotated(const std::string_view &ProcessMessage, const std::string_view &Item, const std::string_view &ErrorMessage = "")
	{
		WriteAnnotatedEntry(LogLevels::Debug, ProcessMessage, Item, ErrorMessage);
	}

	void WriteInfoAnnotated(const std::string_view &ProcessMessage, const std::string_view &Item, const std::string_view &ErrorMessage = "")
	{
		WriteAnnotatedEntry(LogLevels::Info, ProcessMessage, Item, ErrorMessage);
	}

	void WriteWarnAnnotated(const std::string_view &ProcessMessage, const std::string_view &Item, const std::string_view &ErrorMessage = "")
	{
		WriteAnnotatedEntry(LogLevels::Warn, ProcessMessage, Item, ErrorMessage);
	}

	void WriteErrorAnnotated(const std::string_view &ProcessMessage, const std::string_view &Item, const std::string_view &ErrorMessage = "")
	{
		WriteAnnotatedEntry(LogLevels::Error, ProcessMessage, Item, ErrorMessage);
	}

	void WriteFatalAnnotated(const std::string_view &ProcessMessage, const std::string_view &Item, const std::string_view &ErrorMessage = "")
	{
		WriteAnnotatedEntry(LogLevels::Fatal, ProcessMessage, Item, ErrorMessage);
	}
};

class ActiveLogWriter : public ILogWriter
{
private:
	std::condition_variable WriterCondition;
	std::mutex QueueMutex;
	std::queue<std::pair<LogLevels, std::string>> LogQueue{};
	std::queue<std::string> AuditQueue{};
	void SignalWriter(const bool StartWriter);
	bool DrainQueues(bool &UseSyslog);

	LogLevels MinimumSeverity;
	bool FallbackToSyslog{true};
	OutputFile LogFile;
	OutputFile AuditFile;
	std::mutex WriterMutex;
	ThreadTimer WriteTimer{};
	void Writer(std::stop_token StopToken);
	std::atomic<bool> WriterExited{true};
	std::jthread WriterThread{}; // declared last so it stops before the members it uses are destroyed

public:
	ActiveLogWriter(const LogLevels MinimumSeverity, const std::string_view &LogDirectory, const std::string_view &LogFileName, const std::string_view &AuditFileName, const bool FallbackToSyslog);
	virtual ~ActiveLogWriter();
	virtual bool ShouldWrite(const LogLevels Severity) const override { return MinimumSeverity != LogLevels::None && Severity >= MinimumSeverity; }
	virtual void WriteEntry(const LogLevels, const std::string_view &Message) override;
	virtual void WriteAudit(const std::string_view &Record) override;
};

class PassiveLogWriter : public ILogWriter
{
public:
	PassiveLogWriter() = default;
	virtual ~PassiveLogWriter() = default;
	virtual bool ShouldWrite(const LogLevels) const override { return false; }
	virtual void WriteEntry(const LogLevels, const std::string_view &) override {}
	virtual void WriteAudit(const std::string_view &) override {}
};

class LogWriterFactory
{
private:
	LogWriterFactory() = default;

public:
	static std::unique_ptr<ILogWriter> CreateEmptyLogWriter() { return std::make_unique<PassiveLogWriter>(); }
	static std::unique_ptr<ILogWriter> CreateLogWriter(const LogLevels MinimumSeverity, const std::string_view &LogDirectory, const std::string_view &LogFileName, const std::string_view &AuditFileName, const bool FallbackToSyslog);
};

std::string FormatMessage(const std::string_view &Message, const LogLevels Severity);
