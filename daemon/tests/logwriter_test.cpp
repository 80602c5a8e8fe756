#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <sys/stat.h>
#include "config_constants.hpp"
#include "logwriter.hpp"
#include "tempdir.hpp"
#include "utility.hpp"

static std::string ReadLog(const TemporaryDirectory &Directory, const std::string_view &FileName)
{
	return Utility::ReadSmallFile((Directory.Path() / FileName).string()).value_or("");
}

TEST(LogWriterTest, FormatCarriesSeverity)
{
	EXPECT_EQ(FormatMessage("started", LogLevels::Info), "[INFO] started");
	EXPECT_EQ(FormatMessage("gone", LogLevels::Fatal), "[FATAL] gone");
}

TEST(LogWriterTest, EntriesBelowMinimumAreDropped)
{
	TemporaryDirectory Directory{};
	{
		auto Log{LogWriterFactory::CreateLogWriter(LogLevels::Warn, Directory.Path().string(), ConfigConstants::DaemonLogFileName, ConfigConstants::AuditFileName, false)};
		EXPECT_FALSE(Log->ShouldWrite(LogLevels::Info));
		Log->WriteInfo("quiet");
		Log->WriteWarnAnnotated("Restore failed", "chat-app, pid 100", "no-such-process");
	}
	const std::string Content{ReadLog(Directory, ConfigConstants::DaemonLogFileName)};
	EXPECT_EQ(Content.find("quiet"), std::string::npos);
	EXPECT_NE(Content.find("[WARN] Restore failed (chat-app, pid 100): no-such-process"), std::string::npos);
}

TEST(LogWriterTest, AuditRecordsGoToTheirOwnFile)
{
	TemporaryDirectory Directory{};
	{
		auto Log{LogWriterFactory::CreateLogWriter(LogLevels::Info, Directory.Path().string(), ConfigConstants::DaemonLogFileName, ConfigConstants::AuditFileName, false)};
		Log->WriteAudit("granted app=mail pid=7 name=\"Mail\" attempt=1");
		Log->WriteInfo("diagnostic");
	}
	const std::string Audit{ReadLog(Directory, ConfigConstants::AuditFileName)};
	EXPECT_NE(Audit.find("granted app=mail pid=7"), std::string::npos);
	EXPECT_EQ(Audit.find("diagnostic"), std::string::npos);
	EXPECT_EQ(ReadLog(Directory, ConfigConstants::DaemonLogFileName).find("granted"), std::string::npos);

	struct ::stat AuditStat{};
	ASSERT_EQ(::stat((Directory.Path() / ConfigConstants::AuditFileName).c_str(), &AuditStat), 0);
	EXPECT_EQ(AuditStat.st_mode & 0777, 0600u);
}

TEST(LogWriterTest, AuditSurvivesSilencedDiagnostics)
{
	TemporaryDirectory Directory{};
	{
		auto Log{LogWriterFactory::CreateLogWriter(LogLevels::None, Directory.Path().string(), ConfigConstants::DaemonLogFileName, ConfigConstants::AuditFileName, false)};
		EXPECT_FALSE(Log->ShouldWrite(LogLevels::Fatal));
		Log->WriteFatal("not written");
		Log->WriteAudit("denied app=mail pid=7");
	}
	EXPECT_NE(ReadLog(Directory, ConfigConstants::AuditFileName).find("denied"), std::string::npos);
	EXPECT_FALSE(std::filesystem::exists(Directory.Path() / ConfigConstants::DaemonLogFileName));
}

TEST(LogWriterTest, DisabledAuditWritesNothing)
{
	TemporaryDirectory Directory{};
	{
		auto Log{LogWriterFactory::CreateLogWriter(LogLevels::Info, Directory.Path().string(), ConfigConstants::DaemonLogFileName, "", false)};
		Log->WriteAudit("granted app=mail pid=7");
	}
	EXPECT_FALSE(std::filesystem::exists(Directory.Path() / ConfigConstants::AuditFileName));
}

TEST(LogWriterTest, EmptyWriterIsSilent)
{
	auto Log{LogWriterFactory::CreateEmptyLogWriter()};
	EXPECT_FALSE(Log->ShouldWrite(LogLevels::Fatal));
	Log->WriteAudit("ignored");
}
