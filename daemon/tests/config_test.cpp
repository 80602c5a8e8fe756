#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "config.hpp"
#include "fakes.hpp"
#include "tempdir.hpp"

using namespace std::chrono_literals;

constexpr const std::string_view FullDocument{R"(
[daemon]
poll_interval_ms = 150
proc_root = "/tmp/fakeproc"
runtime_directory = "/tmp/applocker-run"
lock_running_apps = false

[logging]
enabled = true
level = "debug"
directory = "/tmp/applocker-log"
audit = false
syslog_fallback = false

[lock]
apps = ["WhatsApp", "telegram", "whatsapp", "Chat-App"]
grace_period = 45
max_attempts = 5
verify_timeout = 20
suspend_mode = "kill"

[verifier]
command = ["/usr/bin/zenity-prompt", "--secure"]
)"};

static bool HasDiagnostic(const Configuration &Config, const std::string &Fragment)
{
	const auto &Diagnostics{Config.GetDiagnostics()};
	return std::any_of(Diagnostics.begin(), Diagnostics.end(), [&Fragment](const std::string &Diagnostic)
							 { return Diagnostic.find(Fragment) != std::string::npos; });
}

TEST(ConfigurationTest, ReadsEverySection)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString(FullDocument));
	EXPECT_TRUE(Config.GetDiagnostics().empty());

	EXPECT_EQ(Config.PollInterval, 150ms);
	EXPECT_EQ(Config.ProcRoot, "/tmp/fakeproc");
	EXPECT_EQ(Config.RuntimeDirectory, "/tmp/applocker-run");
	EXPECT_FALSE(Config.LockRunningApps);

	EXPECT_TRUE(Config.LoggingEnabled);
	EXPECT_EQ(Config.LogLevel, LogLevels::Debug);
	EXPECT_EQ(Config.LogDirectory, "/tmp/applocker-log");
	EXPECT_FALSE(Config.AuditEnabled);
	EXPECT_FALSE(Config.SyslogFallback);

	const std::vector<std::string> Keywords{"whatsapp", "telegram", "chat-app"};
	EXPECT_EQ(Config.Policy.GetKeywords(), Keywords);
	EXPECT_EQ(Config.Policy.GetGracePeriod(), 45s);
	EXPECT_EQ(Config.Policy.GetMaxAttempts(), 5u);
	EXPECT_EQ(Config.Policy.GetVerifyTimeout(), 20s);
	EXPECT_EQ(Config.Suspend, SuspendMode::Kill);

	const std::vector<std::string> Command{"/usr/bin/zenity-prompt", "--secure"};
	EXPECT_EQ(Config.VerifierCommand, Command);
}

TEST(ConfigurationTest, EmptyDocumentGivesDefaults)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString(""));
	EXPECT_TRUE(Config.GetDiagnostics().empty());
	EXPECT_TRUE(Config.Policy.Empty());
	EXPECT_EQ(Config.PollInterval, 300ms);
	EXPECT_EQ(Config.Policy.GetGracePeriod(), 30s);
	EXPECT_EQ(Config.Policy.GetMaxAttempts(), 3u);
	EXPECT_EQ(Config.Policy.GetVerifyTimeout(), 60s);
	EXPECT_EQ(Config.Suspend, SuspendMode::Stop);
	EXPECT_EQ(Config.LogLevel, LogLevels::Info);
	ASSERT_EQ(Config.VerifierCommand.size(), 1u);
	EXPECT_EQ(Config.VerifierCommand.front(), "/usr/libexec/applocker/applocker-prompt");
}

TEST(ConfigurationTest, MissingFileProtectsNothing)
{
	TemporaryDirectory Directory{};
	Configuration Config{};
	EXPECT_FALSE(Config.Load((Directory.Path() / "absent.toml").string()));
	EXPECT_TRUE(Config.Policy.Empty());
	EXPECT_TRUE(HasDiagnostic(Config, "not found"));
}

TEST(ConfigurationTest, UnparsableFileProtectsNothing)
{
	TemporaryDirectory Directory{};
	Directory.WriteFile("broken.toml", "[lock]\napps = [\"whatsapp\"\ngrace_period = \n");
	Configuration Config{};
	Config.Policy = LockPolicy{{"stale"}, 1s, 1};
	EXPECT_FALSE(Config.Load((Directory.Path() / "broken.toml").string()));
	EXPECT_TRUE(Config.Policy.Empty());
	EXPECT_TRUE(HasDiagnostic(Config, "Unable to parse"));
}

TEST(ConfigurationTest, BadValuesFallBackPerField)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString(R"(
[daemon]
poll_interval_ms = "fast"
lock_running_apps = 1

[logging]
level = "loud"

[lock]
apps = ["mail"]
grace_period = -4
max_attempts = 0
verify_timeout = 2.5
suspend_mode = "pause"
)"));
	EXPECT_EQ(Config.PollInterval, 300ms);
	EXPECT_TRUE(Config.LockRunningApps);
	EXPECT_EQ(Config.LogLevel, LogLevels::Info);
	EXPECT_EQ(Config.Policy.GetKeywords(), std::vector<std::string>{"mail"});
	EXPECT_EQ(Config.Policy.GetGracePeriod(), 30s);
	EXPECT_EQ(Config.Policy.GetMaxAttempts(), 3u);
	EXPECT_EQ(Config.Policy.GetVerifyTimeout(), 60s);
	EXPECT_EQ(Config.Suspend, SuspendMode::Stop);

	EXPECT_TRUE(HasDiagnostic(Config, "daemon.poll_interval_ms has the wrong type"));
	EXPECT_TRUE(HasDiagnostic(Config, "daemon.lock_running_apps has the wrong type"));
	EXPECT_TRUE(HasDiagnostic(Config, "logging.level has an unknown value"));
	EXPECT_TRUE(HasDiagnostic(Config, "lock.grace_period is out of range"));
	EXPECT_TRUE(HasDiagnostic(Config, "lock.max_attempts is out of range"));
	EXPECT_TRUE(HasDiagnostic(Config, "lock.verify_timeout has the wrong type"));
	EXPECT_TRUE(HasDiagnostic(Config, "lock.suspend_mode has an unknown value"));
}

TEST(ConfigurationTest, PollIntervalBelowMinimumIsRejected)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString("[daemon]\npoll_interval_ms = 5\n"));
	EXPECT_EQ(Config.PollInterval, 300ms);
	EXPECT_TRUE(HasDiagnostic(Config, "out of range"));
}

TEST(ConfigurationTest, AppsMustBeStrings)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString("[lock]\napps = [\"whatsapp\", 3]\n"));
	EXPECT_TRUE(Config.Policy.Empty());
	EXPECT_TRUE(HasDiagnostic(Config, "lock.apps"));

	ASSERT_TRUE(Config.LoadFromString("[lock]\napps = \"whatsapp\"\n"));
	EXPECT_TRUE(Config.Policy.Empty());
}

TEST(ConfigurationTest, SectionThatIsNotATableIsIgnored)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString("lock = 5\n"));
	EXPECT_TRUE(Config.Policy.Empty());
	EXPECT_TRUE(HasDiagnostic(Config, "lock is not a table"));
}

TEST(ConfigurationTest, VerifierCommandAcceptsString)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString("[verifier]\ncommand = \"/usr/local/bin/prompt\"\n"));
	EXPECT_EQ(Config.VerifierCommand, std::vector<std::string>{"/usr/local/bin/prompt"});

	ASSERT_TRUE(Config.LoadFromString("[verifier]\ncommand = []\n"));
	EXPECT_EQ(Config.VerifierCommand.front(), "/usr/libexec/applocker/applocker-prompt");
	EXPECT_TRUE(HasDiagnostic(Config, "verifier.command"));
}

TEST(ConfigurationTest, NormalizedDocumentRoundTrips)
{
	Configuration Original{};
	ASSERT_TRUE(Original.LoadFromString(FullDocument));

	Configuration Reloaded{};
	ASSERT_TRUE(Reloaded.LoadFromString(Original.ToToml()));
	EXPECT_TRUE(Reloaded.GetDiagnostics().empty());
	EXPECT_EQ(Reloaded.Policy, Original.Policy);
	EXPECT_TRUE(Reloaded == Original);
	EXPECT_EQ(Reloaded.ToToml(), Original.ToToml());
}

TEST(ConfigurationTest, SavedFileRoundTrips)
{
	TemporaryDirectory Directory{};
	const std::string FilePath{(Directory.Path() / "applockerd.toml").string()};

	Configuration Original{};
	ASSERT_TRUE(Original.LoadFromString(FullDocument));
	ASSERT_EQ(Original.Save(FilePath), 0);

	Configuration Reloaded{};
	ASSERT_TRUE(Reloaded.Load(FilePath));
	EXPECT_EQ(Reloaded.Policy, Original.Policy);
	EXPECT_TRUE(Reloaded == Original);

	EXPECT_NE(Original.Save((Directory.Path() / "missing" / "x.toml").string()), 0);
}

TEST(ConfigurationTest, StartupOnlyChangesAreNamed)
{
	Configuration Running{};
	ASSERT_TRUE(Running.LoadFromString(FullDocument));
	Configuration Edited{};
	ASSERT_TRUE(Edited.LoadFromString(FullDocument));

	Edited.Policy = LockPolicy{{"signal"}, 10s, 2};
	Edited.PollInterval = 500ms;
	EXPECT_TRUE(Running.StartupSettingsChanged(Edited).empty());

	Edited.LogLevel = LogLevels::Error;
	Edited.Suspend = SuspendMode::Stop;
	const auto Changed{Running.StartupSettingsChanged(Edited)};
	ASSERT_EQ(Changed.size(), 2u);
	EXPECT_EQ(Changed[0], "logging");
	EXPECT_EQ(Changed[1], "suspend_mode");
}

TEST(ConfigurationTest, DiagnosticsAreLoggedAsWarnings)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString("[lock]\nmax_attempts = -1\n"));
	CapturingLogWriter Log{};
	Config.WriteDiagnostics(Log);
	EXPECT_TRUE(Log.Contains(LogLevels::Warn, "lock.max_attempts"));
}

TEST(ConfigurationTest, DisabledLoggingGivesSilentWriter)
{
	Configuration Config{};
	ASSERT_TRUE(Config.LoadFromString("[logging]\nenabled = false\n"));
	auto Log{Config.CreateLogWriter()};
	ASSERT_NE(Log, nullptr);
	EXPECT_FALSE(Log->ShouldWrite(LogLevels::Fatal));
}
