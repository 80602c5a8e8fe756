#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <spawn.h>
#include <string>
#include <sys/wait.h>
#include <thread>
#include "fakes.hpp"
#include "signalactuator.hpp"
#include "tempdir.hpp"
#include "utility.hpp"

extern char **environ;

using namespace std::chrono_literals;

static ::pid_t SpawnSleeper()
{
	std::string Program{"sleep"};
	std::string Duration{"30"};
	char *Arguments[]{Program.data(), Duration.data(), nullptr};
	::pid_t ChildId{0};
	if (::posix_spawnp(&ChildId, Program.c_str(), nullptr, nullptr, Arguments, environ) != 0)
	{
		return 0;
	}
	return ChildId;
}

static char ProcessState(::pid_t ProcessId)
{
	auto Content{Utility::ReadSmallFile("/proc/" + std::to_string(ProcessId) + "/stat")};
	if (!Content)
	{
		return '?';
	}
	auto Stat{Utility::ParseProcStat(Content.value())};
	return Stat ? Stat->State : '?';
}

template <typename Predicate>
static bool WaitUntil(Predicate Condition)
{
	for (int Attempt{0}; Attempt < 200; ++Attempt)
	{
		if (Condition())
		{
			return true;
		}
		std::this_thread::sleep_for(10ms);
	}
	return false;
}

TEST(SignalActuatorTest, StopModeSuspendsRestoresAndTerminates)
{
	CapturingLogWriter Log{};
	SignalProcessActuator Actuator{Log, SuspendMode::Stop, "/proc"};
	EXPECT_TRUE(Actuator.PreservesProcess());

	::pid_t Child{SpawnSleeper()};
	ASSERT_GT(Child, 0);

	EXPECT_EQ(Actuator.Suspend(Child), ActionResult::Ok);
	EXPECT_TRUE(WaitUntil([Child]
								 { return ProcessState(Child) == 'T'; }));
	EXPECT_TRUE(Actuator.IsAlive(Child));

	EXPECT_EQ(Actuator.Restore(Child), ActionResult::Ok);
	EXPECT_TRUE(WaitUntil([Child]
								 { return ProcessState(Child) != 'T'; }));

	EXPECT_EQ(Actuator.Suspend(Child), ActionResult::Ok);
	EXPECT_EQ(Actuator.Terminate(Child), ActionResult::Ok);
	EXPECT_TRUE(WaitUntil([&Actuator, Child]
								 { return !Actuator.IsAlive(Child); }));

	int Status{0};
	ASSERT_EQ(::waitpid(Child, &Status, 0), Child);
	EXPECT_TRUE(WIFSIGNALED(Status));
	EXPECT_EQ(WTERMSIG(Status), SIGKILL);
	EXPECT_EQ(Actuator.Restore(Child), ActionResult::NoSuchProcess);
}

TEST(SignalActuatorTest, KillModeEndsProcessOnSuspend)
{
	CapturingLogWriter Log{};
	SignalProcessActuator Actuator{Log, SuspendMode::Kill, "/proc"};
	EXPECT_FALSE(Actuator.PreservesProcess());

	::pid_t Child{SpawnSleeper()};
	ASSERT_GT(Child, 0);
	EXPECT_EQ(Actuator.Suspend(Child), ActionResult::Ok);

	int Status{0};
	ASSERT_EQ(::waitpid(Child, &Status, 0), Child);
	EXPECT_TRUE(WIFSIGNALED(Status));
	EXPECT_EQ(WTERMSIG(Status), SIGKILL);
}

TEST(SignalActuatorTest, InvalidProcessIdsAreNeverSignalled)
{
	CapturingLogWriter Log{};
	SignalProcessActuator Actuator{Log, SuspendMode::Stop, "/proc"};
	EXPECT_EQ(Actuator.Suspend(0), ActionResult::NoSuchProcess);
	EXPECT_EQ(Actuator.Terminate(-1), ActionResult::NoSuchProcess);
	EXPECT_FALSE(Actuator.IsAlive(0));
}

TEST(SignalActuatorTest, LivenessComesFromProcessState)
{
	TemporaryDirectory Proc{};
	Proc.WriteFile("70/stat", "70 (chat app) S 1 70 70 0\n");
	Proc.WriteFile("71/stat", "71 (chat app) Z 1 71 71 0\n");
	Proc.WriteFile("72/stat", "unexpected\n");

	CapturingLogWriter Log{};
	SignalProcessActuator Actuator{Log, SuspendMode::Stop, Proc.Path().string()};
	EXPECT_TRUE(Actuator.IsAlive(70));
	EXPECT_FALSE(Actuator.IsAlive(71));
	EXPECT_TRUE(Actuator.IsAlive(72));
	EXPECT_TRUE(Log.Contains(LogLevels::Warn, "unrecognized format"));
	EXPECT_FALSE(Actuator.IsAlive(73));
}

TEST(SignalActuatorTest, RelaunchStartsAndReapsTarget)
{
	CapturingLogWriter Log{};
	SignalProcessActuator Actuator{Log, SuspendMode::Kill, "/proc"};
	EXPECT_EQ(Actuator.Relaunch("true"), ActionResult::Ok);
	EXPECT_TRUE(WaitUntil([&]
								 {
									 Actuator.ReapChildren();
									 return Log.Contains(LogLevels::Debug, "Relaunched application exited"); }));

	EXPECT_EQ(Actuator.Relaunch(""), ActionResult::Failed);
	EXPECT_NE(Actuator.Relaunch("/nonexistent/applocker/target"), ActionResult::Ok);
}
