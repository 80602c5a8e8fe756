#include <gtest/gtest.h>
#include <limits>
#include "processevent.hpp"

TEST(ProcessEventTest, ValidEventKeepsFields)
{
	auto Event{ProcessEvent::Create(42, "Chat App", ProcessEventKind::Activate, "/usr/bin/chat")};
	ASSERT_TRUE(Event.has_value());
	EXPECT_EQ(Event->ProcessId, 42);
	EXPECT_EQ(Event->DisplayName, "Chat App");
	EXPECT_EQ(Event->ExecutablePath, "/usr/bin/chat");
	EXPECT_EQ(Event->Kind, ProcessEventKind::Activate);
	EXPECT_EQ(ToString(Event->Kind), "activate");
}

TEST(ProcessEventTest, InvalidProcessIdsAreRejected)
{
	EXPECT_FALSE(ProcessEvent::Create(0, "x", ProcessEventKind::Launch).has_value());
	EXPECT_FALSE(ProcessEvent::Create(-7, "x", ProcessEventKind::Launch).has_value());
	EXPECT_FALSE(ProcessEvent::Create(static_cast<long long>(std::numeric_limits<::pid_t>::max()) + 1, "x", ProcessEventKind::Launch).has_value());
}

TEST(ProcessEventTest, ControlCharactersAreStripped)
{
	auto Event{ProcessEvent::Create(7, "Chat\tApp\n", ProcessEventKind::Launch)};
	ASSERT_TRUE(Event.has_value());
	EXPECT_EQ(Event->DisplayName, "ChatApp");
}

TEST(ProcessEventTest, EmptyNameIsAccepted)
{
	auto Event{ProcessEvent::Create(7, "", ProcessEventKind::Launch)};
	ASSERT_TRUE(Event.has_value());
	EXPECT_TRUE(Event->DisplayName.empty());
	EXPECT_TRUE(Event->ExecutablePath.empty());
}
