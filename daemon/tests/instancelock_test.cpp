#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include "instancelock.hpp"
#include "tempdir.hpp"
#include "utility.hpp"

TEST(InstanceLockTest, SecondHolderIsRefused)
{
	TemporaryDirectory Runtime{};
	InstanceLock First{Runtime.Path().string()};
	InstanceLock Second{Runtime.Path().string()};

	ASSERT_TRUE(First());
	EXPECT_TRUE(First.Held());
	EXPECT_FALSE(Second());
	EXPECT_FALSE(Second.Held());

	First.Unlock();
	EXPECT_TRUE(Second());
}

TEST(InstanceLockTest, LockFileCarriesOwnerPid)
{
	TemporaryDirectory Runtime{};
	InstanceLock Lock{(Runtime.Path() / "nested").string()};
	ASSERT_TRUE(Lock());
	auto Content{Utility::ReadSmallFile(Lock.GetLockPath())};
	ASSERT_TRUE(Content.has_value());
	EXPECT_EQ(Content.value(), std::to_string(::getpid()) + "\n");
}

TEST(InstanceLockTest, ReleasedOnDestruction)
{
	TemporaryDirectory Runtime{};
	{
		InstanceLock Lock{Runtime.Path().string()};
		ASSERT_TRUE(Lock());
	}
	InstanceLock Again{Runtime.Path().string()};
	EXPECT_TRUE(Again());
}
