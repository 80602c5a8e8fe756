#include <chrono>
#include <gtest/gtest.h>
#include "gracetracker.hpp"

using namespace std::chrono_literals;

class GraceTrackerTest : public ::testing::Test
{
protected:
	GraceTracker Grace{};
	const GraceTracker::TimePoint Origin{};
};

TEST_F(GraceTrackerTest, UnknownKeyIsNotInGrace)
{
	EXPECT_FALSE(Grace.IsInGrace("mail", Origin, 30s));
}

TEST_F(GraceTrackerTest, GraceEndsExactlyAtPeriod)
{
	Grace.Record("mail", Origin);
	EXPECT_TRUE(Grace.IsInGrace("mail", Origin, 30s));
	EXPECT_TRUE(Grace.IsInGrace("mail", Origin + 29s, 30s));
	EXPECT_FALSE(Grace.IsInGrace("mail", Origin + 30s, 30s));
}

TEST_F(GraceTrackerTest, ExpiredEntryIsEvicted)
{
	Grace.Record("mail", Origin);
	Grace.Record("chat", Origin + 20s);
	EXPECT_EQ(Grace.Size(), 2u);
	EXPECT_FALSE(Grace.IsInGrace("mail", Origin + 40s, 30s));
	EXPECT_EQ(Grace.Size(), 1u);
	EXPECT_TRUE(Grace.IsInGrace("chat", Origin + 40s, 30s));
}

TEST_F(GraceTrackerTest, RecordOverwrites)
{
	Grace.Record("mail", Origin);
	Grace.Record("mail", Origin + 25s);
	EXPECT_TRUE(Grace.IsInGrace("mail", Origin + 50s, 30s));
}

TEST_F(GraceTrackerTest, ZeroGraceNeverSuppresses)
{
	Grace.Record("mail", Origin);
	EXPECT_FALSE(Grace.IsInGrace("mail", Origin, 0s));
}

TEST_F(GraceTrackerTest, ClearDropsEverything)
{
	Grace.Record("mail", Origin);
	Grace.Clear();
	EXPECT_EQ(Grace.Size(), 0u);
	EXPECT_FALSE(Grace.IsInGrace("mail", Origin, 30s));
}
