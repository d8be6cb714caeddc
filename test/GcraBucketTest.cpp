#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

#include <GcraBucket.hpp>
#include <GcraErrors.hpp>

using namespace std::chrono_literals;

TEST(GcraBucket, SpendsBurstThenWaits) {
	ManualClock clock;
	GcraBucket b(Quota(4, 4s), clock.source());

	EXPECT_EQ(b.getRemaining(), 4u);
	for (int i = 0; i < 4; i++) {
		EXPECT_TRUE(b.spend());
	}

	EXPECT_EQ(b.getRemaining(), 0u);
	EXPECT_FALSE(b.canSpend());

	auto r = b.spend();
	EXPECT_FALSE(r);
	EXPECT_EQ(r.getRetryAfter(), 1s);

	clock.advance(r.getRetryAfter());
	EXPECT_TRUE(b.canSpend());
	EXPECT_TRUE(b.spend());
}

TEST(GcraBucket, CanSpendDoesNotConsume) {
	ManualClock clock;
	GcraBucket b(Quota(1, 1s), clock.source());

	EXPECT_TRUE(b.canSpend());
	EXPECT_TRUE(b.canSpend());
	EXPECT_TRUE(b.getState().isFresh());
}

TEST(GcraBucket, BulkSpend) {
	ManualClock clock;
	GcraBucket b(Quota(10, 1s), clock.source());

	EXPECT_TRUE(b.spend(7));
	EXPECT_FALSE(b.canSpend(4));
	EXPECT_TRUE(b.spend(3));
	EXPECT_THROW(b.spend(11), CostExceedsCapacity);
	EXPECT_THROW(b.spend(0), InvalidCost);
}

TEST(GcraBucket, RefundGivesUnitsBack) {
	ManualClock clock;
	GcraBucket b(Quota(2, 2s), clock.source());

	ASSERT_TRUE(b.spend(2));
	ASSERT_FALSE(b.canSpend());

	b.refund();
	EXPECT_EQ(b.getRemaining(), 1u);
	EXPECT_TRUE(b.spend());
}

TEST(GcraBucket, RefundOverCapacityThrows) {
	ManualClock clock;
	GcraBucket b(Quota(2, 2s), clock.source());

	ASSERT_TRUE(b.spend(2));
	auto tat = b.getState().getTat();

	EXPECT_THROW(b.refund(3), CostExceedsCapacity);
	EXPECT_THROW(b.refund(UINT32_MAX), CostExceedsCapacity);
	EXPECT_THROW(b.refund(0), InvalidCost);
	EXPECT_EQ(b.getState().getTat(), tat);
}

TEST(GcraBucket, SetQuotaKeepsState) {
	ManualClock clock;
	GcraBucket b(Quota(2, 2s), clock.source());

	ASSERT_TRUE(b.spend(2));
	auto tat = b.getState().getTat();

	b.setQuota(Quota(20, 2s));
	EXPECT_EQ(b.getQuota(), Quota(20, 2s));
	EXPECT_EQ(b.getState().getTat(), tat);
	EXPECT_FALSE(b.canSpend());

	clock.advance(100ms);
	EXPECT_TRUE(b.spend());
}

TEST(GcraBucket, Reset) {
	ManualClock clock;
	GcraBucket b(Quota(1, 1min), clock.source());

	ASSERT_TRUE(b.spend());
	ASSERT_FALSE(b.spend());

	b.reset();
	EXPECT_TRUE(b.spend());
}

TEST(GcraBucket, NeedsATimeSource) {
	EXPECT_THROW(GcraBucket(Quota(1, 1s), TimeSource{}), std::invalid_argument);
}

TEST(GcraBucket, DefaultsToSteadyClock) {
	GcraBucket b(Quota::perHour(1));

	EXPECT_TRUE(b.spend());
	EXPECT_FALSE(b.spend());
}
