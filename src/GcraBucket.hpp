#pragma once

#include <explints.hpp>
#include <GcraClock.hpp>
#include <GcraState.hpp>
#include <Quota.hpp>

/* A quota bound to its own GCRA state and time source, for callers that don't
 * need to vary the quota per call. Not thread safe. */
class GcraBucket {
	Quota quota;
	GcraState state;
	TimeSource clock;

public:
	explicit GcraBucket(Quota, TimeSource = steadyTimeSource());

	// keeps the current state, so the new rate applies from the next call on
	void setQuota(Quota);

	bool canSpend(u32 count = 1) const;
	GcraResult spend(u32 count = 1);
	void refund(u32 count = 1);
	void reset();

	const Quota& getQuota() const;
	const GcraState& getState() const;
	u32 getRemaining() const;
};
