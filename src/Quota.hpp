#pragma once

#include <chrono>
#include <string>

#include <explints.hpp>

/* Allowed rate of a resource: up to maxBurst units at once, fully replenished
 * over period. Immutable once built, so it can be shared between any number of
 * states and threads. */
class Quota {
public:
	using Burst = u32;
	using Period = std::chrono::nanoseconds;

private:
	Burst maxBurst;
	Period period;
	Period emissionInterval;

public:
	// throws InvalidQuota
	Quota(Burst maxBurst, Period period);

	static Quota perSecond(Burst);
	static Quota perMinute(Burst);
	static Quota perHour(Burst);

	Burst getMaxBurst() const;
	Period getPeriod() const;

	// time cost of a single unit, period / maxBurst rounded down
	Period getEmissionInterval() const;

	// emissionInterval * maxBurst, the window the algorithm actually checks
	// against. Equal to period unless period isn't a multiple of maxBurst ns.
	Period getBurstTolerance() const;

	Period incrementInterval(Burst cost) const;

	std::string toString() const;

	bool operator==(const Quota&) const = default;
};
