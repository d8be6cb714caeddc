#pragma once

#include <chrono>
#include <functional>

// Time never comes from a hidden global in the decision path: every decision
// takes a time point, and the wrappers read it from an injected TimeSource.
using GcraClock = std::chrono::steady_clock;
using TimeSource = std::function<GcraClock::time_point(void)>;

TimeSource steadyTimeSource();

/* A clock that only moves when told to. Sources handed out by source() refer
 * to this object, so it must outlive them. */
class ManualClock {
	GcraClock::time_point current;

public:
	ManualClock();
	explicit ManualClock(GcraClock::time_point start);

	ManualClock(const ManualClock&) = delete;
	const ManualClock& operator=(const ManualClock&) = delete;

	GcraClock::time_point now() const;

	// throws std::invalid_argument on negative durations
	void advance(GcraClock::duration);
	void set(GcraClock::time_point);

	TimeSource source();
};
