#include "GcraClock.hpp"

#include <stdexcept>

TimeSource steadyTimeSource() {
	return [] { return GcraClock::now(); };
}

// starts well away from the clock's epoch so that tests subtracting a period
// from the start never go below it
ManualClock::ManualClock()
: current(GcraClock::time_point(std::chrono::hours(24))) { }

ManualClock::ManualClock(GcraClock::time_point start)
: current(start) { }

GcraClock::time_point ManualClock::now() const {
	return current;
}

void ManualClock::advance(GcraClock::duration d) {
	if (d < GcraClock::duration::zero()) {
		throw std::invalid_argument("ManualClock can't go backwards");
	}

	current += d;
}

void ManualClock::set(GcraClock::time_point t) {
	current = t;
}

TimeSource ManualClock::source() {
	return [this] { return current; };
}
