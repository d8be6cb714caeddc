#include "Quota.hpp"

#include <GcraErrors.hpp>
#include <durations.hpp>

Quota::Quota(Quota::Burst maxBurst, Quota::Period period)
: maxBurst(maxBurst),
  period(period),
  emissionInterval(maxBurst == 0 ? Period::zero() : period / maxBurst) {
	if (maxBurst < 1) {
		throw InvalidQuota("Quota burst must be at least 1");
	}

	if (period <= Period::zero()) {
		throw InvalidQuota("Quota period must be positive, got " + formatDuration(period));
	}

	if (emissionInterval <= Period::zero()) {
		throw InvalidQuota("Quota period " + formatDuration(period)
			+ " is too short for a burst of " + std::to_string(maxBurst));
	}
}

Quota Quota::perSecond(Quota::Burst n) {
	return Quota(n, std::chrono::seconds(1));
}

Quota Quota::perMinute(Quota::Burst n) {
	return Quota(n, std::chrono::minutes(1));
}

Quota Quota::perHour(Quota::Burst n) {
	return Quota(n, std::chrono::hours(1));
}

Quota::Burst Quota::getMaxBurst() const {
	return maxBurst;
}

Quota::Period Quota::getPeriod() const {
	return period;
}

Quota::Period Quota::getEmissionInterval() const {
	return emissionInterval;
}

Quota::Period Quota::getBurstTolerance() const {
	return emissionInterval * maxBurst;
}

Quota::Period Quota::incrementInterval(Quota::Burst cost) const {
	return emissionInterval * cost;
}

std::string Quota::toString() const {
	return std::to_string(maxBurst) + "/" + formatDuration(period);
}
