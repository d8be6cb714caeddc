#include "GcraState.hpp"

#include <algorithm>
#include <utility>

#include <GcraErrors.hpp>

GcraResult::GcraResult(bool allowed, GcraClock::duration retryAfter, GcraClock::time_point allowAt)
: retryAfter(retryAfter),
  allowAt(allowAt),
  allowed(allowed) { }

GcraResult GcraResult::admitted(GcraClock::time_point now) {
	return GcraResult(true, GcraClock::duration::zero(), now);
}

GcraResult GcraResult::notAllowed(GcraClock::time_point now, GcraClock::time_point allowAt) {
	return GcraResult(false, allowAt - now, allowAt);
}

bool GcraResult::isAllowed() const noexcept {
	return allowed;
}

GcraResult::operator bool() const noexcept {
	return allowed;
}

GcraClock::duration GcraResult::getRetryAfter() const noexcept {
	return retryAfter;
}

GcraClock::time_point GcraResult::getAllowAt() const noexcept {
	return allowAt;
}

GcraState::GcraState(std::optional<GcraClock::time_point> tat)
: tat(tat) { }

std::pair<GcraClock::time_point, GcraClock::time_point> GcraState::schedule(const Quota& q, u32 cost, GcraClock::time_point now) const {
	if (cost == 0) {
		throw InvalidCost();
	}

	if (cost > q.getMaxBurst()) {
		throw CostExceedsCapacity(cost, q.getMaxBurst());
	}

	// an empty history behaves as if the last service completed right now,
	// and an old TAT can't bank more than a full burst
	GcraClock::time_point newTat = std::max(tat.value_or(now), now) + q.incrementInterval(cost);
	return {newTat, newTat - q.getBurstTolerance()};
}

GcraResult GcraState::checkAndModify(const Quota& q, u32 cost, GcraClock::time_point now) {
	auto [newTat, allowAt] = schedule(q, cost, now);
	if (allowAt > now) {
		return GcraResult::notAllowed(now, allowAt);
	}

	tat = newTat;
	return GcraResult::admitted(now);
}

GcraResult GcraState::checkAndModify(const Quota& q, u32 cost) {
	return checkAndModify(q, cost, GcraClock::now());
}

GcraResult GcraState::wouldAllow(const Quota& q, u32 cost, GcraClock::time_point now) const {
	auto allowAt = schedule(q, cost, now).second;
	return allowAt > now ? GcraResult::notAllowed(now, allowAt) : GcraResult::admitted(now);
}

void GcraState::revert(const Quota& q, u32 cost, GcraClock::time_point now) {
	if (cost == 0) {
		throw InvalidCost();
	}

	if (cost > q.getMaxBurst()) {
		throw CostExceedsCapacity(cost, q.getMaxBurst());
	}

	if (!tat) {
		return;
	}

	if (*tat < now) {
		// everything admitted so far has already drained
		tat.reset();
		return;
	}

	// never below now, or the state would hold more than a full burst
	*tat = std::max(*tat - q.incrementInterval(cost), now);
}

void GcraState::revert(const Quota& q, u32 cost) {
	revert(q, cost, GcraClock::now());
}

u32 GcraState::remainingResources(const Quota& q, GcraClock::time_point now) const {
	if (!tat || *tat <= now) {
		return q.getMaxBurst();
	}

	auto interval = q.getEmissionInterval().count();
	auto ahead = std::chrono::duration_cast<Quota::Period>(*tat - now).count();
	// ceil, a unit that's only partially replenished isn't available yet
	auto consumed = (ahead + interval - 1) / interval;

	return consumed >= q.getMaxBurst() ? 0 : q.getMaxBurst() - static_cast<u32>(consumed);
}

std::optional<GcraClock::time_point> GcraState::getTat() const {
	return tat;
}

bool GcraState::isFresh() const {
	return !tat.has_value();
}

void GcraState::reset() {
	tat.reset();
}
