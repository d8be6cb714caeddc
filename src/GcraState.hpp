#pragma once

#include <optional>
#include <utility>

#include <explints.hpp>
#include <GcraClock.hpp>
#include <Quota.hpp>

/* Outcome of a decision. A rejection is an ordinary result, not an error: it
 * says when the same cost would be admitted, assuming nothing else gets
 * admitted in between. */
class GcraResult {
	GcraClock::duration retryAfter;
	GcraClock::time_point allowAt;
	bool allowed;

	GcraResult(bool allowed, GcraClock::duration retryAfter, GcraClock::time_point allowAt);

public:
	static GcraResult admitted(GcraClock::time_point now);
	static GcraResult notAllowed(GcraClock::time_point now, GcraClock::time_point allowAt);

	bool isAllowed() const noexcept;
	explicit operator bool() const noexcept;

	// zero when allowed, positive otherwise
	GcraClock::duration getRetryAfter() const noexcept;
	// the earliest instant the request is allowed at
	GcraClock::time_point getAllowAt() const noexcept;
};

/* GCRA virtual scheduler state for one rate limited key, a single theoretical
 * arrival time (TAT). An empty TAT means the state was never used.
 *
 * The quota is passed on every call instead of being stored, so the same
 * state may be checked against different quotas. Switching quotas is allowed
 * and takes effect immediately, which can make admission jump.
 *
 * Not thread safe: concurrent calls on the same state need external locking.
 *
 * Cost errors (0, or more than the quota's burst) throw InvalidCost and
 * CostExceedsCapacity before the state is looked at. */
class GcraState {
	std::optional<GcraClock::time_point> tat;

public:
	GcraState() = default;
	// restores a TAT the caller persisted on its own. It must stay at least a
	// full period below GcraClock::time_point::max(), or later decisions
	// overflow.
	explicit GcraState(std::optional<GcraClock::time_point> tat);

	// admits and advances the TAT, or leaves the state untouched and
	// returns a rejection
	GcraResult checkAndModify(const Quota&, u32 cost, GcraClock::time_point now);
	// shorthand for callers without an injected clock, reads GcraClock::now().
	// Deterministic callers pass now explicitly or use GcraBucket's TimeSource.
	GcraResult checkAndModify(const Quota&, u32 cost = 1);

	// the decision checkAndModify would take, without modifying anything
	GcraResult wouldAllow(const Quota&, u32 cost, GcraClock::time_point now) const;

	/* gives back cost units admitted earlier. A state whose TAT is already in
	 * the past has nothing left to give back and becomes fresh. Cost errors
	 * throw the same way they do in checkAndModify. */
	void revert(const Quota&, u32 cost, GcraClock::time_point now);
	// reads GcraClock::now()
	void revert(const Quota&, u32 cost = 1);

	// units that could be admitted at now, partially consumed units count
	// as consumed
	u32 remainingResources(const Quota&, GcraClock::time_point now) const;

	std::optional<GcraClock::time_point> getTat() const;
	bool isFresh() const;
	void reset();

	bool operator==(const GcraState&) const = default;

private:
	// validates cost, returns the candidate TAT and the instant it's allowed at
	std::pair<GcraClock::time_point, GcraClock::time_point> schedule(const Quota&, u32 cost, GcraClock::time_point now) const;
};
