#include "GcraBucket.hpp"

#include <stdexcept>
#include <utility>

GcraBucket::GcraBucket(Quota quota, TimeSource clock)
: quota(std::move(quota)),
  clock(std::move(clock)) {
	if (!this->clock) {
		throw std::invalid_argument("GcraBucket needs a time source");
	}
}

void GcraBucket::setQuota(Quota nquota) {
	quota = std::move(nquota);
}

bool GcraBucket::canSpend(u32 count) const {
	return state.wouldAllow(quota, count, clock()).isAllowed();
}

GcraResult GcraBucket::spend(u32 count) {
	return state.checkAndModify(quota, count, clock());
}

void GcraBucket::refund(u32 count) {
	state.revert(quota, count, clock());
}

void GcraBucket::reset() {
	state.reset();
}

const Quota& GcraBucket::getQuota() const {
	return quota;
}

const GcraState& GcraBucket::getState() const {
	return state;
}

u32 GcraBucket::getRemaining() const {
	return state.remainingResources(quota, clock());
}
