#include "GcraErrors.hpp"

#include <utility>

InvalidCost::InvalidCost()
: std::invalid_argument("cost must be at least 1") { }

CostExceedsCapacity::CostExceedsCapacity(u32 cost, u32 maxBurst)
: std::invalid_argument("cost of the increment (" + std::to_string(cost)
	+ ") exceeds the quota capacity (" + std::to_string(maxBurst) + ") and will never succeed"),
  cost(cost),
  maxBurst(maxBurst) { }

u32 CostExceedsCapacity::getCost() const noexcept {
	return cost;
}

u32 CostExceedsCapacity::getMaxBurst() const noexcept {
	return maxBurst;
}

QuotaConfigError::QuotaConfigError(std::string entry, const std::string& reason)
: std::runtime_error("Bad quota config entry '" + entry + "': " + reason),
  entry(std::move(entry)) { }

const std::string& QuotaConfigError::getEntry() const noexcept {
	return entry;
}
