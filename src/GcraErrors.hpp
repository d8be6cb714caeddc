#pragma once

#include <stdexcept>
#include <string>

#include <explints.hpp>

// thrown by the Quota constructor: burst of 0, non-positive period, or a
// period too short to give every unit at least a nanosecond
struct InvalidQuota : std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

// a cost of 0 consumes nothing and says nothing about capacity
struct InvalidCost : std::invalid_argument {
	InvalidCost();
};

// the cost could never be admitted, not even on a fresh state
class CostExceedsCapacity : public std::invalid_argument {
	u32 cost;
	u32 maxBurst;

public:
	CostExceedsCapacity(u32 cost, u32 maxBurst);

	u32 getCost() const noexcept;
	u32 getMaxBurst() const noexcept;
};

// malformed quota configuration, entry is the offending key
class QuotaConfigError : public std::runtime_error {
	std::string entry;

public:
	QuotaConfigError(std::string entry, const std::string& reason);

	const std::string& getEntry() const noexcept;
};
