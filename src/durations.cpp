#include "durations.hpp"

#include <array>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <utility>

#include <explints.hpp>

namespace {

struct Unit {
	std::string_view suffix;
	i64 nanos;
};

// largest first, formatDuration depends on it
constexpr std::array<Unit, 6> units{{
	{"h", 3600'000'000'000},
	{"m", 60'000'000'000},
	{"s", 1'000'000'000},
	{"ms", 1'000'000},
	{"us", 1'000},
	{"ns", 1}
}};

}

std::chrono::nanoseconds parseDuration(std::string_view s) {
	if (s.size() == 0) {
		throw std::invalid_argument("Empty duration");
	}

	i64 n;
	auto res = std::from_chars(s.data(), s.data() + s.size(), n);

	if (res.ec == std::errc::result_out_of_range) {
		throw std::out_of_range("Duration too big: " + std::string(s));
	}

	if (res.ec == std::errc::invalid_argument || res.ptr == s.data() + s.size()) { // no number, or no unit
		throw std::invalid_argument("Improperly formatted duration: " + std::string(s));
	}

	std::string_view suffix(res.ptr, s.data() + s.size() - res.ptr);
	for (const auto& u : units) {
		if (u.suffix != suffix) {
			continue;
		}

		if (n > std::numeric_limits<i64>::max() / u.nanos || n < std::numeric_limits<i64>::min() / u.nanos) {
			throw std::out_of_range("Duration too big: " + std::string(s));
		}

		return std::chrono::nanoseconds(n * u.nanos);
	}

	throw std::invalid_argument("Unknown duration unit: " + std::string(s));
}

std::string formatDuration(std::chrono::nanoseconds d) {
	i64 n = d.count();
	if (n == 0) {
		return "0ns";
	}

	for (const auto& u : units) {
		if (n % u.nanos == 0) {
			return std::to_string(n / u.nanos) + std::string(u.suffix);
		}
	}

	// unreachable, the ns unit divides everything
	return std::to_string(n) + "ns";
}
