#include "QuotaTable.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include <GcraErrors.hpp>
#include <durations.hpp>

static Quota parseEntry(const std::string& name, const nlohmann::json& j) {
	if (!j.is_object()) {
		throw QuotaConfigError(name, "expected an object, got " + j.dump());
	}

	const auto burst = j.find("burst");
	if (burst == j.end() || !burst->is_number_integer()) {
		throw QuotaConfigError(name, "missing integer 'burst'");
	}

	constexpr u64 maxBurst = std::numeric_limits<u32>::max();
	bool inRange = burst->is_number_unsigned()
		? burst->get<u64>() <= maxBurst
		: burst->get<i64>() >= 0 && static_cast<u64>(burst->get<i64>()) <= maxBurst;

	if (!inRange) {
		throw QuotaConfigError(name, "'burst' out of range: " + burst->dump());
	}

	const auto period = j.find("period");
	const auto periodMs = j.find("period_ms");
	Quota::Period p{};

	if (period != j.end() && periodMs != j.end()) {
		throw QuotaConfigError(name, "both 'period' and 'period_ms' given");
	} else if (period != j.end()) {
		if (!period->is_string()) {
			throw QuotaConfigError(name, "'period' must be a duration string like \"1500ms\"");
		}

		try {
			p = parseDuration(period->get<std::string>());
		} catch (const std::logic_error& e) {
			// invalid_argument and out_of_range
			throw QuotaConfigError(name, e.what());
		}
	} else if (periodMs != j.end()) {
		if (!periodMs->is_number_integer()) {
			throw QuotaConfigError(name, "'period_ms' must be an integer");
		}

		if (periodMs->is_number_unsigned() && periodMs->get<u64>() > static_cast<u64>(std::numeric_limits<i64>::max())) {
			throw QuotaConfigError(name, "'period_ms' out of range: " + periodMs->dump());
		}

		i64 ms = periodMs->get<i64>();
		if (ms > std::numeric_limits<i64>::max() / 1'000'000 || ms < std::numeric_limits<i64>::min() / 1'000'000) {
			throw QuotaConfigError(name, "'period_ms' out of range: " + periodMs->dump());
		}

		p = std::chrono::milliseconds(ms);
	} else {
		throw QuotaConfigError(name, "missing 'period' or 'period_ms'");
	}

	for (const auto& kv : j.items()) {
		if (kv.key() != "burst" && kv.key() != "period" && kv.key() != "period_ms") {
			std::cerr << "[QuotaTable] Ignoring unknown key '" << kv.key() << "' in quota '" << name << "'" << std::endl;
		}
	}

	try {
		return Quota(burst->get<u32>(), p);
	} catch (const InvalidQuota& e) {
		throw QuotaConfigError(name, e.what());
	}
}

QuotaTable QuotaTable::fromJson(const nlohmann::json& j) {
	if (!j.is_object()) {
		throw QuotaConfigError("", "quota config must be a json object");
	}

	QuotaTable t;
	for (const auto& kv : j.items()) {
		t.quotas.insert_or_assign(kv.key(), parseEntry(kv.key(), kv.value()));
	}

	return t;
}

QuotaTable QuotaTable::fromString(std::string_view s) {
	nlohmann::json j;
	try {
		j = nlohmann::json::parse(s);
	} catch (const nlohmann::json::exception& e) {
		throw QuotaConfigError("", e.what());
	}

	return fromJson(j);
}

QuotaTable QuotaTable::fromFile(const std::string& path) {
	std::ifstream file(path);
	if (!file) {
		throw std::runtime_error("Couldn't open quota config (" + path + ")");
	}

	nlohmann::json j;
	try {
		j = nlohmann::json::parse(file);
	} catch (const nlohmann::json::exception& e) {
		std::cerr << "Exception when parsing quota config! (" << path << ")" << std::endl;
		throw QuotaConfigError("", e.what());
	}

	QuotaTable t(fromJson(j));
	std::cout << "[QuotaTable] Loaded " << t.size() << " quota(s) from " << path << std::endl;
	return t;
}

nlohmann::json QuotaTable::toJson() const {
	nlohmann::json j = nlohmann::json::object();
	for (const auto& kv : quotas) {
		j[kv.first] = kv.second;
	}

	return j;
}

bool QuotaTable::has(std::string_view name) const {
	return quotas.find(name) != quotas.end();
}

const Quota& QuotaTable::get(std::string_view name) const {
	auto search = quotas.find(name);
	if (search == quotas.end()) {
		throw std::out_of_range("No quota named '" + std::string(name) + "'");
	}

	return search->second;
}

std::optional<Quota> QuotaTable::find(std::string_view name) const {
	auto search = quotas.find(name);
	if (search != quotas.end()) {
		return search->second;
	}

	return std::nullopt;
}

void QuotaTable::set(std::string_view name, Quota q) {
	quotas.insert_or_assign(std::string(name), std::move(q));
}

bool QuotaTable::erase(std::string_view name) {
	auto search = quotas.find(name);
	if (search != quotas.end()) {
		quotas.erase(search);
		return true;
	}

	return false;
}

sz_t QuotaTable::size() const {
	return quotas.size();
}

bool QuotaTable::isEmpty() const {
	return quotas.empty();
}

QuotaTable::const_iterator QuotaTable::begin() const {
	return quotas.begin();
}

QuotaTable::const_iterator QuotaTable::end() const {
	return quotas.end();
}

namespace nlohmann {

Quota adl_serializer<Quota>::from_json(const json& j) {
	return parseEntry("", j);
}

void adl_serializer<Quota>::to_json(json& j, const Quota& q) {
	j = {
		{"burst", q.getMaxBurst()},
		{"period", formatDuration(q.getPeriod())}
	};
}

}
