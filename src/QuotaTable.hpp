#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include <explints.hpp>
#include <Quota.hpp>

/* Named quotas, loaded from a json object such as:
 *   { "login": { "burst": 5, "period": "1m" }, "api": { "burst": 20, "period_ms": 1000 } }
 * Malformed entries throw QuotaConfigError. */
class QuotaTable {
	std::map<std::string, Quota, std::less<>> quotas;

public:
	using const_iterator = std::map<std::string, Quota, std::less<>>::const_iterator;

	QuotaTable() = default;

	static QuotaTable fromJson(const nlohmann::json&);
	static QuotaTable fromString(std::string_view);
	static QuotaTable fromFile(const std::string& path);

	nlohmann::json toJson() const;

	bool has(std::string_view name) const;
	// throws std::out_of_range
	const Quota& get(std::string_view name) const;
	std::optional<Quota> find(std::string_view name) const;
	void set(std::string_view name, Quota);
	bool erase(std::string_view name);

	sz_t size() const;
	bool isEmpty() const;

	const_iterator begin() const;
	const_iterator end() const;
};

// lets json.get<Quota>() work even though Quota has no default constructor.
// from_json throws QuotaConfigError
namespace nlohmann {

template<>
struct adl_serializer<Quota> {
	static Quota from_json(const json&);
	static void to_json(json&, const Quota&);
};

}
