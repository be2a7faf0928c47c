// File: CombatRepositories.cpp
// Description: Pool filter matching shared by every LocationPoolRepository.
#include "CombatRepositories.hpp"
#include "CombatErrors.hpp"

PoolFilterType parsePoolFilterType(const std::string& s) {
	if (s == "universal") return PoolFilterType::Universal;
	if (s == "location_type") return PoolFilterType::LocationType;
	if (s == "state") return PoolFilterType::State;
	if (s == "country") return PoolFilterType::Country;
	if (s == "location") return PoolFilterType::LocationId;
	throw ValidationError("Unknown pool filter type: " + s);
}

bool poolFilterMatches(const PoolFilter& filter, const Location& location) {
	switch (filter.type) {
	case PoolFilterType::Universal:    return true;
	case PoolFilterType::LocationType: return !location.locationType.empty() && filter.value == location.locationType;
	case PoolFilterType::State:        return !location.stateCode.empty() && filter.value == location.stateCode;
	case PoolFilterType::Country:      return !location.countryCode.empty() && filter.value == location.countryCode;
	case PoolFilterType::LocationId:   return filter.value == location.id;
	}
	return false;
}

bool poolApplies(const PoolFilter& filter, int poolLevel, const Location& location, int combatLevel) {
	return poolLevel == combatLevel && poolFilterMatches(filter, location);
}
