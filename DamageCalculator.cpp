// File: DamageCalculator.cpp
// Description: Attack and defense damage math.
#include "DamageCalculator.hpp"
#include "CombatErrors.hpp"
#include <algorithm>
#include <cmath>

// Absorbs representation error so 100 * (1 - 0.8) floors to 20, not 19.
static const double FLOOR_EPSILON = 1e-9;

double zoneMultiplier(HitZone zone, double critBonus) {
	switch (zone) {
	case HitZone::Injure: return ZONE_MULT_INJURE;
	case HitZone::Miss:   return ZONE_MULT_MISS;
	case HitZone::Graze:  return ZONE_MULT_GRAZE;
	case HitZone::Normal: return ZONE_MULT_NORMAL;
	case HitZone::Crit:   return ZONE_MULT_CRIT + critBonus;
	}
	throw ValidationError("Unknown hit zone");
}

AttackOutcome calculateAttack(HitZone zone, int attackerAtk, int defenderDef, double critBonus, double minDamage) {
	if (attackerAtk < 0 || defenderDef < 0) {
		throw ValidationError("Attack and defense must not be negative");
	}
	if (!std::isfinite(critBonus) || critBonus < 0.0) {
		throw ValidationError("Crit bonus must not be negative");
	}

	AttackOutcome out;
	out.zone = zone;
	out.multiplier = zoneMultiplier(zone, critBonus);

	if (zone == HitZone::Injure) {
		double backlash = std::max(minDamage, attackerAtk * std::fabs(ZONE_MULT_INJURE));
		out.damageToDefender = 0;
		out.selfDamage = 2 * static_cast<int>(std::floor(backlash + FLOOR_EPSILON));
		return out;
	}

	double raw = std::max(minDamage, attackerAtk * out.multiplier - defenderDef);
	out.damageToDefender = static_cast<int>(std::floor(raw + FLOOR_EPSILON));
	return out;
}

AttackOutcome calculateAttack(const std::string& zoneLabel, int attackerAtk, int defenderDef, double critBonus, double minDamage) {
	return calculateAttack(parseZone(zoneLabel), attackerAtk, defenderDef, critBonus, minDamage);
}

double blockedFraction(HitZone defenseZone) {
	const double span = ZONE_MULT_CRIT - ZONE_MULT_INJURE;
	const double effectiveness = (zoneMultiplier(defenseZone) - ZONE_MULT_INJURE) / span;
	return std::clamp(effectiveness, 0.0, 1.0) * MAX_BLOCK_FRACTION;
}

DefenseOutcome applyDefense(int incomingDamage, HitZone defenseZone, double minDamage) {
	if (incomingDamage < 0) {
		throw ValidationError("Incoming damage must not be negative");
	}

	DefenseOutcome out;
	out.zone = defenseZone;
	out.blockedFraction = blockedFraction(defenseZone);

	double remaining = std::max(minDamage, incomingDamage * (1.0 - out.blockedFraction));
	out.finalDamage = static_cast<int>(std::floor(remaining + FLOOR_EPSILON));
	out.damageBlocked = std::max(0, incomingDamage - out.finalDamage);
	return out;
}
