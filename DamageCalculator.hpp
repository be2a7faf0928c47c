// File: DamageCalculator.hpp
// Description: Zone multipliers, attack damage (including the injure
// self-damage rule) and the one blocking formula both sides defend with.
#pragma once

#include "CombatTypes.hpp"

static const double ZONE_MULT_INJURE = -0.5;
static const double ZONE_MULT_MISS = 0.0;
static const double ZONE_MULT_GRAZE = 0.6;
static const double ZONE_MULT_NORMAL = 1.0;
static const double ZONE_MULT_CRIT = 1.6;
static const double MIN_DAMAGE = 0.0;
// Fraction of incoming damage a crit-zone block stops. Injure blocks nothing.
static const double MAX_BLOCK_FRACTION = 0.8;

// critBonus only applies to the crit zone.
double zoneMultiplier(HitZone zone, double critBonus = 0.0);

struct AttackOutcome {
	HitZone zone = HitZone::Normal;
	double multiplier = 0.0;
	int damageToDefender = 0;
	int selfDamage = 0;
};

/**
 * @brief damage = max(minDamage, atk * multiplier - def), floored.
 * The injure zone is the exception: the defender takes nothing and the
 * attacker takes double, 2 * max(minDamage, atk * |injure multiplier|).
 * @throws ValidationError on negative stats or a negative crit bonus.
 */
AttackOutcome calculateAttack(HitZone zone, int attackerAtk, int defenderDef,
	double critBonus = 0.0, double minDamage = MIN_DAMAGE);

// Label form for callers holding wire data; rejects unknown labels.
AttackOutcome calculateAttack(const std::string& zoneLabel, int attackerAtk, int defenderDef,
	double critBonus = 0.0, double minDamage = MIN_DAMAGE);

// The zone table read as blocking effectiveness, normalised so injure
// blocks 0 and crit blocks MAX_BLOCK_FRACTION.
double blockedFraction(HitZone defenseZone);

struct DefenseOutcome {
	HitZone zone = HitZone::Normal;
	double blockedFraction = 0.0;
	int damageBlocked = 0;
	int finalDamage = 0;
};

/**
 * @brief finalDamage = max(minDamage, incoming * (1 - blockedFraction)).
 * Shared by the player blocking an enemy swing and the enemy blocking the
 * player's. There is no per-side variant.
 */
DefenseOutcome applyDefense(int incomingDamage, HitZone defenseZone, double minDamage = MIN_DAMAGE);
