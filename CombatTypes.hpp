// File: CombatTypes.hpp
// Description: Defines the core combat data structures and constants.
// This file is the "single source of truth" for what a combat session looks like.
#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include "Rewards.hpp"

// --- Global Combat Constants ---
static const int SESSION_TTL_SECONDS = 15 * 60; // 15 minutes, refreshed on each mutation
static const int COMBAT_LEVEL_MAX = 100;
static const double DIAL_DEGREES = 360.0;

/**
* @enum HitZone
* @brief The five dial bands, in the order they are laid out from 0 degrees.
*/
enum class HitZone : int {
	Injure = 0,
	Miss = 1,
	Graze = 2,
	Normal = 3,
	Crit = 4
};

static const HitZone ALL_ZONES[] = {
	HitZone::Injure, HitZone::Miss, HitZone::Graze, HitZone::Normal, HitZone::Crit
};

const char* zoneName(HitZone zone);
// Throws ValidationError for anything but the five lowercase labels.
HitZone parseZone(const std::string& label);

enum class CombatStatus : int {
	Ongoing = 0,
	Victory = 1,
	Defeat = 2
};

const char* statusName(CombatStatus status);

enum class CombatAction : int {
	Attack = 0,
	Defend = 1
};

// Degree allocation of a weapon dial across the five zones. Sum must be <= 360.
struct WeaponBandConfig {
	double degInjure = 0.0;
	double degMiss = 0.0;
	double degGraze = 0.0;
	double degNormal = 0.0;
	double degCrit = 0.0;

	double width(HitZone zone) const;
	double total() const { return degInjure + degMiss + degGraze + degNormal + degCrit; }
};

// Equipped stats captured at combat start. Later equipment changes never
// reach an in-flight session.
struct PlayerStatSnapshot {
	int atk = 0;
	int def = 0;
	int hp = 0;
	double accuracy = 0.0; // [0,1]
};

struct EnemySnapshot {
	std::string enemyTypeId;
	std::string name;
	int tier = 1;
	int atk = 0;
	int def = 0;
	int hp = 0;
	double atkAccuracy = 0.0; // [0,1]
	double defAccuracy = 0.0; // [0,1]
	std::string styleId = "normal";
	double goldMultiplier = 1.0;
	double xpMultiplier = 1.0;
};

struct CombatLogEntry {
	int turn = 0;
	CombatAction action = CombatAction::Attack;
	double tapDegrees = 0.0;
	HitZone playerZone = HitZone::Normal;         // attack zone or block zone
	std::optional<HitZone> enemyDefenseZone;      // absent when the player injured themself
	std::optional<HitZone> enemyAttackZone;       // absent when the enemy fell before countering
	double critBonus = 0.0;
	int damageToEnemy = 0;
	int damageToPlayer = 0;
	int damageBlocked = 0;
	int playerSelfDamage = 0; // injure zone, taken by whoever swung
	int enemySelfDamage = 0;
	int playerHp = 0;
	int enemyHp = 0;
	std::chrono::system_clock::time_point timestamp;
};

// Bits recorded in SettlementProgress::completedSteps.
enum class SettlementStep : unsigned {
	Materials = 1u << 0,
	Items = 1u << 1,
	Currency = 1u << 2,
	Experience = 1u << 3,
	History = 1u << 4
};

const char* stepName(SettlementStep step);

struct SettlementProgress {
	bool claimed = false;       // a caller is inside settlement right now
	unsigned completedSteps = 0;
	int attempts = 0;
	std::size_t materialsApplied = 0;        // prefix of the bundle's materials already stacked
	std::vector<std::string> createdItemIds; // parallel to the bundle's items

	bool has(SettlementStep step) const { return (completedSteps & static_cast<unsigned>(step)) != 0; }
	void mark(SettlementStep step) { completedSteps |= static_cast<unsigned>(step); }
};

/**
 * @struct CombatSession
 * @brief The complete state of one combat. Owned by the session store for
 * its whole lifetime; the service only ever works on copies.
 */
struct CombatSession {
	std::string sessionId;
	std::string userId;
	std::string locationId;
	int combatLevel = 1;

	EnemySnapshot enemy;
	PlayerStatSnapshot player;
	WeaponBandConfig weaponBands; // raw, rescaled by accuracy on each resolve

	int currentPlayerHp = 0;
	int currentEnemyHp = 0;
	int turnNumber = 0;
	CombatStatus status = CombatStatus::Ongoing;
	std::vector<CombatLogEntry> combatLog;

	std::chrono::system_clock::time_point createdAt;
	std::chrono::system_clock::time_point expiresAt;

	// Built once at the terminal transition, reused by every settlement retry.
	std::optional<RewardBundle> pendingRewards;
	SettlementProgress settlement;

	bool isTerminal() const { return status != CombatStatus::Ongoing; }
};
