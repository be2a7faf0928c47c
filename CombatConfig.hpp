// File: CombatConfig.hpp
// Description: Tunables for the combat core and the server around it.
// Compiled defaults, optionally overridden from a JSON file.
#pragma once

#include "CombatTypes.hpp"
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

struct RarityDefinition {
	std::string rarity;
	double baseDropRate = 0.0;
};

// Backoff doubles per attempt; this keeps the longest wait finite.
static const int MAX_SETTLEMENT_RETRY_ATTEMPTS = 10;

struct CombatConfig {
	// --- Session ---
	int sessionTtlSeconds = SESSION_TTL_SECONDS;
	int combatLevelMax = COMBAT_LEVEL_MAX;
	int sweepIntervalSeconds = 30;

	// --- Damage ---
	double minDamage = 0.0;
	double critBonusMax = 0.4;     // crit multiplier is 1.6 + [0, critBonusMax)
	double accuracyScaleMax = 0.4; // accuracy 1.0 divides injure/miss widths by 1.4

	// Used when the player has no weapon equipped.
	WeaponBandConfig defaultWeaponBands{ 10.0, 50.0, 80.0, 170.0, 50.0 };
	// The dial the enemy "taps" when its zones are rolled.
	WeaponBandConfig enemyWeaponBands{ 10.0, 50.0, 80.0, 170.0, 50.0 };

	// --- Loot ---
	int lootDropMin = 1;
	int lootDropMax = 3;
	int goldPerLevel = 10;
	int xpPerLevel = 20;
	double rarityLevelScale = 0.05;
	std::vector<RarityDefinition> rarities{
		{ "common", 60.0 }, { "uncommon", 25.0 }, { "rare", 10.0 }, { "epic", 4.0 }, { "legendary", 1.0 }
	};

	// --- Settlement ---
	int settlementRetryAttempts = 3;
	int settlementRetryBackoffMs = 50;
	bool autoSettleOnTerminal = true;

	// --- Server ---
	std::string listenAddress = "0.0.0.0";
	unsigned short port = 8080;
	std::string databaseUrl;
	int workerThreads = 4;
};

// Throws ValidationError on malformed or out-of-range values.
CombatConfig combatConfigFromJson(const nlohmann::json& j);
CombatConfig loadCombatConfig(const std::string& path);
void validateCombatConfig(const CombatConfig& config);
