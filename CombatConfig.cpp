// File: CombatConfig.cpp
// Description: Loads CombatConfig overrides from JSON.
#include "CombatConfig.hpp"
#include "CombatErrors.hpp"
#include "ZoneResolver.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace {

WeaponBandConfig bandsFromJson(const nlohmann::json& j) {
	WeaponBandConfig bands;
	bands.degInjure = j.at("deg_injure").get<double>();
	bands.degMiss = j.at("deg_miss").get<double>();
	bands.degGraze = j.at("deg_graze").get<double>();
	bands.degNormal = j.at("deg_normal").get<double>();
	bands.degCrit = j.at("deg_crit").get<double>();
	return bands;
}

template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& out) {
	auto it = j.find(key);
	if (it != j.end() && !it->is_null()) {
		out = it->get<T>();
	}
}

void validateConfigBands(const WeaponBandConfig& bands, const char* label) {
	try {
		validateBands(bands);
	}
	catch (const ValidationError& e) {
		throw ValidationError(std::string(label) + ": " + e.what());
	}
}

} // namespace

void validateCombatConfig(const CombatConfig& config) {
	if (config.sessionTtlSeconds <= 0) throw ValidationError("session_ttl_seconds must be positive");
	if (config.combatLevelMax < 1) throw ValidationError("combat_level_max must be at least 1");
	if (config.minDamage < 0.0) throw ValidationError("min_damage must not be negative");
	if (config.critBonusMax < 0.0) throw ValidationError("crit_bonus_max must not be negative");
	if (config.accuracyScaleMax < 0.0) throw ValidationError("accuracy_scale_max must not be negative");
	if (config.lootDropMin < 0 || config.lootDropMax < config.lootDropMin)
		throw ValidationError("loot_drop_min/max out of range");
	if (config.goldPerLevel < 0 || config.xpPerLevel < 0)
		throw ValidationError("gold_per_level and xp_per_level must not be negative");
	if (config.sweepIntervalSeconds < 1) throw ValidationError("sweep_interval_seconds must be at least 1");
	if (config.settlementRetryAttempts < 1 || config.settlementRetryAttempts > MAX_SETTLEMENT_RETRY_ATTEMPTS)
		throw ValidationError("settlement_retry_attempts must be within [1," + std::to_string(MAX_SETTLEMENT_RETRY_ATTEMPTS) + "]");
	if (config.settlementRetryBackoffMs < 0) throw ValidationError("settlement_retry_backoff_ms must not be negative");
	if (config.workerThreads < 1) throw ValidationError("worker_threads must be at least 1");
	for (const auto& r : config.rarities) {
		if (r.rarity.empty() || r.baseDropRate < 0.0) throw ValidationError("Invalid rarity definition");
	}
	validateConfigBands(config.defaultWeaponBands, "default_weapon_bands");
	validateConfigBands(config.enemyWeaponBands, "enemy_weapon_bands");
}

CombatConfig combatConfigFromJson(const nlohmann::json& j) {
	CombatConfig config;
	try {
		readOptional(j, "session_ttl_seconds", config.sessionTtlSeconds);
		readOptional(j, "combat_level_max", config.combatLevelMax);
		readOptional(j, "sweep_interval_seconds", config.sweepIntervalSeconds);
		readOptional(j, "min_damage", config.minDamage);
		readOptional(j, "crit_bonus_max", config.critBonusMax);
		readOptional(j, "accuracy_scale_max", config.accuracyScaleMax);
		if (j.contains("default_weapon_bands")) config.defaultWeaponBands = bandsFromJson(j.at("default_weapon_bands"));
		if (j.contains("enemy_weapon_bands")) config.enemyWeaponBands = bandsFromJson(j.at("enemy_weapon_bands"));
		readOptional(j, "loot_drop_min", config.lootDropMin);
		readOptional(j, "loot_drop_max", config.lootDropMax);
		readOptional(j, "gold_per_level", config.goldPerLevel);
		readOptional(j, "xp_per_level", config.xpPerLevel);
		readOptional(j, "rarity_level_scale", config.rarityLevelScale);
		if (j.contains("rarities")) {
			config.rarities.clear();
			for (const auto& r : j.at("rarities")) {
				config.rarities.push_back({ r.at("rarity").get<std::string>(), r.at("base_drop_rate").get<double>() });
			}
		}
		readOptional(j, "settlement_retry_attempts", config.settlementRetryAttempts);
		readOptional(j, "settlement_retry_backoff_ms", config.settlementRetryBackoffMs);
		readOptional(j, "auto_settle_on_terminal", config.autoSettleOnTerminal);
		readOptional(j, "listen_address", config.listenAddress);
		readOptional(j, "port", config.port);
		readOptional(j, "database_url", config.databaseUrl);
		readOptional(j, "worker_threads", config.workerThreads);
	}
	catch (const nlohmann::json::exception& e) {
		throw ValidationError(std::string("Malformed combat config: ") + e.what());
	}

	validateCombatConfig(config);
	return config;
}

CombatConfig loadCombatConfig(const std::string& path) {
	std::ifstream in(path);
	if (!in.is_open()) {
		throw ValidationError("Could not open combat config: " + path);
	}

	nlohmann::json j;
	try {
		in >> j;
	}
	catch (const nlohmann::json::parse_error& e) {
		throw ValidationError("Could not parse combat config " + path + ": " + e.what());
	}

	CombatConfig config = combatConfigFromJson(j);
	std::cout << "[CONFIG] Loaded combat config from " << path << std::endl;
	return config;
}
