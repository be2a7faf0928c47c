// File: CombatJson.cpp
// Description: nlohmann::json serializers for the combat wire protocol.
#include "CombatJson.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

long long toEpochMillis(std::chrono::system_clock::time_point tp) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

void to_json(json& j, const WeaponBandConfig& bands) {
	j = json{
		{"injure", bands.degInjure},
		{"miss", bands.degMiss},
		{"graze", bands.degGraze},
		{"normal", bands.degNormal},
		{"crit", bands.degCrit}
	};
}

void to_json(json& j, const EnemySnapshot& enemy) {
	j = json{
		{"enemyTypeId", enemy.enemyTypeId},
		{"name", enemy.name},
		{"tier", enemy.tier},
		{"atk", enemy.atk},
		{"def", enemy.def},
		{"hp", enemy.hp},
		{"styleId", enemy.styleId}
	};
}

void to_json(json& j, const PlayerStatSnapshot& player) {
	j = json{
		{"atk", player.atk},
		{"def", player.def},
		{"hp", player.hp},
		{"accuracy", player.accuracy}
	};
}

void to_json(json& j, const MaterialReward& material) {
	j = json{
		{"materialId", material.materialId},
		{"name", material.name},
		{"styleId", material.styleId},
		{"quantity", material.quantity}
	};
}

void to_json(json& j, const ItemReward& item) {
	j = json{
		{"itemTypeId", item.itemTypeId},
		{"name", item.name},
		{"category", item.category},
		{"rarity", item.rarity},
		{"styleId", item.styleId}
	};
	if (!item.itemInstanceId.empty()) j["itemInstanceId"] = item.itemInstanceId;
}

void to_json(json& j, const CombatHistoryRecord& history) {
	j = json{
		{"locationId", history.locationId},
		{"totalAttempts", history.totalAttempts},
		{"victories", history.victories},
		{"defeats", history.defeats},
		{"currentStreak", history.currentStreak},
		{"longestStreak", history.longestStreak}
	};
}

void to_json(json& j, const LevelProgress& progress) {
	j = json{
		{"experienceAdded", progress.experienceAdded},
		{"leveledUp", progress.leveledUp},
		{"newLevel", progress.newLevel}
	};
}

void to_json(json& j, const RewardBundle& bundle) {
	j = json{
		{"outcome", outcomeName(bundle.outcome)},
		{"currencies", {{"gold", bundle.gold()}}},
		{"materials", bundle.materials()},
		{"items", bundle.items()},
		{"experience", bundle.experience()}
	};
	j["combatHistory"] = bundle.combatHistory ? json(*bundle.combatHistory) : json(nullptr);
	j["progression"] = bundle.progression ? json(*bundle.progression) : json(nullptr);
}

void to_json(json& j, const CombatLogEntry& entry) {
	j = json{
		{"turn", entry.turn},
		{"action", entry.action == CombatAction::Attack ? "attack" : "defend"},
		{"tapDegrees", entry.tapDegrees},
		{"playerZone", zoneName(entry.playerZone)},
		{"critBonus", entry.critBonus},
		{"damageToEnemy", entry.damageToEnemy},
		{"damageToPlayer", entry.damageToPlayer},
		{"damageBlocked", entry.damageBlocked},
		{"playerSelfDamage", entry.playerSelfDamage},
		{"enemySelfDamage", entry.enemySelfDamage},
		{"playerHp", entry.playerHp},
		{"enemyHp", entry.enemyHp},
		{"timestamp", toEpochMillis(entry.timestamp)}
	};
	j["enemyDefenseZone"] = entry.enemyDefenseZone ? json(zoneName(*entry.enemyDefenseZone)) : json(nullptr);
	j["enemyAttackZone"] = entry.enemyAttackZone ? json(zoneName(*entry.enemyAttackZone)) : json(nullptr);
}

void to_json(json& j, const SessionSummary& summary) {
	j = json{
		{"sessionId", summary.sessionId},
		{"locationId", summary.locationId},
		{"combatLevel", summary.combatLevel},
		{"enemy", summary.enemy},
		{"playerHp", summary.currentPlayerHp},
		{"playerMaxHp", summary.player.hp},
		{"enemyHp", summary.currentEnemyHp},
		{"enemyMaxHp", summary.enemy.hp},
		{"turnNumber", summary.turnNumber},
		{"status", statusName(summary.status)},
		{"weaponBands", summary.adjustedBands},
		{"expiresAt", toEpochMillis(summary.expiresAt)}
	};
}

void to_json(json& j, const TurnResult& result) {
	j = json{
		{"sessionId", result.sessionId},
		{"turnNumber", result.entry.turn},
		{"zoneMultiplier", result.zoneMultiplier},
		{"status", statusName(result.status)},
		{"turn", result.entry}
	};
	if (result.rewards) j["rewards"] = *result.rewards;
	if (result.settlementError) j["settlementError"] = *result.settlementError;
}

json errorPayload(const CombatError& error) {
	json j = {
		{"code", error.code()},
		{"message", error.what()}
	};
	if (auto dep = dynamic_cast<const ExternalDependencyError*>(&error)) {
		j["retrySafe"] = true;
		j["transient"] = dep->transient();
	}
	return j;
}
