// File: CombatJson.hpp
// Description: JSON encodings of everything the combat server sends to a client.
#pragma once

#include "CombatErrors.hpp"
#include "CombatService.hpp"
#include <nlohmann/json_fwd.hpp>

void to_json(nlohmann::json& j, const WeaponBandConfig& bands);
void to_json(nlohmann::json& j, const EnemySnapshot& enemy);
void to_json(nlohmann::json& j, const PlayerStatSnapshot& player);
void to_json(nlohmann::json& j, const MaterialReward& material);
void to_json(nlohmann::json& j, const ItemReward& item);
void to_json(nlohmann::json& j, const CombatHistoryRecord& history);
void to_json(nlohmann::json& j, const LevelProgress& progress);
void to_json(nlohmann::json& j, const RewardBundle& bundle);
void to_json(nlohmann::json& j, const CombatLogEntry& entry);
void to_json(nlohmann::json& j, const SessionSummary& summary);
void to_json(nlohmann::json& j, const TurnResult& result);

// {"code", "message"} plus "retrySafe" for dependency failures.
nlohmann::json errorPayload(const CombatError& error);

long long toEpochMillis(std::chrono::system_clock::time_point tp);
