// File: Rewards.hpp
// Description: The RewardBundle handed out when a combat session ends, plus
// the records settlement reports back (created items, level, history).
#pragma once

#include <string>
#include <vector>
#include <optional>

enum class CombatOutcome : int {
	Victory = 1,
	Defeat = 2
};

const char* outcomeName(CombatOutcome outcome);

struct MaterialReward {
	std::string materialId;
	std::string name;
	std::string styleId = "normal";
	int quantity = 1;
};

struct ItemReward {
	std::string itemTypeId;
	std::string name;
	std::string category;
	std::string rarity = "common";
	std::string styleId = "normal";
	std::string itemInstanceId; // filled once the item row exists
};

struct CombatHistoryRecord {
	std::string locationId;
	int totalAttempts = 0;
	int victories = 0;
	int defeats = 0;
	int currentStreak = 0;
	int longestStreak = 0;
};

struct LevelProgress {
	int experienceAdded = 0;
	bool leveledUp = false;
	int newLevel = 1;
};

// Only present on a victory.
struct VictoryRewards {
	int gold = 0;
	std::vector<MaterialReward> materials;
	std::vector<ItemReward> items;
	int experience = 0;
};

/**
 * @struct RewardBundle
 * @brief Tagged union over the two outcomes. A defeat carries no victory
 * payload at all, so "gold=0, no materials, no items" holds by construction.
 * combatHistory and progression are filled in by settlement.
 */
struct RewardBundle {
	CombatOutcome outcome = CombatOutcome::Defeat;
	std::optional<VictoryRewards> victory;
	std::optional<CombatHistoryRecord> combatHistory;
	std::optional<LevelProgress> progression;

	// Throws ValidationError on negative amounts or empty ids.
	static RewardBundle forVictory(VictoryRewards rewards);
	static RewardBundle forDefeat();

	int gold() const { return victory ? victory->gold : 0; }
	int experience() const { return victory ? victory->experience : 0; }
	const std::vector<MaterialReward>& materials() const;
	const std::vector<ItemReward>& items() const;
};
