// File: LootProvider.hpp
// Description: Picks the enemy for a new combat and the loot it drops.
#pragma once

#include "CombatConfig.hpp"
#include "CombatRepositories.hpp"
#include "WeightedSelector.hpp"
#include <memory>
#include <string>

// stats = base + offset + increment * (tier - 1); hp never drops below 1.
EnemySnapshot hydrateEnemy(const EnemyType& type, const EnemyTier& tier, const std::string& styleId);

class LootProvider
{
public:
	LootProvider(std::shared_ptr<LocationPoolRepository> locationPools,
		std::shared_ptr<EnemyRepository> enemies,
		std::shared_ptr<MaterialRepository> materials,
		std::shared_ptr<ItemRepository> items,
		CombatConfig config);

	/**
	 * @brief Weighted pick of one enemy across every pool that applies to the
	 * location at this level, hydrated with tier scaling.
	 * @throws NotFoundError when the location, pools, enemy type or tier is missing.
	 */
	EnemySnapshot selectEnemy(const std::string& locationId, int combatLevel, const RollFn& roll);

	/**
	 * @brief Rolls lootDropMin..lootDropMax distinct entries from the location's
	 * loot pools (weights scaled by the pool's tier multipliers), hydrates them
	 * in one batch per kind and stamps every drop with the enemy's style.
	 * Gold and experience scale with level and the enemy tier's multipliers.
	 */
	VictoryRewards selectLoot(const std::string& locationId, int combatLevel, const EnemySnapshot& enemy, const RollFn& roll);

	std::string selectRarity(int combatLevel, const RollFn& roll) const;

private:
	Location requireLocation(const std::string& locationId);

	std::shared_ptr<LocationPoolRepository> locationPools_;
	std::shared_ptr<EnemyRepository> enemies_;
	std::shared_ptr<MaterialRepository> materials_;
	std::shared_ptr<ItemRepository> items_;
	CombatConfig config_;
};
