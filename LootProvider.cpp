// File: LootProvider.cpp
// Description: Enemy selection with tier scaling, loot rolls with style inheritance.
#include "LootProvider.hpp"
#include "CombatErrors.hpp"
#include "ZoneResolver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>

EnemySnapshot hydrateEnemy(const EnemyType& type, const EnemyTier& tier, const std::string& styleId) {
	const int steps = std::max(0, tier.tier - 1);

	EnemySnapshot enemy;
	enemy.enemyTypeId = type.id;
	enemy.name = type.name;
	enemy.tier = tier.tier;
	enemy.atk = std::max(0, type.baseAtk + tier.atkOffset + tier.atkIncrement * steps);
	enemy.def = std::max(0, type.baseDef + tier.defOffset + tier.defIncrement * steps);
	enemy.hp = std::max(1, type.baseHp + tier.hpOffset + tier.hpIncrement * steps);
	enemy.atkAccuracy = type.atkAccuracy;
	enemy.defAccuracy = type.defAccuracy;
	enemy.styleId = styleId.empty() ? "normal" : styleId;
	enemy.goldMultiplier = tier.goldMultiplier;
	enemy.xpMultiplier = tier.xpMultiplier;

	validateAccuracy(enemy.atkAccuracy, "Enemy attack accuracy");
	validateAccuracy(enemy.defAccuracy, "Enemy defense accuracy");
	return enemy;
}

LootProvider::LootProvider(std::shared_ptr<LocationPoolRepository> locationPools,
	std::shared_ptr<EnemyRepository> enemies,
	std::shared_ptr<MaterialRepository> materials,
	std::shared_ptr<ItemRepository> items,
	CombatConfig config)
	: locationPools_(std::move(locationPools))
	, enemies_(std::move(enemies))
	, materials_(std::move(materials))
	, items_(std::move(items))
	, config_(std::move(config))
{
}

Location LootProvider::requireLocation(const std::string& locationId) {
	auto location = locationPools_->findLocation(locationId);
	if (!location) {
		throw NotFoundError("Location", locationId);
	}
	return *location;
}

EnemySnapshot LootProvider::selectEnemy(const std::string& locationId, int combatLevel, const RollFn& roll) {
	requireLocation(locationId);

	std::vector<WeightedEntry> candidates;
	for (const auto& pool : locationPools_->getEnemyPools(locationId, combatLevel)) {
		for (const auto& member : pool.members) {
			candidates.push_back({ member.enemyTypeId, member.spawnWeight, member.tier, member.styleId });
		}
	}

	auto picked = selectWeighted(candidates, 1, roll);
	if (picked.empty()) {
		throw NotFoundError("Enemy pool", locationId + " at level " + std::to_string(combatLevel));
	}
	const WeightedEntry& choice = picked.front();

	auto type = enemies_->findEnemyType(choice.referenceId);
	if (!type) throw NotFoundError("Enemy type", choice.referenceId);

	auto tier = enemies_->findTier(choice.tier);
	if (!tier) throw NotFoundError("Enemy tier", std::to_string(choice.tier));

	std::string styleId = "normal";
	if (choice.styleId && !choice.styleId->empty()) {
		styleId = *choice.styleId;
	}
	else if (!type->styleIds.empty()) {
		std::vector<WeightedEntry> styles;
		for (const auto& s : type->styleIds) styles.push_back({ s, 1.0 });
		styleId = selectWeighted(styles, 1, roll).front().referenceId;
	}

	EnemySnapshot enemy = hydrateEnemy(*type, *tier, styleId);
	std::cout << "[LOOT] Selected enemy " << enemy.name << " (tier " << enemy.tier
		<< ", style " << enemy.styleId << ") from " << candidates.size()
		<< " candidates at " << locationId << std::endl;
	return enemy;
}

std::string LootProvider::selectRarity(int combatLevel, const RollFn& roll) const {
	const double levelScale = 1.0 + combatLevel * config_.rarityLevelScale;

	std::vector<WeightedEntry> weighted;
	for (const auto& r : config_.rarities) {
		weighted.push_back({ r.rarity, r.baseDropRate * levelScale });
	}

	auto picked = selectWeighted(weighted, 1, roll);
	return picked.empty() ? "common" : picked.front().referenceId;
}

VictoryRewards LootProvider::selectLoot(const std::string& locationId, int combatLevel, const EnemySnapshot& enemy, const RollFn& roll) {
	if (combatLevel < 1) {
		throw ValidationError("Combat level must be 1 or greater");
	}

	std::vector<LootEntry> entries;
	std::vector<double> weights;
	for (const auto& pool : locationPools_->getLootPools(locationId, combatLevel)) {
		for (const auto& entry : pool.entries) {
			auto tw = pool.tierWeights.find(entry.tierName);
			double multiplier = tw != pool.tierWeights.end() ? tw->second : 1.0;
			entries.push_back(entry);
			weights.push_back(entry.dropWeight * multiplier);
		}
	}

	const int dropCount = rollInt(roll, config_.lootDropMin, config_.lootDropMax);
	std::vector<std::size_t> picked = selectWeightedIndices(weights, dropCount, roll);

	// Batch hydrate: one lookup per kind, never one per drop.
	std::set<std::string> materialIds, itemTypeIds;
	for (std::size_t idx : picked) {
		if (entries[idx].type == LootableType::Material) materialIds.insert(entries[idx].lootableId);
		else itemTypeIds.insert(entries[idx].lootableId);
	}

	std::map<std::string, MaterialDetail> materialById;
	if (!materialIds.empty()) {
		for (auto& m : materials_->findByIds({ materialIds.begin(), materialIds.end() }))
			materialById[m.id] = m;
	}
	std::map<std::string, ItemTypeDetail> itemTypeById;
	if (!itemTypeIds.empty()) {
		for (auto& t : items_->findTypesByIds({ itemTypeIds.begin(), itemTypeIds.end() }))
			itemTypeById[t.id] = t;
	}

	VictoryRewards rewards;
	for (std::size_t idx : picked) {
		const LootEntry& entry = entries[idx];

		if (entry.type == LootableType::Material) {
			auto it = materialById.find(entry.lootableId);
			if (it == materialById.end()) throw NotFoundError("Material", entry.lootableId);

			// Same material from two pools folds into one stack grant.
			auto existing = std::find_if(rewards.materials.begin(), rewards.materials.end(),
				[&](const MaterialReward& m) { return m.materialId == entry.lootableId; });
			if (existing != rewards.materials.end()) {
				existing->quantity += 1;
				continue;
			}
			rewards.materials.push_back({ it->second.id, it->second.name, enemy.styleId, 1 });
		}
		else {
			auto it = itemTypeById.find(entry.lootableId);
			if (it == itemTypeById.end()) throw NotFoundError("Item type", entry.lootableId);

			ItemReward item;
			item.itemTypeId = it->second.id;
			item.name = it->second.name;
			item.category = it->second.category;
			item.rarity = selectRarity(combatLevel, roll);
			item.styleId = enemy.styleId;
			rewards.items.push_back(std::move(item));
		}
	}

	rewards.gold = static_cast<int>(std::floor(config_.goldPerLevel * combatLevel * enemy.goldMultiplier));
	rewards.experience = static_cast<int>(std::floor(config_.xpPerLevel * combatLevel * enemy.xpMultiplier));

	std::cout << "[LOOT] Rolled " << rewards.materials.size() << " material(s), " << rewards.items.size()
		<< " item(s), " << rewards.gold << " gold, " << rewards.experience << " xp (style "
		<< enemy.styleId << ")" << std::endl;
	return rewards;
}
