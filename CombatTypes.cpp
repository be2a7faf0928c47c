// File: CombatTypes.cpp
// Description: Name tables and validation for the combat data structures.
#include "CombatTypes.hpp"
#include "CombatErrors.hpp"

const char* zoneName(HitZone zone) {
	switch (zone) {
	case HitZone::Injure: return "injure";
	case HitZone::Miss:   return "miss";
	case HitZone::Graze:  return "graze";
	case HitZone::Normal: return "normal";
	case HitZone::Crit:   return "crit";
	}
	return "unknown";
}

HitZone parseZone(const std::string& label) {
	for (HitZone zone : ALL_ZONES) {
		if (label == zoneName(zone)) return zone;
	}
	throw ValidationError("Unknown hit zone: " + label);
}

const char* statusName(CombatStatus status) {
	switch (status) {
	case CombatStatus::Ongoing: return "ongoing";
	case CombatStatus::Victory: return "victory";
	case CombatStatus::Defeat:  return "defeat";
	}
	return "unknown";
}

const char* outcomeName(CombatOutcome outcome) {
	return outcome == CombatOutcome::Victory ? "victory" : "defeat";
}

const char* stepName(SettlementStep step) {
	switch (step) {
	case SettlementStep::Materials:  return "materials";
	case SettlementStep::Items:      return "items";
	case SettlementStep::Currency:   return "currency";
	case SettlementStep::Experience: return "experience";
	case SettlementStep::History:    return "history";
	}
	return "unknown";
}

double WeaponBandConfig::width(HitZone zone) const {
	switch (zone) {
	case HitZone::Injure: return degInjure;
	case HitZone::Miss:   return degMiss;
	case HitZone::Graze:  return degGraze;
	case HitZone::Normal: return degNormal;
	case HitZone::Crit:   return degCrit;
	}
	return 0.0;
}

// --- RewardBundle ---

RewardBundle RewardBundle::forVictory(VictoryRewards rewards) {
	if (rewards.gold < 0) throw ValidationError("Victory gold must not be negative");
	if (rewards.experience < 0) throw ValidationError("Victory experience must not be negative");
	for (const auto& m : rewards.materials) {
		if (m.materialId.empty()) throw ValidationError("Material reward without material id");
		if (m.quantity <= 0) throw ValidationError("Material reward quantity must be positive: " + m.materialId);
	}
	for (const auto& item : rewards.items) {
		if (item.itemTypeId.empty()) throw ValidationError("Item reward without item type id");
	}

	RewardBundle bundle;
	bundle.outcome = CombatOutcome::Victory;
	bundle.victory = std::move(rewards);
	return bundle;
}

RewardBundle RewardBundle::forDefeat() {
	RewardBundle bundle;
	bundle.outcome = CombatOutcome::Defeat;
	return bundle;
}

const std::vector<MaterialReward>& RewardBundle::materials() const {
	static const std::vector<MaterialReward> none;
	return victory ? victory->materials : none;
}

const std::vector<ItemReward>& RewardBundle::items() const {
	static const std::vector<ItemReward> none;
	return victory ? victory->items : none;
}
