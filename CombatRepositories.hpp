// File: CombatRepositories.hpp
// Description: Narrow interfaces to the collaborators the combat core reads
// from and writes to, and the reference-data records they return.
// PostgreSQL implementations live in PgRepositories.hpp.
#pragma once

#include "CombatTypes.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// --- Reference data ---

struct Location {
	std::string id;
	std::string name;
	std::string locationType; // e.g. "park", "library"
	std::string stateCode;
	std::string countryCode;
};

enum class PoolFilterType : int {
	Universal = 0,
	LocationType = 1,
	State = 2,
	Country = 3,
	LocationId = 4
};

struct PoolFilter {
	PoolFilterType type = PoolFilterType::Universal;
	std::string value;
};

PoolFilterType parsePoolFilterType(const std::string& s);
bool poolFilterMatches(const PoolFilter& filter, const Location& location);

struct EnemyPoolMember {
	std::string enemyTypeId;
	double spawnWeight = 1.0;
	int tier = 1;
	std::optional<std::string> styleId; // pins the style when set
};

struct EnemyPool {
	std::string id;
	int combatLevel = 1;
	PoolFilter filter;
	std::vector<EnemyPoolMember> members;
};

enum class LootableType : int {
	Material = 0,
	ItemType = 1
};

struct LootEntry {
	LootableType type = LootableType::Material;
	std::string lootableId;
	double dropWeight = 1.0;
	std::string tierName = "common";
};

struct LootPool {
	std::string id;
	int combatLevel = 1;
	PoolFilter filter;
	std::vector<LootEntry> entries;
	std::map<std::string, double> tierWeights; // tier name -> multiplier, missing = 1.0
};

// A pool applies when its level equals the combat level and its filter matches.
bool poolApplies(const PoolFilter& filter, int poolLevel, const Location& location, int combatLevel);

struct EnemyType {
	std::string id;
	std::string name;
	int baseAtk = 0;
	int baseDef = 0;
	int baseHp = 0;
	double atkAccuracy = 0.0;
	double defAccuracy = 0.0;
	std::vector<std::string> styleIds;
};

// stat = base + offset + increment * (tier - 1)
struct EnemyTier {
	int tier = 1;
	int atkOffset = 0, atkIncrement = 0;
	int defOffset = 0, defIncrement = 0;
	int hpOffset = 0, hpIncrement = 0;
	double goldMultiplier = 1.0;
	double xpMultiplier = 1.0;
};

struct MaterialDetail {
	std::string id;
	std::string name;
};

struct ItemTypeDetail {
	std::string id;
	std::string name;
	std::string category;
};

struct CreatedItem {
	std::string id;
	std::string itemTypeId;
	int level = 1;
};

struct CurrencyReceipt {
	int previousBalance = 0;
	int newBalance = 0;
	std::string transactionId;
};

// --- Collaborators ---

class PlayerStatsProvider
{
public:
	virtual ~PlayerStatsProvider() = default;
	virtual PlayerStatSnapshot getEquippedStats(const std::string& userId) = 0;
	// nullopt when no weapon is equipped.
	virtual std::optional<WeaponBandConfig> getEquippedWeaponBands(const std::string& userId) = 0;
};

class LocationPoolRepository
{
public:
	virtual ~LocationPoolRepository() = default;
	virtual std::optional<Location> findLocation(const std::string& locationId) = 0;
	// Location-specific, universal and region pools for exactly this level.
	virtual std::vector<EnemyPool> getEnemyPools(const std::string& locationId, int combatLevel) = 0;
	virtual std::vector<LootPool> getLootPools(const std::string& locationId, int combatLevel) = 0;
};

class EnemyRepository
{
public:
	virtual ~EnemyRepository() = default;
	virtual std::optional<EnemyType> findEnemyType(const std::string& enemyTypeId) = 0;
	virtual std::optional<EnemyTier> findTier(int tier) = 0;
};

class MaterialRepository
{
public:
	virtual ~MaterialRepository() = default;
	// One round trip for the whole id list. Unknown ids are simply absent.
	virtual std::vector<MaterialDetail> findByIds(const std::vector<std::string>& materialIds) = 0;
	// Upsert: creates the (user, material, style) stack or adds to it. Returns the new quantity.
	virtual int incrementStack(const std::string& userId, const std::string& materialId,
		const std::string& styleId, int quantity) = 0;
};

class ItemRepository
{
public:
	virtual ~ItemRepository() = default;
	virtual std::vector<ItemTypeDetail> findTypesByIds(const std::vector<std::string>& itemTypeIds) = 0;
	virtual CreatedItem create(const std::string& userId, const std::string& itemTypeId, int level) = 0;
};

class CurrencyLedger
{
public:
	virtual ~CurrencyLedger() = default;
	// Balance check, mutation and audit row in one atomic operation.
	virtual CurrencyReceipt applyDelta(const std::string& userId, const std::string& currencyCode, int amount,
		const std::string& sourceType, const std::string& sourceId) = 0;
};

class ProgressionRepository
{
public:
	virtual ~ProgressionRepository() = default;
	virtual LevelProgress addExperience(const std::string& userId, int amount) = 0;
};

class CombatHistoryRepository
{
public:
	virtual ~CombatHistoryRepository() = default;
	virtual CombatHistoryRecord upsert(const std::string& userId, const std::string& locationId, CombatOutcome result) = 0;
};

// Everything the combat service is wired with.
struct CombatRepositories {
	std::shared_ptr<PlayerStatsProvider> playerStats;
	std::shared_ptr<LocationPoolRepository> locationPools;
	std::shared_ptr<EnemyRepository> enemies;
	std::shared_ptr<MaterialRepository> materials;
	std::shared_ptr<ItemRepository> items;
	std::shared_ptr<CurrencyLedger> currency;
	std::shared_ptr<ProgressionRepository> progression;
	std::shared_ptr<CombatHistoryRepository> history;
};
