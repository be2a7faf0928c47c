// File: PgRepositories.hpp
// Description: PostgreSQL (libpqxx) implementations of the combat
// collaborators. Schema: sql/combat_schema.sql.
#pragma once

#include "CombatRepositories.hpp"
#include "DatabaseManager.hpp"
#include <memory>

class PgPlayerStatsProvider : public PlayerStatsProvider
{
	std::shared_ptr<DatabaseManager> db_;
public:
	explicit PgPlayerStatsProvider(std::shared_ptr<DatabaseManager> db) : db_(std::move(db)) {}
	PlayerStatSnapshot getEquippedStats(const std::string& userId) override;
	std::optional<WeaponBandConfig> getEquippedWeaponBands(const std::string& userId) override;
};

// Loads every pool at the level and keeps the ones whose filter matches the location.
class PgLocationPoolRepository : public LocationPoolRepository
{
	std::shared_ptr<DatabaseManager> db_;
public:
	explicit PgLocationPoolRepository(std::shared_ptr<DatabaseManager> db) : db_(std::move(db)) {}
	std::optional<Location> findLocation(const std::string& locationId) override;
	std::vector<EnemyPool> getEnemyPools(const std::string& locationId, int combatLevel) override;
	std::vector<LootPool> getLootPools(const std::string& locationId, int combatLevel) override;
};

class PgEnemyRepository : public EnemyRepository
{
	std::shared_ptr<DatabaseManager> db_;
public:
	explicit PgEnemyRepository(std::shared_ptr<DatabaseManager> db) : db_(std::move(db)) {}
	std::optional<EnemyType> findEnemyType(const std::string& enemyTypeId) override;
	std::optional<EnemyTier> findTier(int tier) override;
};

class PgMaterialRepository : public MaterialRepository
{
	std::shared_ptr<DatabaseManager> db_;
public:
	explicit PgMaterialRepository(std::shared_ptr<DatabaseManager> db) : db_(std::move(db)) {}
	std::vector<MaterialDetail> findByIds(const std::vector<std::string>& materialIds) override;
	int incrementStack(const std::string& userId, const std::string& materialId,
		const std::string& styleId, int quantity) override;
};

class PgItemRepository : public ItemRepository
{
	std::shared_ptr<DatabaseManager> db_;
public:
	explicit PgItemRepository(std::shared_ptr<DatabaseManager> db) : db_(std::move(db)) {}
	std::vector<ItemTypeDetail> findTypesByIds(const std::vector<std::string>& itemTypeIds) override;
	CreatedItem create(const std::string& userId, const std::string& itemTypeId, int level) override;
};

// A second delta with the same (sourceType, sourceId, currency) returns the
// first receipt instead of moving the balance again.
class PgCurrencyLedger : public CurrencyLedger
{
	std::shared_ptr<DatabaseManager> db_;
public:
	explicit PgCurrencyLedger(std::shared_ptr<DatabaseManager> db) : db_(std::move(db)) {}
	CurrencyReceipt applyDelta(const std::string& userId, const std::string& currencyCode, int amount,
		const std::string& sourceType, const std::string& sourceId) override;
};

// level = floor(sqrt(xp / 100)) + 1
int levelForExperience(int totalXp);

class PgProgressionRepository : public ProgressionRepository
{
	std::shared_ptr<DatabaseManager> db_;
public:
	explicit PgProgressionRepository(std::shared_ptr<DatabaseManager> db) : db_(std::move(db)) {}
	LevelProgress addExperience(const std::string& userId, int amount) override;
};

class PgCombatHistoryRepository : public CombatHistoryRepository
{
	std::shared_ptr<DatabaseManager> db_;
public:
	explicit PgCombatHistoryRepository(std::shared_ptr<DatabaseManager> db) : db_(std::move(db)) {}
	CombatHistoryRecord upsert(const std::string& userId, const std::string& locationId, CombatOutcome result) override;
};

CombatRepositories makePgRepositories(std::shared_ptr<DatabaseManager> db);
