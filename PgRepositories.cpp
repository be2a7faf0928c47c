// File: PgRepositories.cpp
// Description: SQL for every combat collaborator. Grants are upserts.
#include "PgRepositories.hpp"
#include <algorithm>
#include <cmath>
#include <map>

using std::string;

namespace {

Location locationFromRow(const pqxx::row& row) {
	Location loc;
	loc.id = row["id"].as<string>();
	loc.name = row["name"].as<string>();
	loc.locationType = row["location_type"].is_null() ? "" : row["location_type"].as<string>();
	loc.stateCode = row["state_code"].is_null() ? "" : row["state_code"].as<string>();
	loc.countryCode = row["country_code"].is_null() ? "" : row["country_code"].as<string>();
	return loc;
}

PoolFilter filterFromRow(const pqxx::row& row) {
	PoolFilter filter;
	filter.type = parsePoolFilterType(row["filter_type"].as<string>());
	filter.value = row["filter_value"].is_null() ? "" : row["filter_value"].as<string>();
	return filter;
}

std::optional<Location> loadLocation(pqxx::transaction_base& T, const string& locationId) {
	pqxx::result R = T.exec(pqxx::zview(
		"SELECT id, name, location_type, state_code, country_code FROM locations WHERE id = $1"),
		pqxx::params(locationId));
	if (R.empty()) return std::nullopt;
	return locationFromRow(R[0]);
}

} // namespace

// ==========================================
// Player stats
// ==========================================

PlayerStatSnapshot PgPlayerStatsProvider::getEquippedStats(const string& userId) {
	return runDatabaseOp("getEquippedStats", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview(
			"SELECT atk, def, hp, accuracy FROM player_stats WHERE user_id = $1"),
			pqxx::params(userId));
		if (R.empty()) {
			throw NotFoundError("Player stats", userId);
		}

		PlayerStatSnapshot stats;
		stats.atk = R[0]["atk"].as<int>();
		stats.def = R[0]["def"].as<int>();
		stats.hp = R[0]["hp"].as<int>();
		stats.accuracy = R[0]["accuracy"].as<double>();
		return stats;
	});
}

std::optional<WeaponBandConfig> PgPlayerStatsProvider::getEquippedWeaponBands(const string& userId) {
	return runDatabaseOp("getEquippedWeaponBands", [&]() -> std::optional<WeaponBandConfig> {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		const string sql = R"(
			SELECT w.deg_injure, w.deg_miss, w.deg_graze, w.deg_normal, w.deg_crit
			FROM items i
			JOIN weapons w ON w.item_id = i.id
			JOIN item_types t ON t.id = i.item_type_id
			WHERE i.user_id = $1 AND i.is_equipped AND t.category = 'weapon'
			LIMIT 1)";
		pqxx::result R = N.exec(pqxx::zview(sql), pqxx::params(userId));
		if (R.empty()) return std::nullopt;

		WeaponBandConfig bands;
		bands.degInjure = R[0]["deg_injure"].as<double>();
		bands.degMiss = R[0]["deg_miss"].as<double>();
		bands.degGraze = R[0]["deg_graze"].as<double>();
		bands.degNormal = R[0]["deg_normal"].as<double>();
		bands.degCrit = R[0]["deg_crit"].as<double>();
		return bands;
	});
}

// ==========================================
// Locations and pools
// ==========================================

std::optional<Location> PgLocationPoolRepository::findLocation(const string& locationId) {
	return runDatabaseOp("findLocation", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		return loadLocation(N, locationId);
	});
}

std::vector<EnemyPool> PgLocationPoolRepository::getEnemyPools(const string& locationId, int combatLevel) {
	return runDatabaseOp("getEnemyPools", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);

		std::vector<EnemyPool> pools;
		auto location = loadLocation(N, locationId);
		if (!location) return pools;

		const string sql = R"(
			SELECT p.id, p.combat_level, p.filter_type, p.filter_value,
			       m.enemy_type_id, m.spawn_weight, m.tier, m.style_id
			FROM enemy_pools p
			JOIN enemy_pool_members m ON m.enemy_pool_id = p.id
			WHERE p.combat_level = $1
			ORDER BY p.id)";
		pqxx::result R = N.exec(pqxx::zview(sql), pqxx::params(combatLevel));

		for (const auto& row : R) {
			string poolId = row["id"].as<string>();
			if (pools.empty() || pools.back().id != poolId) {
				EnemyPool pool;
				pool.id = poolId;
				pool.combatLevel = row["combat_level"].as<int>();
				pool.filter = filterFromRow(row);
				pools.push_back(std::move(pool));
			}

			EnemyPoolMember member;
			member.enemyTypeId = row["enemy_type_id"].as<string>();
			member.spawnWeight = row["spawn_weight"].as<double>();
			member.tier = row["tier"].as<int>();
			if (!row["style_id"].is_null()) member.styleId = row["style_id"].as<string>();
			pools.back().members.push_back(std::move(member));
		}

		std::vector<EnemyPool> applicable;
		for (auto& pool : pools) {
			if (poolApplies(pool.filter, pool.combatLevel, *location, combatLevel)) {
				applicable.push_back(std::move(pool));
			}
		}
		return applicable;
	});
}

std::vector<LootPool> PgLocationPoolRepository::getLootPools(const string& locationId, int combatLevel) {
	return runDatabaseOp("getLootPools", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);

		std::vector<LootPool> applicable;
		auto location = loadLocation(N, locationId);
		if (!location) return applicable;

		pqxx::result pools = N.exec(pqxx::zview(
			"SELECT id, combat_level, filter_type, filter_value FROM loot_pools WHERE combat_level = $1 ORDER BY id"),
			pqxx::params(combatLevel));

		std::map<string, LootPool> byId;
		std::vector<string> order;
		for (const auto& row : pools) {
			LootPool pool;
			pool.id = row["id"].as<string>();
			pool.combatLevel = row["combat_level"].as<int>();
			pool.filter = filterFromRow(row);
			if (!poolApplies(pool.filter, pool.combatLevel, *location, combatLevel)) continue;
			order.push_back(pool.id);
			byId[pool.id] = std::move(pool);
		}
		if (order.empty()) return applicable;

		pqxx::result entries = N.exec(pqxx::zview(
			"SELECT loot_pool_id, lootable_type, lootable_id, drop_weight, tier_name "
			"FROM loot_pool_entries WHERE loot_pool_id = ANY($1)"),
			pqxx::params(order));
		for (const auto& row : entries) {
			LootEntry entry;
			entry.type = row["lootable_type"].as<string>() == "material" ? LootableType::Material : LootableType::ItemType;
			entry.lootableId = row["lootable_id"].as<string>();
			entry.dropWeight = row["drop_weight"].as<double>();
			entry.tierName = row["tier_name"].as<string>();
			byId[row["loot_pool_id"].as<string>()].entries.push_back(std::move(entry));
		}

		pqxx::result weights = N.exec(pqxx::zview(
			"SELECT loot_pool_id, tier_name, multiplier FROM loot_pool_tier_weights WHERE loot_pool_id = ANY($1)"),
			pqxx::params(order));
		for (const auto& row : weights) {
			byId[row["loot_pool_id"].as<string>()].tierWeights[row["tier_name"].as<string>()] = row["multiplier"].as<double>();
		}

		for (const auto& id : order) applicable.push_back(std::move(byId[id]));
		return applicable;
	});
}

// ==========================================
// Enemies
// ==========================================

std::optional<EnemyType> PgEnemyRepository::findEnemyType(const string& enemyTypeId) {
	return runDatabaseOp("findEnemyType", [&]() -> std::optional<EnemyType> {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview(
			"SELECT id, name, base_atk, base_def, base_hp, atk_accuracy, def_accuracy FROM enemy_types WHERE id = $1"),
			pqxx::params(enemyTypeId));
		if (R.empty()) return std::nullopt;

		EnemyType type;
		type.id = R[0]["id"].as<string>();
		type.name = R[0]["name"].as<string>();
		type.baseAtk = R[0]["base_atk"].as<int>();
		type.baseDef = R[0]["base_def"].as<int>();
		type.baseHp = R[0]["base_hp"].as<int>();
		type.atkAccuracy = R[0]["atk_accuracy"].as<double>();
		type.defAccuracy = R[0]["def_accuracy"].as<double>();

		pqxx::result styles = N.exec(pqxx::zview(
			"SELECT style_id FROM enemy_type_styles WHERE enemy_type_id = $1 ORDER BY style_id"),
			pqxx::params(enemyTypeId));
		for (const auto& row : styles) type.styleIds.push_back(row["style_id"].as<string>());
		return type;
	});
}

std::optional<EnemyTier> PgEnemyRepository::findTier(int tier) {
	return runDatabaseOp("findTier", [&]() -> std::optional<EnemyTier> {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview("SELECT * FROM enemy_tiers WHERE tier = $1"), pqxx::params(tier));
		if (R.empty()) return std::nullopt;

		auto row = R[0];
		EnemyTier t;
		t.tier = row["tier"].as<int>();
		t.atkOffset = row["atk_offset"].as<int>();
		t.atkIncrement = row["atk_increment"].as<int>();
		t.defOffset = row["def_offset"].as<int>();
		t.defIncrement = row["def_increment"].as<int>();
		t.hpOffset = row["hp_offset"].as<int>();
		t.hpIncrement = row["hp_increment"].as<int>();
		t.goldMultiplier = row["gold_multiplier"].as<double>();
		t.xpMultiplier = row["xp_multiplier"].as<double>();
		return t;
	});
}

// ==========================================
// Materials and items
// ==========================================

std::vector<MaterialDetail> PgMaterialRepository::findByIds(const std::vector<string>& materialIds) {
	return runDatabaseOp("findMaterialsByIds", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview("SELECT id, name FROM materials WHERE id = ANY($1)"),
			pqxx::params(materialIds));

		std::vector<MaterialDetail> out;
		for (const auto& row : R) out.push_back({ row["id"].as<string>(), row["name"].as<string>() });
		return out;
	});
}

int PgMaterialRepository::incrementStack(const string& userId, const string& materialId,
	const string& styleId, int quantity) {
	if (quantity <= 0) throw ValidationError("Material quantity must be positive");

	return runDatabaseOp("incrementStack", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);
		const string sql = R"(
			INSERT INTO material_stacks (user_id, material_id, style_id, quantity)
			VALUES ($1, $2, $3, $4)
			ON CONFLICT (user_id, material_id, style_id)
			DO UPDATE SET quantity = material_stacks.quantity + EXCLUDED.quantity
			RETURNING quantity)";
		pqxx::result R = W.exec(pqxx::zview(sql), pqxx::params(userId, materialId, styleId, quantity));
		W.commit();
		return R[0]["quantity"].as<int>();
	});
}

std::vector<ItemTypeDetail> PgItemRepository::findTypesByIds(const std::vector<string>& itemTypeIds) {
	return runDatabaseOp("findItemTypesByIds", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview("SELECT id, name, category FROM item_types WHERE id = ANY($1)"),
			pqxx::params(itemTypeIds));

		std::vector<ItemTypeDetail> out;
		for (const auto& row : R) {
			out.push_back({ row["id"].as<string>(), row["name"].as<string>(), row["category"].as<string>() });
		}
		return out;
	});
}

CreatedItem PgItemRepository::create(const string& userId, const string& itemTypeId, int level) {
	return runDatabaseOp("createItem", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);
		pqxx::result R = W.exec(pqxx::zview(
			"INSERT INTO items (user_id, item_type_id, level) VALUES ($1, $2, $3) RETURNING id"),
			pqxx::params(userId, itemTypeId, level));
		W.commit();

		CreatedItem item;
		item.id = std::to_string(R[0]["id"].as<long long>());
		item.itemTypeId = itemTypeId;
		item.level = level;
		return item;
	});
}

// ==========================================
// Currency
// ==========================================

CurrencyReceipt PgCurrencyLedger::applyDelta(const string& userId, const string& currencyCode, int amount,
	const string& sourceType, const string& sourceId) {
	return runDatabaseOp("applyCurrencyDelta", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);

		pqxx::result prior = W.exec(pqxx::zview(
			"SELECT id, balance_before, balance_after FROM economy_transactions "
			"WHERE source_type = $1 AND source_id = $2 AND currency_code = $3"),
			pqxx::params(sourceType, sourceId, currencyCode));
		if (!prior.empty()) {
			std::cout << "[LEDGER] " << sourceType << "/" << sourceId << " already credited, returning first receipt." << std::endl;
			return CurrencyReceipt{ prior[0]["balance_before"].as<int>(), prior[0]["balance_after"].as<int>(),
				std::to_string(prior[0]["id"].as<long long>()) };
		}

		W.exec(pqxx::zview(
			"INSERT INTO user_currency_balances (user_id, currency_code, balance) VALUES ($1, $2, 0) "
			"ON CONFLICT (user_id, currency_code) DO NOTHING"),
			pqxx::params(userId, currencyCode));

		pqxx::result bal = W.exec(pqxx::zview(
			"SELECT balance FROM user_currency_balances WHERE user_id = $1 AND currency_code = $2 FOR UPDATE"),
			pqxx::params(userId, currencyCode));
		int before = bal[0]["balance"].as<int>();
		int after = before + amount;
		if (after < 0) {
			throw InsufficientFundsError(-amount, before);
		}

		W.exec(pqxx::zview(
			"UPDATE user_currency_balances SET balance = $3 WHERE user_id = $1 AND currency_code = $2"),
			pqxx::params(userId, currencyCode, after));

		pqxx::result tx = W.exec(pqxx::zview(R"(
			INSERT INTO economy_transactions
			    (user_id, currency_code, amount, balance_before, balance_after, source_type, source_id)
			VALUES ($1, $2, $3, $4, $5, $6, $7)
			RETURNING id)"),
			pqxx::params(userId, currencyCode, amount, before, after, sourceType, sourceId));
		W.commit();

		return CurrencyReceipt{ before, after, std::to_string(tx[0]["id"].as<long long>()) };
	});
}

// ==========================================
// Progression and history
// ==========================================

int levelForExperience(int totalXp) {
	if (totalXp <= 0) return 1;
	return static_cast<int>(std::floor(std::sqrt(totalXp / 100.0))) + 1;
}

LevelProgress PgProgressionRepository::addExperience(const string& userId, int amount) {
	if (amount < 0) throw ValidationError("Experience amount must not be negative");

	return runDatabaseOp("addExperience", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);
		const string sql = R"(
			INSERT INTO player_progression (user_id, xp, level)
			VALUES ($1, $2, 1)
			ON CONFLICT (user_id) DO UPDATE SET xp = player_progression.xp + EXCLUDED.xp
			RETURNING xp, level)";
		pqxx::result R = W.exec(pqxx::zview(sql), pqxx::params(userId, amount));

		int totalXp = R[0]["xp"].as<int>();
		int oldLevel = R[0]["level"].as<int>();
		int newLevel = std::max(oldLevel, levelForExperience(totalXp));
		if (newLevel != oldLevel) {
			W.exec(pqxx::zview("UPDATE player_progression SET level = $2 WHERE user_id = $1"),
				pqxx::params(userId, newLevel));
		}
		W.commit();

		return LevelProgress{ amount, newLevel > oldLevel, newLevel };
	});
}

CombatHistoryRecord PgCombatHistoryRepository::upsert(const string& userId, const string& locationId, CombatOutcome result) {
	return runDatabaseOp("upsertCombatHistory", [&]() {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);

		const int won = result == CombatOutcome::Victory ? 1 : 0;
		const string sql = R"(
			INSERT INTO player_combat_history
			    (user_id, location_id, total_attempts, victories, defeats, current_streak, longest_streak, last_attempt)
			VALUES ($1, $2, 1, $3, $4, $3, $3, now())
			ON CONFLICT (user_id, location_id) DO UPDATE SET
			    total_attempts = player_combat_history.total_attempts + 1,
			    victories = player_combat_history.victories + EXCLUDED.victories,
			    defeats = player_combat_history.defeats + EXCLUDED.defeats,
			    current_streak = CASE WHEN EXCLUDED.victories = 1
			        THEN player_combat_history.current_streak + 1 ELSE 0 END,
			    longest_streak = GREATEST(player_combat_history.longest_streak,
			        CASE WHEN EXCLUDED.victories = 1 THEN player_combat_history.current_streak + 1 ELSE 0 END),
			    last_attempt = now()
			RETURNING location_id, total_attempts, victories, defeats, current_streak, longest_streak)";
		pqxx::result R = W.exec(pqxx::zview(sql), pqxx::params(userId, locationId, won, 1 - won));
		W.commit();

		CombatHistoryRecord record;
		record.locationId = R[0]["location_id"].as<string>();
		record.totalAttempts = R[0]["total_attempts"].as<int>();
		record.victories = R[0]["victories"].as<int>();
		record.defeats = R[0]["defeats"].as<int>();
		record.currentStreak = R[0]["current_streak"].as<int>();
		record.longestStreak = R[0]["longest_streak"].as<int>();
		return record;
	});
}

CombatRepositories makePgRepositories(std::shared_ptr<DatabaseManager> db) {
	CombatRepositories repos;
	repos.playerStats = std::make_shared<PgPlayerStatsProvider>(db);
	repos.locationPools = std::make_shared<PgLocationPoolRepository>(db);
	repos.enemies = std::make_shared<PgEnemyRepository>(db);
	repos.materials = std::make_shared<PgMaterialRepository>(db);
	repos.items = std::make_shared<PgItemRepository>(db);
	repos.currency = std::make_shared<PgCurrencyLedger>(db);
	repos.progression = std::make_shared<PgProgressionRepository>(db);
	repos.history = std::make_shared<PgCombatHistoryRepository>(db);
	return repos;
}
