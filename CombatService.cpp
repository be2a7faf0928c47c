// File: CombatService.cpp
// Description: Turn resolution and lifecycle for combat sessions.
#include "CombatService.hpp"
#include "CombatErrors.hpp"
#include "DamageCalculator.hpp"
#include "SessionToken.hpp"
#include "ZoneResolver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace {

void validateTap(double degrees, const char* label) {
	if (!std::isfinite(degrees) || degrees < 0.0 || degrees >= DIAL_DEGREES) {
		throw ValidationError(std::string(label) + " must be in [0, 360), got " + std::to_string(degrees));
	}
}

bool settlementStarted(const SettlementProgress& progress) {
	return progress.claimed || progress.completedSteps != 0 || progress.materialsApplied != 0 ||
		!progress.createdItemIds.empty();
}

} // namespace

CombatService::CombatService(std::shared_ptr<SessionStore> store, CombatRepositories repos, CombatConfig config,
	RollFn roll, WallClock clock, RewardSettlement::Sleeper sleeper)
	: store_(store)
	, repos_(repos)
	, config_(config)
	, roll_(std::move(roll))
	, clock_(std::move(clock))
	, loot_(repos.locationPools, repos.enemies, repos.materials, repos.items, config)
	, settlement_(store, repos, config, std::move(sleeper))
{
	validateCombatConfig(config_);
	if (!roll_) {
		throw ValidationError("CombatService requires a roll source");
	}
}

double CombatService::nextRoll() {
	std::lock_guard<std::mutex> lock(roll_mutex_);
	double r = roll_();
	if (!(r >= 0.0)) r = 0.0;
	if (r >= 1.0) r = std::nextafter(1.0, 0.0);
	return r;
}

double CombatService::rollCritBonus(HitZone zone) {
	if (zone != HitZone::Crit || config_.critBonusMax <= 0.0) return 0.0;
	return nextRoll() * config_.critBonusMax;
}

HitZone CombatService::rollEnemyZone(double accuracy) {
	double degree = std::min(nextRoll() * DIAL_DEGREES, std::nextafter(DIAL_DEGREES, 0.0));
	return resolveZone(degree, config_.enemyWeaponBands, accuracy, config_.accuracyScaleMax);
}

CombatSession CombatService::requireSession(const std::string& sessionId) {
	auto session = store_->get(sessionId);
	if (!session) {
		throw NotFoundError("Combat session", sessionId);
	}
	return *session;
}

CombatSession CombatService::requireOngoingSession(const std::string& sessionId) {
	auto session = store_->get(sessionId);
	if (!session) {
		// Auto-settle retires the live record at the terminal turn; the settled ledger still knows it ended.
		if (auto settled = store_->getSettled(sessionId)) {
			throw InvalidStateError("Combat session " + sessionId + " already ended in "
				+ outcomeName(settled->outcome));
		}
		throw NotFoundError("Combat session", sessionId);
	}
	if (session->isTerminal()) {
		throw InvalidStateError("Combat session " + sessionId + " already ended in " + statusName(session->status));
	}
	return *session;
}

SessionSummary CombatService::summarize(const CombatSession& session) const {
	SessionSummary s;
	s.sessionId = session.sessionId;
	s.userId = session.userId;
	s.locationId = session.locationId;
	s.combatLevel = session.combatLevel;
	s.enemy = session.enemy;
	s.player = session.player;
	s.currentPlayerHp = session.currentPlayerHp;
	s.currentEnemyHp = session.currentEnemyHp;
	s.turnNumber = session.turnNumber;
	s.status = session.status;
	s.weaponBands = session.weaponBands;
	s.adjustedBands = adjustBandsForAccuracy(session.weaponBands, session.player.accuracy, config_.accuracyScaleMax);
	s.expiresAt = session.expiresAt;
	return s;
}

SessionSummary CombatService::startCombat(const std::string& userId, const std::string& locationId, int combatLevel) {
	if (userId.empty()) throw ValidationError("User id is required");
	if (locationId.empty()) throw ValidationError("Location id is required");
	if (combatLevel < 1 || combatLevel > config_.combatLevelMax) {
		throw ValidationError("Combat level must be between 1 and " + std::to_string(config_.combatLevelMax) +
			", got " + std::to_string(combatLevel));
	}

	std::lock_guard<std::mutex> guard(start_mutex_);

	auto active = store_->findActiveSessionForUser(userId);
	if (active) {
		throw InvalidStateError("User " + userId + " already has an active combat session: " + *active);
	}

	PlayerStatSnapshot player = repos_.playerStats->getEquippedStats(userId);
	validateAccuracy(player.accuracy, "Player accuracy");
	if (player.hp <= 0) throw ValidationError("Player hp must be positive");
	if (player.atk < 0 || player.def < 0) throw ValidationError("Player atk/def must not be negative");

	WeaponBandConfig bands = repos_.playerStats->getEquippedWeaponBands(userId).value_or(config_.defaultWeaponBands);
	validateBands(bands);

	RollFn roll = [this]() { return nextRoll(); };
	EnemySnapshot enemy = loot_.selectEnemy(locationId, combatLevel, roll);

	const auto now = clock_ ? clock_() : std::chrono::system_clock::now();
	const std::chrono::seconds ttl(config_.sessionTtlSeconds);

	CombatSession session;
	session.sessionId = generateSessionToken();
	session.userId = userId;
	session.locationId = locationId;
	session.combatLevel = combatLevel;
	session.enemy = enemy;
	session.player = player;
	session.weaponBands = bands;
	session.currentPlayerHp = player.hp;
	session.currentEnemyHp = enemy.hp;
	session.createdAt = now;
	session.expiresAt = now + ttl;

	store_->put(session, ttl);

	std::cout << "[COMBAT] Session " << session.sessionId << " started: " << userId << " vs " << enemy.name
		<< " (tier " << enemy.tier << ", " << enemy.styleId << ", hp " << enemy.hp << ") at "
		<< locationId << " level " << combatLevel << std::endl;
	return summarize(session);
}

TurnResult CombatService::submitAttack(const std::string& sessionId, double tapDegrees) {
	validateTap(tapDegrees, "Attack tap");

	auto sessionLock = store_->lockFor(sessionId);
	std::lock_guard<std::mutex> guard(*sessionLock);

	CombatSession session = requireOngoingSession(sessionId);

	CombatLogEntry entry;
	entry.turn = session.turnNumber + 1;
	entry.action = CombatAction::Attack;
	entry.tapDegrees = tapDegrees;
	entry.playerZone = resolveZone(tapDegrees, session.weaponBands, session.player.accuracy, config_.accuracyScaleMax);
	entry.critBonus = rollCritBonus(entry.playerZone);

	AttackOutcome strike = calculateAttack(entry.playerZone, session.player.atk, session.enemy.def,
		entry.critBonus, config_.minDamage);

	if (entry.playerZone == HitZone::Injure) {
		// Fumble: the player hurts themself and the enemy does not get a counter.
		entry.playerSelfDamage = strike.selfDamage;
		session.currentPlayerHp = std::max(0, session.currentPlayerHp - strike.selfDamage);
	}
	else {
		HitZone block = rollEnemyZone(session.enemy.defAccuracy);
		DefenseOutcome defense = applyDefense(strike.damageToDefender, block, config_.minDamage);
		entry.enemyDefenseZone = block;
		entry.damageToEnemy = defense.finalDamage;
		entry.damageBlocked = defense.damageBlocked;
		session.currentEnemyHp = std::max(0, session.currentEnemyHp - defense.finalDamage);

		if (session.currentEnemyHp > 0) {
			HitZone counterZone = rollEnemyZone(session.enemy.atkAccuracy);
			AttackOutcome counter = calculateAttack(counterZone, session.enemy.atk, session.player.def,
				rollCritBonus(counterZone), config_.minDamage);
			entry.enemyAttackZone = counterZone;

			if (counterZone == HitZone::Injure) {
				entry.enemySelfDamage = counter.selfDamage;
				session.currentEnemyHp = std::max(0, session.currentEnemyHp - counter.selfDamage);
			}
			else {
				entry.damageToPlayer = counter.damageToDefender;
				session.currentPlayerHp = std::max(0, session.currentPlayerHp - counter.damageToDefender);
			}
		}
	}

	return finishTurn(session, entry, strike.multiplier);
}

TurnResult CombatService::submitDefend(const std::string& sessionId, double defenseTapDegrees) {
	validateTap(defenseTapDegrees, "Defense tap");

	auto sessionLock = store_->lockFor(sessionId);
	std::lock_guard<std::mutex> guard(*sessionLock);

	CombatSession session = requireOngoingSession(sessionId);

	CombatLogEntry entry;
	entry.turn = session.turnNumber + 1;
	entry.action = CombatAction::Defend;
	entry.tapDegrees = defenseTapDegrees;
	entry.playerZone = resolveZone(defenseTapDegrees, session.weaponBands, session.player.accuracy, config_.accuracyScaleMax);

	HitZone enemyZone = rollEnemyZone(session.enemy.atkAccuracy);
	entry.enemyAttackZone = enemyZone;
	entry.critBonus = rollCritBonus(enemyZone);

	AttackOutcome strike = calculateAttack(enemyZone, session.enemy.atk, session.player.def,
		entry.critBonus, config_.minDamage);

	if (enemyZone == HitZone::Injure) {
		entry.enemySelfDamage = strike.selfDamage;
		session.currentEnemyHp = std::max(0, session.currentEnemyHp - strike.selfDamage);
	}
	else {
		DefenseOutcome defense = applyDefense(strike.damageToDefender, entry.playerZone, config_.minDamage);
		entry.damageToPlayer = defense.finalDamage;
		entry.damageBlocked = defense.damageBlocked;
		session.currentPlayerHp = std::max(0, session.currentPlayerHp - defense.finalDamage);
	}

	return finishTurn(session, entry, strike.multiplier);
}

void CombatService::concludeTurn(CombatSession& session, CombatLogEntry& entry) {
	if (session.currentEnemyHp <= 0) {
		session.status = CombatStatus::Victory;
	}
	else if (session.currentPlayerHp <= 0) {
		session.status = CombatStatus::Defeat;
	}
	else {
		return;
	}

	// Rolled once, here. Every settlement attempt reuses this bundle.
	if (session.status == CombatStatus::Victory) {
		RollFn roll = [this]() { return nextRoll(); };
		session.pendingRewards = RewardBundle::forVictory(
			loot_.selectLoot(session.locationId, session.combatLevel, session.enemy, roll));
	}
	else {
		session.pendingRewards = RewardBundle::forDefeat();
	}

	std::cout << "[COMBAT] Session " << session.sessionId << " ended in " << statusName(session.status)
		<< " on turn " << entry.turn << "." << std::endl;
}

TurnResult CombatService::finishTurn(CombatSession& session, const CombatLogEntry& turn, double zoneMultiplier) {
	CombatLogEntry entry = turn;
	entry.playerHp = session.currentPlayerHp;
	entry.enemyHp = session.currentEnemyHp;
	entry.timestamp = clock_ ? clock_() : std::chrono::system_clock::now();

	session.turnNumber = entry.turn;
	concludeTurn(session, entry);
	session.combatLog.push_back(entry);

	store_->put(session, std::chrono::seconds(config_.sessionTtlSeconds));

	std::cout << "[COMBAT] " << session.sessionId << " turn " << entry.turn << " "
		<< (entry.action == CombatAction::Attack ? "attack" : "defend") << ": player " << zoneName(entry.playerZone)
		<< ", dealt " << entry.damageToEnemy << ", took " << entry.damageToPlayer
		<< ", blocked " << entry.damageBlocked << " | hp " << entry.playerHp << " vs " << entry.enemyHp << std::endl;

	TurnResult result;
	result.sessionId = session.sessionId;
	result.entry = entry;
	result.zoneMultiplier = zoneMultiplier;
	result.status = session.status;

	if (session.isTerminal() && config_.autoSettleOnTerminal) {
		try {
			result.rewards = settlement_.settle(session.sessionId);
		}
		catch (const CombatError& e) {
			// The turn itself is already stored; completeCombat picks settlement up again.
			std::cerr << "[COMBAT] Automatic settlement of " << session.sessionId << " failed: " << e.what() << std::endl;
			result.settlementError = e.what();
		}
	}
	return result;
}

RewardBundle CombatService::completeCombat(const std::string& sessionId) {
	auto sessionLock = store_->lockFor(sessionId);
	std::lock_guard<std::mutex> guard(*sessionLock);
	return settlement_.settle(sessionId);
}

void CombatService::abandonCombat(const std::string& sessionId) {
	auto sessionLock = store_->lockFor(sessionId);
	std::lock_guard<std::mutex> guard(*sessionLock);

	auto session = store_->get(sessionId);
	if (!session) {
		if (store_->getSettled(sessionId)) {
			std::cout << "[COMBAT] Abandon ignored: session " << sessionId << " is already settled." << std::endl;
			return;
		}
		throw NotFoundError("Combat session", sessionId);
	}

	if (settlementStarted(session->settlement)) {
		std::cout << "[COMBAT] Abandon ignored: settlement of session " << sessionId << " has begun." << std::endl;
		return;
	}

	store_->remove(sessionId);
	std::cout << "[COMBAT] Session " << sessionId << " abandoned by " << session->userId << " ("
		<< statusName(session->status) << "). Rewards forfeited." << std::endl;
}

SessionSummary CombatService::getCombatSession(const std::string& sessionId) {
	return summarize(requireSession(sessionId));
}

std::optional<SessionSummary> CombatService::getUserActiveSession(const std::string& userId) {
	auto sessionId = store_->findActiveSessionForUser(userId);
	if (!sessionId) return std::nullopt;

	auto session = store_->get(*sessionId);
	if (!session) return std::nullopt;
	return summarize(*session);
}

std::size_t CombatService::purgeExpiredSessions() {
	std::size_t dropped = store_->purgeExpired();
	if (dropped > 0) {
		std::cout << "[COMBAT] Expiry sweep dropped " << dropped << " session(s)." << std::endl;
	}
	return dropped;
}
