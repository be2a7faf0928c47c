// File: CombatService.hpp
// Description: The combat session state machine and the operations the
// network layer calls: start, attack, defend, complete, abandon, recover.
#pragma once

#include "CombatConfig.hpp"
#include "CombatRepositories.hpp"
#include "LootProvider.hpp"
#include "RewardSettlement.hpp"
#include "SessionStore.hpp"
#include "WeightedSelector.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// What a client needs to draw (or redraw after reconnecting) a combat.
struct SessionSummary {
	std::string sessionId;
	std::string userId;
	std::string locationId;
	int combatLevel = 1;
	EnemySnapshot enemy;
	PlayerStatSnapshot player;
	int currentPlayerHp = 0;
	int currentEnemyHp = 0;
	int turnNumber = 0;
	CombatStatus status = CombatStatus::Ongoing;
	WeaponBandConfig weaponBands;
	WeaponBandConfig adjustedBands; // what the dial actually shows at this accuracy
	std::chrono::system_clock::time_point expiresAt;
};

struct TurnResult {
	std::string sessionId;
	CombatLogEntry entry;
	double zoneMultiplier = 0.0; // of the zone the player landed (attack) or the enemy landed (defend)
	CombatStatus status = CombatStatus::Ongoing;
	std::optional<RewardBundle> rewards;        // present when this turn ended and settled the combat
	std::optional<std::string> settlementError; // present when automatic settlement failed; completeCombat retries it
};

/**
 * @class CombatService
 * @brief Every action on one session id runs under that session's lock.
 * Reads and writes of session state go through the SessionStore only.
 */
class CombatService
{
public:
	CombatService(std::shared_ptr<SessionStore> store, CombatRepositories repos, CombatConfig config,
		RollFn roll, WallClock clock = nullptr, RewardSettlement::Sleeper sleeper = nullptr);

	/**
	 * @brief Snapshots the player's equipped stats and weapon, picks an enemy
	 * for the location and level, and stores a new Ongoing session.
	 * @throws ValidationError on a bad level, user or location id.
	 * @throws InvalidStateError if the user already has a live session.
	 * @throws NotFoundError if the location has no enemy for this level.
	 */
	SessionSummary startCombat(const std::string& userId, const std::string& locationId, int combatLevel = 1);

	// The player swings; the enemy blocks, then counters if it is still standing.
	TurnResult submitAttack(const std::string& sessionId, double tapDegrees);

	// The enemy swings; the player's tap decides how much is blocked.
	TurnResult submitDefend(const std::string& sessionId, double defenseTapDegrees);

	// Idempotent. Settles on the first call; later calls return the same bundle.
	RewardBundle completeCombat(const std::string& sessionId);

	// Deletes the session without rewards. A logged no-op once settlement has begun.
	void abandonCombat(const std::string& sessionId);

	SessionSummary getCombatSession(const std::string& sessionId);
	std::optional<SessionSummary> getUserActiveSession(const std::string& userId);

	// Called by the server's sweep timer.
	std::size_t purgeExpiredSessions();

private:
	CombatSession requireSession(const std::string& sessionId);
	// NotFound if unknown; InvalidState if Victory/Defeat, settled or not.
	CombatSession requireOngoingSession(const std::string& sessionId);
	SessionSummary summarize(const CombatSession& session) const;
	double nextRoll();
	double rollCritBonus(HitZone zone);
	HitZone rollEnemyZone(double accuracy);
	// Derives status and, on the terminal transition, builds the bundle.
	void concludeTurn(CombatSession& session, CombatLogEntry& entry);
	TurnResult finishTurn(CombatSession& session, const CombatLogEntry& entry, double zoneMultiplier);

	std::shared_ptr<SessionStore> store_;
	CombatRepositories repos_;
	CombatConfig config_;
	RollFn roll_;
	WallClock clock_;
	LootProvider loot_;
	RewardSettlement settlement_;

	std::mutex roll_mutex_;
	std::mutex start_mutex_; // one live session per user
};
