// File: SessionStore.hpp
// Description: Ephemeral keyed storage for combat sessions with TTL expiry,
// per-session locks and the atomic check-and-settle claim.
#pragma once

#include "CombatTypes.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

using WallClock = std::function<std::chrono::system_clock::time_point()>;

enum class SettlementClaim {
	Claimed,        // caller now owns settlement
	AlreadyClaimed, // another caller is inside settlement
	NotTerminal,    // still Ongoing
	NotFound        // missing or expired
};

/**
 * @class SessionStore
 * @brief The only way any component reaches session state. Records are
 * handed out as copies; a change is visible only after put().
 */
class SessionStore
{
public:
	virtual ~SessionStore() = default;

	// Expired records behave exactly like missing ones.
	virtual std::optional<CombatSession> get(const std::string& sessionId) = 0;

	// Insert or replace. Sets expiresAt to now + ttl.
	virtual void put(const CombatSession& session, std::chrono::seconds ttl) = 0;

	virtual bool remove(const std::string& sessionId) = 0;

	virtual std::optional<std::string> findActiveSessionForUser(const std::string& userId) = 0;

	/**
	 * @brief Check-and-settle. Atomically moves a terminal, unclaimed session
	 * into the claimed state. At most one caller can hold the claim.
	 */
	virtual SettlementClaim claimSettlement(const std::string& sessionId) = 0;

	/**
	 * @brief Records the persisted bundle under sessionId, then deletes the
	 * live session, under one lock. The bundle stays readable for ttl.
	 */
	virtual void finishSettlement(const std::string& sessionId, const RewardBundle& bundle, std::chrono::seconds ttl) = 0;

	virtual std::optional<RewardBundle> getSettled(const std::string& sessionId) = 0;

	// Serializes every action on one session id.
	virtual std::shared_ptr<std::mutex> lockFor(const std::string& sessionId) = 0;

	// Drops expired sessions, settled bundles and idle locks of sessions that are gone.
	// Returns the number of live sessions dropped.
	virtual std::size_t purgeExpired() = 0;
};

class InMemorySessionStore : public SessionStore
{
public:
	explicit InMemorySessionStore(WallClock clock = nullptr);

	std::optional<CombatSession> get(const std::string& sessionId) override;
	void put(const CombatSession& session, std::chrono::seconds ttl) override;
	bool remove(const std::string& sessionId) override;
	std::optional<std::string> findActiveSessionForUser(const std::string& userId) override;
	SettlementClaim claimSettlement(const std::string& sessionId) override;
	void finishSettlement(const std::string& sessionId, const RewardBundle& bundle, std::chrono::seconds ttl) override;
	std::optional<RewardBundle> getSettled(const std::string& sessionId) override;
	std::shared_ptr<std::mutex> lockFor(const std::string& sessionId) override;
	std::size_t purgeExpired() override;

	std::size_t size();
	std::size_t lockCount();

private:
	struct SettledEntry {
		RewardBundle bundle;
		std::chrono::system_clock::time_point expiresAt;
	};

	std::chrono::system_clock::time_point now() const;
	// Caller holds mutex_.
	bool eraseIfExpired(std::map<std::string, CombatSession>::iterator it);

	WallClock clock_;
	std::mutex mutex_;
	std::map<std::string, CombatSession> sessions_;
	std::map<std::string, SettledEntry> settled_;
	std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};
