// File: SessionStore.cpp
// Description: Mutex-guarded in-process session store.
#include "SessionStore.hpp"
#include <iostream>

InMemorySessionStore::InMemorySessionStore(WallClock clock)
	: clock_(std::move(clock))
{
}

std::chrono::system_clock::time_point InMemorySessionStore::now() const {
	return clock_ ? clock_() : std::chrono::system_clock::now();
}

bool InMemorySessionStore::eraseIfExpired(std::map<std::string, CombatSession>::iterator it) {
	if (now() < it->second.expiresAt) return false;
	std::cout << "[SESSION STORE] Session " << it->first << " expired." << std::endl;
	locks_.erase(it->first);
	sessions_.erase(it);
	return true;
}

std::optional<CombatSession> InMemorySessionStore::get(const std::string& sessionId) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = sessions_.find(sessionId);
	if (it == sessions_.end() || eraseIfExpired(it)) {
		return std::nullopt;
	}
	return it->second;
}

void InMemorySessionStore::put(const CombatSession& session, std::chrono::seconds ttl) {
	std::lock_guard<std::mutex> lock(mutex_);
	CombatSession stored = session;
	stored.expiresAt = now() + ttl;
	sessions_[stored.sessionId] = std::move(stored);
}

bool InMemorySessionStore::remove(const std::string& sessionId) {
	std::lock_guard<std::mutex> lock(mutex_);
	locks_.erase(sessionId);
	return sessions_.erase(sessionId) > 0;
}

std::optional<std::string> InMemorySessionStore::findActiveSessionForUser(const std::string& userId) {
	std::lock_guard<std::mutex> lock(mutex_);
	for (auto it = sessions_.begin(); it != sessions_.end(); ) {
		auto current = it++;
		if (current->second.userId != userId) continue;
		if (eraseIfExpired(current)) continue;
		return current->first;
	}
	return std::nullopt;
}

SettlementClaim InMemorySessionStore::claimSettlement(const std::string& sessionId) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = sessions_.find(sessionId);
	if (it == sessions_.end() || eraseIfExpired(it)) {
		return SettlementClaim::NotFound;
	}

	CombatSession& session = it->second;
	if (!session.isTerminal()) return SettlementClaim::NotTerminal;
	if (session.settlement.claimed) return SettlementClaim::AlreadyClaimed;

	session.settlement.claimed = true;
	return SettlementClaim::Claimed;
}

void InMemorySessionStore::finishSettlement(const std::string& sessionId, const RewardBundle& bundle, std::chrono::seconds ttl) {
	std::lock_guard<std::mutex> lock(mutex_);
	settled_[sessionId] = SettledEntry{ bundle, now() + ttl };
	sessions_.erase(sessionId);
	locks_.erase(sessionId);
}

std::optional<RewardBundle> InMemorySessionStore::getSettled(const std::string& sessionId) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = settled_.find(sessionId);
	if (it == settled_.end()) return std::nullopt;
	if (now() >= it->second.expiresAt) {
		settled_.erase(it);
		return std::nullopt;
	}
	return it->second.bundle;
}

std::shared_ptr<std::mutex> InMemorySessionStore::lockFor(const std::string& sessionId) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto& slot = locks_[sessionId];
	if (!slot) slot = std::make_shared<std::mutex>();
	return slot;
}

std::size_t InMemorySessionStore::purgeExpired() {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto current = now();

	std::size_t dropped = 0;
	for (auto it = sessions_.begin(); it != sessions_.end(); ) {
		if (current >= it->second.expiresAt) {
			locks_.erase(it->first);
			it = sessions_.erase(it);
			++dropped;
		}
		else {
			++it;
		}
	}
	for (auto it = settled_.begin(); it != settled_.end(); ) {
		if (current >= it->second.expiresAt) it = settled_.erase(it);
		else ++it;
	}
	// Locks handed out for unknown, settled or expired ids. Only the map holds them.
	for (auto it = locks_.begin(); it != locks_.end(); ) {
		if (it->second.use_count() == 1 && sessions_.find(it->first) == sessions_.end()) it = locks_.erase(it);
		else ++it;
	}
	return dropped;
}

std::size_t InMemorySessionStore::size() {
	std::lock_guard<std::mutex> lock(mutex_);
	return sessions_.size();
}

std::size_t InMemorySessionStore::lockCount() {
	std::lock_guard<std::mutex> lock(mutex_);
	return locks_.size();
}
