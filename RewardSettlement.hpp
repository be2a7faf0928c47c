// File: RewardSettlement.hpp
// Description: The one code path that applies a terminal session's rewards
// to persistent player state and then retires the session.
#pragma once

#include "CombatConfig.hpp"
#include "CombatRepositories.hpp"
#include "SessionStore.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

static const char* const GOLD_CURRENCY_CODE = "GOLD";
static const char* const COMBAT_VICTORY_SOURCE = "combat_victory";

class RewardSettlement
{
public:
	using Sleeper = std::function<void(std::chrono::milliseconds)>;

	RewardSettlement(std::shared_ptr<SessionStore> store, CombatRepositories repos, CombatConfig config,
		Sleeper sleeper = nullptr);

	/**
	 * @brief Settles sessionId exactly once. The caller must hold the
	 * session's lock from SessionStore::lockFor.
	 *
	 * Order: materials, items, currency, experience, history, then the bundle
	 * goes to the settled ledger and the live session is deleted. Each step is
	 * written back to the session before the next runs, so a retry resumes
	 * where the last attempt stopped. A session that was already settled
	 * returns the cached bundle.
	 *
	 * @throws NotFoundError if the session never existed or has expired.
	 * @throws InvalidStateError if the session is still ongoing.
	 * @throws ExternalDependencyError if a step failed; the session stays
	 * terminal and unsettled.
	 */
	RewardBundle settle(const std::string& sessionId);

private:
	// Runs fn, retrying transient ExternalDependencyErrors with exponential backoff.
	template <typename Fn>
	auto withRetry(const std::string& sessionId, SettlementStep step, Fn&& fn) -> decltype(fn());

	void applySteps(CombatSession& session);
	void checkpoint(CombatSession& session);
	void release(CombatSession& session);

	std::shared_ptr<SessionStore> store_;
	CombatRepositories repos_;
	CombatConfig config_;
	Sleeper sleeper_;
};
