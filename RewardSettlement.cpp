// File: RewardSettlement.cpp
// Description: Step-tracked, retry-safe reward settlement.
#include "RewardSettlement.hpp"
#include "CombatErrors.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

RewardSettlement::RewardSettlement(std::shared_ptr<SessionStore> store, CombatRepositories repos,
	CombatConfig config, Sleeper sleeper)
	: store_(std::move(store))
	, repos_(std::move(repos))
	, config_(std::move(config))
	, sleeper_(std::move(sleeper))
{
	if (!sleeper_) {
		sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
	}
}

template <typename Fn>
auto RewardSettlement::withRetry(const std::string& sessionId, SettlementStep step, Fn&& fn) -> decltype(fn()) {
	const int maxAttempts = std::min(std::max(1, config_.settlementRetryAttempts), MAX_SETTLEMENT_RETRY_ATTEMPTS);
	for (int attempt = 1; ; ++attempt) {
		try {
			return fn();
		}
		catch (const ExternalDependencyError& e) {
			if (!e.transient() || attempt >= maxAttempts) throw;

			std::chrono::milliseconds delay(static_cast<long long>(config_.settlementRetryBackoffMs) << (attempt - 1));
			std::cerr << "[SETTLEMENT] Transient failure in " << stepName(step) << " step for " << sessionId
				<< " (attempt " << attempt << "/" << maxAttempts << "): " << e.what()
				<< ". Retrying in " << delay.count() << "ms." << std::endl;
			sleeper_(delay);
		}
	}
}

void RewardSettlement::checkpoint(CombatSession& session) {
	store_->put(session, std::chrono::seconds(config_.sessionTtlSeconds));
}

void RewardSettlement::release(CombatSession& session) {
	session.settlement.claimed = false;
	checkpoint(session);
}

RewardBundle RewardSettlement::settle(const std::string& sessionId) {
	switch (store_->claimSettlement(sessionId)) {
	case SettlementClaim::Claimed:
		break;
	case SettlementClaim::NotFound: {
		auto settled = store_->getSettled(sessionId);
		if (settled) {
			std::cout << "[SETTLEMENT] Session " << sessionId << " already settled. Returning recorded rewards." << std::endl;
			return *settled;
		}
		throw NotFoundError("Combat session", sessionId);
	}
	case SettlementClaim::NotTerminal:
		throw InvalidStateError("Combat session " + sessionId + " is still ongoing");
	case SettlementClaim::AlreadyClaimed:
		throw InvalidStateError("Settlement already in progress for combat session " + sessionId);
	}

	auto current = store_->get(sessionId);
	if (!current) {
		throw NotFoundError("Combat session", sessionId);
	}
	CombatSession session = *current;

	if (!session.pendingRewards) {
		release(session);
		throw InvalidStateError("Combat session " + sessionId + " reached " + statusName(session.status) + " without a reward bundle");
	}

	session.settlement.attempts += 1;
	std::cout << "[SETTLEMENT] Settling " << sessionId << " (" << outcomeName(session.pendingRewards->outcome)
		<< ", attempt " << session.settlement.attempts << ")" << std::endl;

	try {
		checkpoint(session);
		applySteps(session);
	}
	catch (const ExternalDependencyError& e) {
		release(session);
		std::cerr << "[SETTLEMENT FAILED] " << sessionId << ": " << e.what() << std::endl;
		throw ExternalDependencyError("Reward settlement for combat session " + sessionId + " failed: " + e.what() +
			". Rewards may be partially applied; retrying completeCombat is safe.", e.transient());
	}
	catch (const CombatError& e) {
		release(session);
		std::cerr << "[SETTLEMENT FAILED] " << sessionId << ": " << e.what() << std::endl;
		throw;
	}
	catch (const std::exception& e) {
		release(session);
		std::cerr << "[SETTLEMENT FAILED] " << sessionId << ": " << e.what() << std::endl;
		throw ExternalDependencyError("Reward settlement for combat session " + sessionId + " failed: " + e.what() +
			". Rewards may be partially applied; retrying completeCombat is safe.", false);
	}

	RewardBundle bundle = *session.pendingRewards;
	store_->finishSettlement(sessionId, bundle, std::chrono::seconds(config_.sessionTtlSeconds));

	std::cout << "[SETTLEMENT] Session " << sessionId << " settled: " << bundle.gold() << " gold, "
		<< bundle.materials().size() << " material(s), " << bundle.items().size() << " item(s), "
		<< bundle.experience() << " xp." << std::endl;
	return bundle;
}

void RewardSettlement::applySteps(CombatSession& session) {
	const std::string& sessionId = session.sessionId;
	const std::string& userId = session.userId;
	SettlementProgress& progress = session.settlement;
	RewardBundle& bundle = *session.pendingRewards;

	if (bundle.victory) {
		VictoryRewards& rewards = *bundle.victory;

		// Materials: upsert per stack. materialsApplied survives a failed attempt.
		if (!progress.has(SettlementStep::Materials)) {
			while (progress.materialsApplied < rewards.materials.size()) {
				const MaterialReward& m = rewards.materials[progress.materialsApplied];
				int stack = withRetry(sessionId, SettlementStep::Materials, [&]() {
					return repos_.materials->incrementStack(userId, m.materialId, m.styleId, m.quantity);
				});
				std::cout << "[SETTLEMENT] +" << m.quantity << " " << m.name << " (" << m.styleId
					<< "), stack now " << stack << std::endl;
				progress.materialsApplied += 1;
				checkpoint(session);
			}
			progress.mark(SettlementStep::Materials);
			checkpoint(session);
		}

		// Items: one new instance each, at the combat's level.
		if (!progress.has(SettlementStep::Items)) {
			while (progress.createdItemIds.size() < rewards.items.size()) {
				ItemReward& item = rewards.items[progress.createdItemIds.size()];
				CreatedItem created = withRetry(sessionId, SettlementStep::Items, [&]() {
					return repos_.items->create(userId, item.itemTypeId, session.combatLevel);
				});
				item.itemInstanceId = created.id;
				progress.createdItemIds.push_back(created.id);
				std::cout << "[SETTLEMENT] Created item " << created.id << " (" << item.name << ", "
					<< item.rarity << ")" << std::endl;
				checkpoint(session);
			}
			progress.mark(SettlementStep::Items);
			checkpoint(session);
		}

		if (!progress.has(SettlementStep::Currency)) {
			if (rewards.gold > 0) {
				CurrencyReceipt receipt = withRetry(sessionId, SettlementStep::Currency, [&]() {
					return repos_.currency->applyDelta(userId, GOLD_CURRENCY_CODE, rewards.gold,
						COMBAT_VICTORY_SOURCE, sessionId);
				});
				std::cout << "[SETTLEMENT] Gold " << receipt.previousBalance << " -> " << receipt.newBalance
					<< " (tx " << receipt.transactionId << ")" << std::endl;
			}
			progress.mark(SettlementStep::Currency);
			checkpoint(session);
		}

		if (!progress.has(SettlementStep::Experience)) {
			if (rewards.experience > 0) {
				bundle.progression = withRetry(sessionId, SettlementStep::Experience, [&]() {
					return repos_.progression->addExperience(userId, rewards.experience);
				});
				if (bundle.progression->leveledUp) {
					std::cout << "[SETTLEMENT] " << userId << " reached level " << bundle.progression->newLevel << std::endl;
				}
			}
			progress.mark(SettlementStep::Experience);
			checkpoint(session);
		}
	}

	if (!progress.has(SettlementStep::History)) {
		bundle.combatHistory = withRetry(sessionId, SettlementStep::History, [&]() {
			return repos_.history->upsert(userId, session.locationId, bundle.outcome);
		});
		progress.mark(SettlementStep::History);
		checkpoint(session);
	}
}
