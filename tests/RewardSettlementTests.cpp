#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../CombatErrors.hpp"
#include "../RewardSettlement.hpp"
#include "FakeRepositories.hpp"

static const std::chrono::seconds TTL(900);

static VictoryRewards standardLoot() {
    VictoryRewards r;
    r.gold = 10;
    r.experience = 20;
    r.materials.push_back(MaterialReward{ "iron", "Iron Ore", "shadow", 1 });
    r.materials.push_back(MaterialReward{ "wood", "Oak Wood", "shadow", 1 });
    ItemReward sword;
    sword.itemTypeId = "sword";
    sword.name = "Short Sword";
    sword.category = "weapon";
    sword.styleId = "shadow";
    r.items.push_back(sword);
    return r;
}

static CombatSession terminalSession(const std::string& id, RewardBundle bundle) {
    CombatSession s;
    s.sessionId = id;
    s.userId = "u1";
    s.locationId = "park-1";
    s.status = bundle.outcome == CombatOutcome::Victory ? CombatStatus::Victory : CombatStatus::Defeat;
    s.currentEnemyHp = s.status == CombatStatus::Victory ? 0 : 20;
    s.currentPlayerHp = s.status == CombatStatus::Victory ? 40 : 0;
    s.pendingRewards = bundle;
    return s;
}

struct Harness {
    FakeWorld world = makeStandardWorld();
    std::shared_ptr<InMemorySessionStore> store = std::make_shared<InMemorySessionStore>();
    std::vector<std::chrono::milliseconds> delays;
    CombatConfig config;

    RewardSettlement settlement() {
        return RewardSettlement(store, world.repos(), config,
            [this](std::chrono::milliseconds d) { delays.push_back(d); });
    }
};

template <typename E, typename Fn>
static bool throwsA(Fn&& fn) {
    try {
        fn();
    }
    catch (const E&) {
        return true;
    }
    return false;
}

int main() {
    // A victory lands every reward once, then retires the session.
    {
        Harness h;
        h.store->put(terminalSession("s1", RewardBundle::forVictory(standardLoot())), TTL);
        RewardSettlement settlement = h.settlement();

        RewardBundle bundle = settlement.settle("s1");
        assert(h.world.materials->stack("u1", "iron", "shadow") == 1);
        assert(h.world.materials->stack("u1", "wood", "shadow") == 1);
        assert(h.world.items->created.size() == 1);
        assert(bundle.items()[0].itemInstanceId == "item-1");
        assert(h.world.currency->balance("u1", "GOLD") == 10);
        assert(h.world.currency->transactions.size() == 1);
        assert(h.world.currency->transactions[0].sourceType == "combat_victory");
        assert(h.world.currency->transactions[0].sourceId == "s1");
        assert(bundle.progression && bundle.progression->experienceAdded == 20);
        assert(bundle.combatHistory && bundle.combatHistory->victories == 1);

        assert(!h.store->get("s1"));
        assert(h.store->getSettled("s1"));

        // Settling again replays the recorded bundle and touches nothing.
        RewardBundle again = settlement.settle("s1");
        assert(again.gold() == 10);
        assert(again.items()[0].itemInstanceId == "item-1");
        assert(h.world.currency->transactions.size() == 1);
        assert(h.world.items->created.size() == 1);
        assert(h.world.materials->stack("u1", "iron", "shadow") == 1);
        assert(h.world.history->records.at({ "u1", "park-1" }).totalAttempts == 1);
    }

    // A defeat records history and nothing else.
    {
        Harness h;
        h.store->put(terminalSession("s1", RewardBundle::forDefeat()), TTL);
        RewardBundle bundle = h.settlement().settle("s1");
        assert(bundle.gold() == 0);
        assert(bundle.materials().empty() && bundle.items().empty());
        assert(!bundle.progression);
        assert(bundle.combatHistory && bundle.combatHistory->defeats == 1);
        assert(h.world.currency->transactions.empty());
        assert(h.world.progression->failures.calls == 0);
        assert(h.world.materials->stacks.empty());
    }

    // A failure after materials and items: the retry resumes at currency without double credit.
    {
        Harness h;
        h.world.currency->failures.failOnCalls = { 1 };
        h.store->put(terminalSession("s1", RewardBundle::forVictory(standardLoot())), TTL);
        RewardSettlement settlement = h.settlement();

        bool threw = false;
        try {
            settlement.settle("s1");
        }
        catch (const ExternalDependencyError& e) {
            threw = true;
            assert(std::string(e.what()).find("retrying completeCombat is safe") != std::string::npos);
        }
        assert(threw);

        auto parked = h.store->get("s1");
        assert(parked);
        assert(parked->status == CombatStatus::Victory);
        assert(!parked->settlement.claimed);
        assert(parked->settlement.has(SettlementStep::Materials));
        assert(parked->settlement.has(SettlementStep::Items));
        assert(!parked->settlement.has(SettlementStep::Currency));
        assert(h.world.currency->balance("u1", "GOLD") == 0);

        RewardBundle bundle = settlement.settle("s1");
        assert(h.world.materials->stack("u1", "iron", "shadow") == 1);
        assert(h.world.materials->stack("u1", "wood", "shadow") == 1);
        assert(h.world.items->created.size() == 1);
        assert(bundle.items()[0].itemInstanceId == "item-1");
        assert(h.world.currency->balance("u1", "GOLD") == 10);
        assert(h.world.currency->transactions.size() == 1);
        assert(bundle.combatHistory->totalAttempts == 1);
    }

    // A failure between two material stacks: the first is not granted twice.
    {
        Harness h;
        h.world.materials->incrementFailures.failOnCalls = { 2 };
        h.store->put(terminalSession("s1", RewardBundle::forVictory(standardLoot())), TTL);
        RewardSettlement settlement = h.settlement();

        assert(throwsA<ExternalDependencyError>([&] { settlement.settle("s1"); }));
        assert(h.world.materials->stack("u1", "iron", "shadow") == 1);
        assert(h.world.materials->stack("u1", "wood", "shadow") == 0);
        assert(h.store->get("s1")->settlement.materialsApplied == 1);

        settlement.settle("s1");
        assert(h.world.materials->stack("u1", "iron", "shadow") == 1);
        assert(h.world.materials->stack("u1", "wood", "shadow") == 1);
        assert(h.world.materials->incrementFailures.calls == 3);
    }

    // A failure between two item creations: exactly two items exist afterwards.
    {
        Harness h;
        VictoryRewards loot = standardLoot();
        loot.items.push_back(loot.items.front());
        h.world.items->createFailures.failOnCalls = { 2 };
        h.store->put(terminalSession("s1", RewardBundle::forVictory(loot)), TTL);
        RewardSettlement settlement = h.settlement();

        assert(throwsA<ExternalDependencyError>([&] { settlement.settle("s1"); }));
        assert(h.world.items->created.size() == 1);

        RewardBundle bundle = settlement.settle("s1");
        assert(h.world.items->created.size() == 2);
        assert(bundle.items()[0].itemInstanceId == "item-1");
        assert(bundle.items()[1].itemInstanceId == "item-2");
    }

    // Transient failures are retried in place with doubling backoff.
    {
        Harness h;
        h.world.currency->failures.failOnCalls = { 1, 2 };
        h.world.currency->failures.transient = true;
        h.store->put(terminalSession("s1", RewardBundle::forVictory(standardLoot())), TTL);

        RewardBundle bundle = h.settlement().settle("s1");
        assert(bundle.gold() == 10);
        assert(h.world.currency->balance("u1", "GOLD") == 10);
        assert(h.delays.size() == 2);
        assert(h.delays[0] == std::chrono::milliseconds(50));
        assert(h.delays[1] == std::chrono::milliseconds(100));
        assert(!h.store->get("s1"));
    }

    // Retries run out: the error surfaces as transient and the session stays settleable.
    {
        Harness h;
        h.world.currency->failures.failOnCalls = { 1, 2, 3 };
        h.world.currency->failures.transient = true;
        h.store->put(terminalSession("s1", RewardBundle::forVictory(standardLoot())), TTL);
        RewardSettlement settlement = h.settlement();

        bool transient = false;
        try {
            settlement.settle("s1");
        }
        catch (const ExternalDependencyError& e) {
            transient = e.transient();
        }
        assert(transient);
        assert(h.delays.size() == 2);
        assert(h.store->get("s1"));

        settlement.settle("s1");
        assert(h.world.currency->balance("u1", "GOLD") == 10);
    }

    // No gold, no ledger row.
    {
        Harness h;
        VictoryRewards loot = standardLoot();
        loot.gold = 0;
        h.store->put(terminalSession("s1", RewardBundle::forVictory(loot)), TTL);
        h.settlement().settle("s1");
        assert(h.world.currency->failures.calls == 0);
        assert(h.world.currency->transactions.empty());
    }

    // Refusals: still ongoing, unknown, or someone else is settling.
    {
        Harness h;
        CombatSession live = terminalSession("live", RewardBundle::forDefeat());
        live.status = CombatStatus::Ongoing;
        live.pendingRewards.reset();
        h.store->put(live, TTL);

        CombatSession busy = terminalSession("busy", RewardBundle::forDefeat());
        busy.settlement.claimed = true;
        h.store->put(busy, TTL);

        RewardSettlement settlement = h.settlement();
        assert(throwsA<InvalidStateError>([&] { settlement.settle("live"); }));
        assert(throwsA<NotFoundError>([&] { settlement.settle("ghost"); }));
        assert(throwsA<InvalidStateError>([&] { settlement.settle("busy"); }));
        assert(h.world.history->records.empty());
    }

    return 0;
}
