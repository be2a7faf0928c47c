#include <cassert>
#include <chrono>
#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "../CombatErrors.hpp"
#include "../CombatService.hpp"
#include "FakeRepositories.hpp"

// Standard world, seen from the dice:
//   player dial  injure [0,5) miss [5,50) graze [50,110) normal [110,310) crit [310,360)
//   enemy dial   injure [0,10) miss [10,60) graze [60,140) normal [140,310) crit [310,360)
// so an enemy roll of 0.01 is injure (blocks nothing) and 0.5 is normal.
struct Arena {
    FakeWorld world = makeStandardWorld();
    TestClock clock;
    CombatConfig config;
    std::shared_ptr<InMemorySessionStore> store;
    std::unique_ptr<CombatService> service;

    Arena() { config.settlementRetryBackoffMs = 0; }

    CombatService& open(RollFn roll) {
        store = std::make_shared<InMemorySessionStore>(clock.fn());
        service = std::make_unique<CombatService>(store, world.repos(), config, std::move(roll), clock.fn(),
            [](std::chrono::milliseconds) {});
        return *service;
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

// enemy pick, enemy block (injure), three drops, picks iron/wood/sword, common rarity
static const std::vector<double> ONE_HIT_VICTORY{ 0.0, 0.01, 0.99, 0.0, 0.0, 0.0, 0.0 };

int main() {
    // Start snapshots both sides and stores an Ongoing session.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0 }));
        SessionSummary s = svc.startCombat("u1", "park-1", 1);

        assert(s.sessionId.size() == 32);
        assert(s.enemy.enemyTypeId == "goblin" && s.enemy.hp == 50);
        assert(s.currentEnemyHp == 50 && s.currentPlayerHp == 100);
        assert(s.player.atk == 80);
        assert(s.turnNumber == 0);
        assert(s.status == CombatStatus::Ongoing);
        assert(s.weaponBands.degNormal == 200.0);
        assert(s.expiresAt == *a.clock.now + std::chrono::seconds(900));

        auto active = svc.getUserActiveSession("u1");
        assert(active && active->sessionId == s.sessionId);

        // Equipment changes after start never reach the session.
        a.world.playerStats->stats["u1"].atk = 1;
        assert(svc.getCombatSession(s.sessionId).player.atk == 80);
    }

    // No weapon equipped: the default dial is used.
    {
        Arena a;
        a.world.playerStats->bands.clear();
        SessionSummary s = a.open(scriptedRoll({ 0.0 })).startCombat("u1", "park-1", 1);
        assert(s.weaponBands.degInjure == a.config.defaultWeaponBands.degInjure);
        assert(s.weaponBands.degNormal == a.config.defaultWeaponBands.degNormal);
    }

    // One hit kills: victory, loot, and automatic settlement in the same turn.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll(ONE_HIT_VICTORY));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        TurnResult r = svc.submitAttack(id, 200.0);
        assert(r.status == CombatStatus::Victory);
        assert(r.entry.turn == 1);
        assert(r.entry.playerZone == HitZone::Normal);
        assert(r.zoneMultiplier == 1.0);
        assert(r.entry.enemyDefenseZone == HitZone::Injure);
        assert(!r.entry.enemyAttackZone);
        assert(r.entry.damageToEnemy == 60);
        assert(r.entry.enemyHp == 0 && r.entry.playerHp == 100);
        assert(!r.settlementError);

        assert(r.rewards);
        assert(r.rewards->outcome == CombatOutcome::Victory);
        assert(r.rewards->gold() > 0);
        assert(r.rewards->materials().size() == 2);
        assert(r.rewards->items().size() == 1);
        assert(r.rewards->combatHistory->victories == 1);
        assert(a.world.currency->balance("u1", "GOLD") == 10);
        assert(a.world.materials->stack("u1", "iron", "normal") == 1);

        // The session is retired; completing again hands back the same bundle.
        assert(throwsA<NotFoundError>([&] { svc.getCombatSession(id); }));
        assert(!svc.getUserActiveSession("u1"));
        RewardBundle again = svc.completeCombat(id);
        assert(again.gold() == 10);
        assert(a.world.currency->transactions.size() == 1);

        // The user is free to fight again.
        assert(!svc.startCombat("u1", "park-1", 1).sessionId.empty());
    }

    // Manual completion is idempotent.
    {
        Arena a;
        a.config.autoSettleOnTerminal = false;
        CombatService& svc = a.open(scriptedRoll(ONE_HIT_VICTORY));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        TurnResult r = svc.submitAttack(id, 200.0);
        assert(r.status == CombatStatus::Victory);
        assert(!r.rewards);
        assert(a.world.materials->stacks.empty());

        RewardBundle first = svc.completeCombat(id);
        assert(a.world.materials->stack("u1", "iron", "normal") == 1);
        RewardBundle second = svc.completeCombat(id);
        assert(a.world.materials->stack("u1", "iron", "normal") == 1);
        assert(a.world.items->created.size() == 1);
        assert(a.world.currency->transactions.size() == 1);
        assert(first.gold() == second.gold());
        assert(second.items()[0].itemInstanceId == first.items()[0].itemInstanceId);
    }

    // A finished session refuses further turns and is left exactly as it was.
    {
        Arena a;
        a.config.autoSettleOnTerminal = false;
        CombatService& svc = a.open(scriptedRoll(ONE_HIT_VICTORY));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;
        svc.submitAttack(id, 200.0);

        assert(throwsA<InvalidStateError>([&] { svc.submitAttack(id, 200.0); }));
        assert(throwsA<InvalidStateError>([&] { svc.submitDefend(id, 200.0); }));

        SessionSummary s = svc.getCombatSession(id);
        assert(s.status == CombatStatus::Victory);
        assert(s.turnNumber == 1);
        assert(s.currentEnemyHp == 0 && s.currentPlayerHp == 100);
        assert(a.store->get(id)->combatLog.size() == 1);
    }

    // With the default automatic settlement, a finished and retired session still refuses turns as ended.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll(ONE_HIT_VICTORY));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;
        TurnResult r = svc.submitAttack(id, 200.0);
        assert(r.status == CombatStatus::Victory && r.rewards);
        assert(!a.store->get(id));

        assert(throwsA<InvalidStateError>([&] { svc.submitAttack(id, 200.0); }));
        assert(throwsA<InvalidStateError>([&] { svc.submitDefend(id, 200.0); }));
        assert(a.world.currency->transactions.size() == 1);
        assert(svc.completeCombat(id).gold() == 10);

        // Ids that never existed are still unknown.
        assert(throwsA<NotFoundError>([&] { svc.submitAttack("no-such-session", 200.0); }));
        assert(throwsA<NotFoundError>([&] { svc.submitDefend("no-such-session", 200.0); }));

        // Once the settled record expires, the id is simply unknown.
        a.clock.advance(std::chrono::seconds(901));
        assert(throwsA<NotFoundError>([&] { svc.submitAttack(id, 200.0); }));

        // The sweep reclaims the locks those calls created.
        svc.purgeExpiredSessions();
        assert(a.store->lockCount() == 0);
    }

    // Completing a live combat is refused.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0 }));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;
        assert(throwsA<InvalidStateError>([&] { svc.completeCombat(id); }));
        assert(throwsA<NotFoundError>([&] { svc.completeCombat("no-such-session"); }));
    }

    // Defeat by counterattack: no gold, no drops, one more defeat on record.
    {
        Arena a;
        a.world.playerStats->stats["u1"] = PlayerStatSnapshot{ 1, 0, 10, 0.0 };
        a.world.enemies->types["goblin"].baseAtk = 50;
        CombatService& svc = a.open(scriptedRoll({ 0.0, 0.01, 0.5 }));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        TurnResult r = svc.submitAttack(id, 200.0);
        assert(r.entry.damageToEnemy == 0);
        assert(r.entry.enemyAttackZone == HitZone::Normal);
        assert(r.entry.damageToPlayer == 50);
        assert(r.entry.playerHp == 0 && r.entry.enemyHp == 50);
        assert(r.status == CombatStatus::Defeat);

        assert(r.rewards);
        assert(r.rewards->outcome == CombatOutcome::Defeat);
        assert(r.rewards->gold() == 0);
        assert(r.rewards->materials().empty() && r.rewards->items().empty());
        assert(r.rewards->combatHistory->defeats == 1);
        assert(a.world.currency->transactions.empty());
        assert(a.world.materials->stacks.empty());
    }

    // A tap in the miss band deals nothing; the enemy still counters.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0, 0.5, 0.5 }));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        TurnResult r = svc.submitAttack(id, 10.0);
        assert(r.entry.playerZone == HitZone::Miss);
        assert(r.zoneMultiplier == 0.0);
        assert(r.entry.damageToEnemy == 0);
        assert(r.entry.enemyHp == 50);
        assert(r.entry.enemyAttackZone == HitZone::Normal);
        assert(r.entry.damageToPlayer == 5);
        assert(r.entry.playerHp == 95);
        assert(r.status == CombatStatus::Ongoing);
    }

    // A crit carries its rolled bonus into the damage.
    {
        Arena a;
        a.config.autoSettleOnTerminal = false;
        CombatService& svc = a.open(scriptedRoll({ 0.0, 0.5, 0.01 }));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        TurnResult r = svc.submitAttack(id, 330.0);
        assert(r.entry.playerZone == HitZone::Crit);
        assert(std::fabs(r.entry.critBonus - 0.2) < 1e-9);
        assert(std::fabs(r.zoneMultiplier - 1.8) < 1e-9);
        assert(r.entry.damageToEnemy == 124);
        assert(r.status == CombatStatus::Victory);
    }

    // Tapping the injure band hurts the player, spares the enemy and skips the counter.
    {
        Arena a;
        auto calls = std::make_shared<int>(0);
        RollFn inner = scriptedRoll({ 0.0 });
        CombatService& svc = a.open([calls, inner]() { ++*calls; return inner(); });
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;
        assert(*calls == 1);

        TurnResult r = svc.submitAttack(id, 2.0);
        assert(r.entry.playerZone == HitZone::Injure);
        assert(r.entry.playerSelfDamage == 80);
        assert(r.entry.damageToEnemy == 0);
        assert(!r.entry.enemyDefenseZone && !r.entry.enemyAttackZone);
        assert(r.entry.playerHp == 20 && r.entry.enemyHp == 50);
        assert(*calls == 1);
    }

    // Defending: the block zone decides how much of the enemy's swing lands.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0, 0.5, 0.5, 0.01 }));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        // Enemy normal swing: 10 atk - 5 def = 5, a crit block lets 1 through.
        TurnResult crit = svc.submitDefend(id, 330.0);
        assert(crit.entry.action == CombatAction::Defend);
        assert(crit.entry.playerZone == HitZone::Crit);
        assert(crit.entry.enemyAttackZone == HitZone::Normal);
        assert(crit.entry.damageToPlayer == 1 && crit.entry.damageBlocked == 4);
        assert(crit.entry.playerHp == 99);

        // Blocking in the injure band stops nothing.
        TurnResult open = svc.submitDefend(id, 2.0);
        assert(open.entry.damageToPlayer == 5 && open.entry.damageBlocked == 0);
        assert(open.entry.playerHp == 94);

        // The enemy fumbles its swing and takes the backlash.
        TurnResult fumble = svc.submitDefend(id, 200.0);
        assert(fumble.entry.enemyAttackZone == HitZone::Injure);
        assert(fumble.entry.enemySelfDamage == 10);
        assert(fumble.entry.damageToPlayer == 0);
        assert(fumble.entry.enemyHp == 40 && fumble.entry.playerHp == 94);

        SessionSummary s = svc.getCombatSession(id);
        assert(s.turnNumber == 3);
        assert(a.store->get(id)->combatLog.size() == 3);
    }

    // Bad input is rejected before anything changes.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0 }));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        assert(throwsA<ValidationError>([&] { svc.submitAttack(id, 360.0); }));
        assert(throwsA<ValidationError>([&] { svc.submitAttack(id, -1.0); }));
        assert(throwsA<ValidationError>([&] { svc.submitDefend(id, std::nan("")); }));
        assert(svc.getCombatSession(id).turnNumber == 0);
        assert(throwsA<NotFoundError>([&] { svc.submitAttack("no-such-session", 100.0); }));

        assert(throwsA<ValidationError>([&] { svc.startCombat("u2", "park-1", 0); }));
        assert(throwsA<ValidationError>([&] { svc.startCombat("u2", "park-1", 101); }));
        assert(throwsA<ValidationError>([&] { svc.startCombat("", "park-1", 1); }));
        assert(throwsA<ValidationError>([&] { svc.startCombat("u2", "", 1); }));
    }

    // Unknown location, or nothing to fight at this level.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0 }));
        assert(throwsA<NotFoundError>([&] { svc.startCombat("u1", "nowhere", 1); }));
        assert(throwsA<NotFoundError>([&] { svc.startCombat("u1", "park-1", 2); }));
        assert(!svc.getUserActiveSession("u1"));
    }

    // One live combat per user.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0 }));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;
        assert(throwsA<InvalidStateError>([&] { svc.startCombat("u1", "park-1", 1); }));

        svc.abandonCombat(id);
        assert(throwsA<NotFoundError>([&] { svc.getCombatSession(id); }));
        assert(throwsA<NotFoundError>([&] { svc.abandonCombat(id); }));
        assert(svc.startCombat("u1", "park-1", 1).sessionId != id);
    }

    // Sessions expire after 15 idle minutes; every turn pushes the deadline out.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0, 0.5 }));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        a.clock.advance(std::chrono::seconds(800));
        svc.submitAttack(id, 2.0);
        a.clock.advance(std::chrono::seconds(800));
        assert(svc.getCombatSession(id).turnNumber == 1);

        a.clock.advance(std::chrono::seconds(101));
        assert(throwsA<NotFoundError>([&] { svc.submitAttack(id, 200.0); }));
        assert(!svc.getUserActiveSession("u1"));
        assert(!svc.startCombat("u1", "park-1", 1).sessionId.empty());
    }

    // The sweep clears expired sessions.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll({ 0.0 }));
        svc.startCombat("u1", "park-1", 1);
        assert(svc.purgeExpiredSessions() == 0);
        a.clock.advance(std::chrono::seconds(901));
        assert(svc.purgeExpiredSessions() == 1);
        assert(a.store->size() == 0);
    }

    // Abandon is ignored once rewards have been handed out.
    {
        Arena a;
        CombatService& svc = a.open(scriptedRoll(ONE_HIT_VICTORY));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;
        svc.submitAttack(id, 200.0);

        svc.abandonCombat(id);
        assert(svc.completeCombat(id).gold() == 10);
        assert(a.world.currency->balance("u1", "GOLD") == 10);
    }

    // A failed automatic settlement is reported on the turn; abandon cannot discard
    // half-applied rewards; completeCombat finishes the job.
    {
        Arena a;
        a.world.currency->failures.failOnCalls = { 1 };
        CombatService& svc = a.open(scriptedRoll(ONE_HIT_VICTORY));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        TurnResult r = svc.submitAttack(id, 200.0);
        assert(r.status == CombatStatus::Victory);
        assert(!r.rewards);
        assert(r.settlementError);
        assert(a.world.materials->stack("u1", "iron", "normal") == 1);

        svc.abandonCombat(id);
        assert(a.store->get(id));

        RewardBundle bundle = svc.completeCombat(id);
        assert(bundle.gold() == 10);
        assert(a.world.currency->balance("u1", "GOLD") == 10);
        assert(a.world.materials->stack("u1", "iron", "normal") == 1);
        assert(a.world.items->created.size() == 1);
    }

    // A victory over a styled enemy hands out styled loot.
    {
        Arena a;
        a.world.enemies->types["goblin"].styleIds = { "shadow" };
        CombatService& svc = a.open(scriptedRoll({ 0.0, 0.0, 0.01, 0.99, 0.0, 0.0, 0.0, 0.0 }));
        SessionSummary s = svc.startCombat("u1", "park-1", 1);
        assert(s.enemy.styleId == "shadow");

        TurnResult r = svc.submitAttack(s.sessionId, 200.0);
        assert(r.rewards);
        assert(!r.rewards->materials().empty());
        for (const auto& m : r.rewards->materials()) assert(m.styleId == "shadow");
        for (const auto& i : r.rewards->items()) assert(i.styleId == "shadow");
        assert(a.world.materials->stack("u1", "iron", "shadow") == 1);
        assert(a.world.materials->stack("u1", "iron", "normal") == 0);
    }

    // Concurrent turns on one session are serialised: no turn is lost or repeated.
    {
        std::mt19937 gen(77);
        Arena a;
        a.world.playerStats->stats["u1"] = PlayerStatSnapshot{ 1, 1000, 100, 0.0 };
        EnemyType& goblin = a.world.enemies->types["goblin"];
        goblin.baseDef = 0;
        goblin.baseHp = 1000;

        CombatService& svc = a.open(makeRoll(gen));
        std::string id = svc.startCombat("u1", "park-1", 1).sessionId;

        const int threads = 8;
        const int turnsEach = 10;
        std::vector<std::thread> workers;
        for (int t = 0; t < threads; ++t) {
            workers.emplace_back([&svc, id, t]() {
                for (int i = 0; i < turnsEach; ++i) {
                    double tap = static_cast<double>((t * 37 + i * 11) % 360);
                    if (i % 2 == 0) svc.submitAttack(id, tap);
                    else svc.submitDefend(id, tap);
                }
            });
        }
        for (auto& w : workers) w.join();

        auto session = a.store->get(id);
        assert(session);
        assert(session->turnNumber == threads * turnsEach);
        assert(static_cast<int>(session->combatLog.size()) == threads * turnsEach);
        for (std::size_t i = 0; i < session->combatLog.size(); ++i) {
            assert(session->combatLog[i].turn == static_cast<int>(i) + 1);
        }
        assert(session->status == CombatStatus::Ongoing);
    }

    return 0;
}
