#include <cassert>
#include <cmath>
#include <random>
#include <string>

#include "../CombatErrors.hpp"
#include "../DamageCalculator.hpp"

template <typename Fn>
static bool throwsValidation(Fn&& fn) {
    try {
        fn();
    }
    catch (const ValidationError&) {
        return true;
    }
    return false;
}

int main() {
    // Zone multipliers applied against defense.
    {
        assert(calculateAttack(HitZone::Normal, 20, 5).damageToDefender == 15);
        assert(calculateAttack(HitZone::Graze, 20, 5).damageToDefender == 7);
        assert(calculateAttack(HitZone::Miss, 20, 5).damageToDefender == 0);
        assert(calculateAttack(HitZone::Crit, 20, 5).damageToDefender == 27);
        assert(calculateAttack(HitZone::Crit, 20, 5, 0.2).damageToDefender == 31);
        // Defense above the swing floors at zero, never heals.
        assert(calculateAttack(HitZone::Normal, 10, 50).damageToDefender == 0);
        // A configured floor lifts even a miss.
        assert(calculateAttack(HitZone::Miss, 20, 5, 0.0, 1.0).damageToDefender == 1);
    }

    // Injure: the defender is untouched and the attacker eats double the backlash.
    {
        AttackOutcome fumble = calculateAttack(HitZone::Injure, 80, 5);
        assert(fumble.damageToDefender == 0);
        assert(fumble.selfDamage == 80);
        assert(fumble.multiplier == ZONE_MULT_INJURE);

        AttackOutcome odd = calculateAttack(HitZone::Injure, 15, 0);
        assert(odd.selfDamage == 14);

        assert(calculateAttack(HitZone::Normal, 80, 5).selfDamage == 0);
    }

    // damage = floor(max(0, atk * mult - def)) across a spread of stats.
    {
        std::mt19937 gen(2024);
        std::uniform_int_distribution<int> stat(0, 250);
        std::uniform_real_distribution<double> bonus(0.0, 0.4);
        const HitZone swings[] = { HitZone::Miss, HitZone::Graze, HitZone::Normal, HitZone::Crit };
        for (int i = 0; i < 5000; ++i) {
            int atk = stat(gen);
            int def = stat(gen);
            double b = bonus(gen);
            for (HitZone zone : swings) {
                AttackOutcome out = calculateAttack(zone, atk, def, b);
                double raw = std::max(0.0, atk * zoneMultiplier(zone, b) - def);
                assert(out.damageToDefender >= 0);
                assert(out.damageToDefender <= raw + 1e-6);
                assert(out.damageToDefender > raw - 1.0 - 1e-6);
                assert(out.selfDamage == 0);
            }
        }
    }

    // Blocking strength rises with the zone; injure blocks nothing, crit blocks the most.
    {
        assert(blockedFraction(HitZone::Injure) == 0.0);
        assert(std::fabs(blockedFraction(HitZone::Crit) - MAX_BLOCK_FRACTION) < 1e-12);
        assert(blockedFraction(HitZone::Miss) > blockedFraction(HitZone::Injure));
        assert(blockedFraction(HitZone::Graze) > blockedFraction(HitZone::Miss));
        assert(blockedFraction(HitZone::Normal) > blockedFraction(HitZone::Graze));
        assert(blockedFraction(HitZone::Crit) > blockedFraction(HitZone::Normal));
    }

    // Concrete blocks of a 100 damage swing.
    {
        DefenseOutcome crit = applyDefense(100, HitZone::Crit);
        assert(crit.finalDamage == 20 && crit.damageBlocked == 80);

        DefenseOutcome normal = applyDefense(100, HitZone::Normal);
        assert(normal.finalDamage == 42 && normal.damageBlocked == 58);

        DefenseOutcome graze = applyDefense(100, HitZone::Graze);
        assert(graze.finalDamage == 58 && graze.damageBlocked == 42);

        DefenseOutcome miss = applyDefense(100, HitZone::Miss);
        assert(miss.finalDamage == 80 && miss.damageBlocked == 20);

        DefenseOutcome none = applyDefense(100, HitZone::Injure);
        assert(none.finalDamage == 100 && none.damageBlocked == 0);
    }

    // A better block never lets more through, and nothing is created or lost.
    {
        for (int incoming = 0; incoming <= 300; ++incoming) {
            int previous = incoming;
            for (HitZone zone : ALL_ZONES) {
                DefenseOutcome out = applyDefense(incoming, zone);
                assert(out.finalDamage <= previous);
                assert(out.finalDamage >= 0);
                assert(out.finalDamage + out.damageBlocked == incoming);
                previous = out.finalDamage;
            }
        }
    }

    // Wire labels.
    {
        assert(calculateAttack(std::string("crit"), 20, 5).damageToDefender == 27);
        assert(calculateAttack(std::string("injure"), 20, 5).selfDamage == 20);
        assert(throwsValidation([] { calculateAttack(std::string("mega"), 20, 5); }));
        assert(throwsValidation([] { calculateAttack(std::string("Crit"), 20, 5); }));
    }

    // Bad numbers are rejected.
    {
        assert(throwsValidation([] { calculateAttack(HitZone::Normal, -1, 5); }));
        assert(throwsValidation([] { calculateAttack(HitZone::Normal, 10, -5); }));
        assert(throwsValidation([] { calculateAttack(HitZone::Crit, 10, 5, -0.1); }));
        assert(throwsValidation([] { applyDefense(-1, HitZone::Normal); }));
    }

    return 0;
}
