#pragma once
#include "rng.hpp"

struct DamageRules{
    int base=1;
    int variation=0;            // +- uniform spread around base
    int min_damage=1;
    int crit_chance=0;          // percent
    int crit_multiplier=100;    // percent applied on a critical hit
    int cover_reduction=100;    // how much of the defender's cover mitigates, percent
};

struct DamageRoll{ int damage=0; bool critical=false; };

// base (+variation) -> critical -> cover mitigation -> rounded, floored at min_damage
DamageRoll roll_damage(const DamageRules& rules, int cover, Rng& rng);
