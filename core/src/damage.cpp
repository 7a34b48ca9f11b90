#include "damage.hpp"
#include <algorithm>
#include <cmath>

DamageRoll roll_damage(const DamageRules& rules, int cover, Rng& rng){
    DamageRoll out;
    float dmg = (float)rules.base;
    if(rules.variation>0) dmg += (float)rng.range(-rules.variation, rules.variation);
    if(rng.chance(rules.crit_chance)){
        out.critical = true;
        dmg = dmg * (float)rules.crit_multiplier / 100.0f;
    }
    int c = std::clamp(cover, 0, 100);
    int r = std::clamp(rules.cover_reduction, 0, 100);
    float mitigation = (float)(c*r) / 10000.0f;   // 0..1
    dmg = dmg * (1.0f - mitigation);
    out.damage = std::max(rules.min_damage, (int)std::lround(dmg));
    return out;
}
