#include <gtest/gtest.h>

#include "damage.hpp"

TEST(DamageTest, DefaultsDealOne) {
    Rng rng(7);
    DamageRoll r = roll_damage(DamageRules{}, 0, rng);
    EXPECT_EQ(r.damage, 1);
    EXPECT_FALSE(r.critical);
}

TEST(DamageTest, CoverMitigates) {
    Rng rng(7);
    DamageRules rules;
    rules.base = 10;
    EXPECT_EQ(roll_damage(rules, 40, rng).damage, 6);
    rules.cover_reduction = 50;
    EXPECT_EQ(roll_damage(rules, 40, rng).damage, 8);
    rules.cover_reduction = 0;
    EXPECT_EQ(roll_damage(rules, 40, rng).damage, 10);
}

TEST(DamageTest, MinimumDamageFloor) {
    Rng rng(7);
    DamageRules rules;
    rules.base = 10;
    EXPECT_EQ(roll_damage(rules, 100, rng).damage, 1);
    rules.min_damage = 0;
    EXPECT_EQ(roll_damage(rules, 100, rng).damage, 0);
}

TEST(DamageTest, CriticalMultiplies) {
    Rng rng(7);
    DamageRules rules;
    rules.base = 5;
    rules.crit_chance = 100;
    rules.crit_multiplier = 200;
    DamageRoll r = roll_damage(rules, 0, rng);
    EXPECT_TRUE(r.critical);
    EXPECT_EQ(r.damage, 10);
}

TEST(DamageTest, VariationStaysInBoundsAndIsSeeded) {
    DamageRules rules;
    rules.base = 5;
    rules.variation = 2;
    Rng a(99), b(99);
    bool spread = false;
    int first = roll_damage(rules, 0, a).damage;
    Rng a2(99);
    for(int i=0;i<200;++i){
        int x = roll_damage(rules, 0, a2).damage;
        int y = roll_damage(rules, 0, b).damage;
        EXPECT_EQ(x, y);
        EXPECT_GE(x, 3);
        EXPECT_LE(x, 7);
        if(x!=first) spread = true;
    }
    EXPECT_TRUE(spread);
}

TEST(RngTest, RangeAndChanceEdges) {
    Rng rng(0);
    EXPECT_NE(rng.next(), 0u);
    EXPECT_EQ(rng.range(4, 4), 4);
    EXPECT_EQ(rng.range(6, 2), 6);
    for(int i=0;i<100;++i){
        EXPECT_FALSE(rng.chance(0));
        EXPECT_TRUE(rng.chance(100));
        int v = rng.range(-3, 3);
        EXPECT_GE(v, -3);
        EXPECT_LE(v, 3);
    }
}
