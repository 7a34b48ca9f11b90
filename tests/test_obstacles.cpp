#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "test_support.hpp"

class ObstacleTest : public ::testing::Test {
protected:
    ObstacleTest() : arena(arena_cfg(4)) {}
    Arena arena;
};

TEST_F(ObstacleTest, HighWallBlocksItsTile) {
    Reason why = Reason::InvalidTarget;
    ObstacleId id = arena.obstacles.add(high_wall(1,1), &why);
    ASSERT_NE(id, NO_OBSTACLE);
    EXPECT_EQ(why, Reason::Ok);
    EXPECT_EQ(*arena.occupancy.obstacle_at({1,1}), id);
    EXPECT_TRUE(arena.occupancy.is_blocked({1,1}));

    auto o = arena.obstacles.get(id);
    ASSERT_TRUE(o.has_value());
    EXPECT_TRUE(o->blocks_sight());
    EXPECT_TRUE(o->blocks_movement());
    EXPECT_TRUE(std::isinf(o->move_cost));
}

TEST_F(ObstacleTest, LowCoverDoesNotBlockItsTile) {
    ObstacleId id = arena.obstacles.add(low_cover(2,2,40));
    ASSERT_NE(id, NO_OBSTACLE);
    EXPECT_FALSE(arena.occupancy.is_blocked({2,2}));
    EXPECT_FALSE(arena.obstacles.get(id)->blocks_movement());
    EXPECT_EQ(arena.obstacles.at({2,2})->cover, 40);
}

TEST_F(ObstacleTest, OneObstaclePerTile) {
    ASSERT_NE(arena.obstacles.add(low_cover(0,1,30)), NO_OBSTACLE);
    Reason why = Reason::Ok;
    EXPECT_EQ(arena.obstacles.add(high_wall(0,1), &why), NO_OBSTACLE);
    EXPECT_EQ(why, Reason::TileBlocked);
    EXPECT_EQ(arena.obstacles.all().size(), 1u);
}

TEST_F(ObstacleTest, WallCannotLandOnAUnit) {
    ASSERT_NE(spawn_unit(arena, 0, CAP_ALL, {3,0}), NO_UNIT);
    Reason why = Reason::Ok;
    EXPECT_EQ(arena.obstacles.add(high_wall(3,0), &why), NO_OBSTACLE);
    EXPECT_EQ(why, Reason::TileOccupied);
    EXPECT_NE(arena.obstacles.add(low_cover(3,0,50)), NO_OBSTACLE);
}

TEST_F(ObstacleTest, OffGridIsRejected) {
    Reason why = Reason::Ok;
    EXPECT_EQ(arena.obstacles.add(high_wall(4,4), &why), NO_OBSTACLE);
    EXPECT_EQ(why, Reason::InvalidCoordinate);
}

TEST_F(ObstacleTest, CoverIsClamped) {
    ObstacleId a = arena.obstacles.add(low_cover(0,0,150));
    ObstacleId b = arena.obstacles.add(low_cover(1,0,-20));
    EXPECT_EQ(arena.obstacles.get(a)->cover, 100);
    EXPECT_EQ(arena.obstacles.get(b)->cover, 0);
}

TEST_F(ObstacleTest, DestroyFreesTheTile) {
    ObstacleId id = arena.obstacles.add(high_wall(1,2));
    arena.events.drain();

    EXPECT_TRUE(arena.obstacles.destroy(id));
    EXPECT_FALSE(arena.occupancy.obstacle_at({1,2}).has_value());
    EXPECT_FALSE(arena.occupancy.is_blocked({1,2}));
    EXPECT_FALSE(arena.obstacles.at({1,2}).has_value());
    EXPECT_TRUE(arena.obstacles.get(id)->destroyed);
    EXPECT_TRUE(arena.obstacles.all().empty());
    EXPECT_FALSE(arena.obstacles.destroy(id));
    EXPECT_FALSE(arena.obstacles.destroy(99));

    std::vector<Event> ev = arena.events.drain();
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].kind, EventKind::ObstacleDestroyed);
    EXPECT_EQ(ev[0].obstacle, id);

    EXPECT_NE(spawn_unit(arena, 0, CAP_ALL, {1,2}), NO_UNIT);
}

TEST_F(ObstacleTest, DestructibleWearsDown) {
    ObstacleSpec crate = low_cover(2,1,40);
    crate.destructible = true;
    crate.integrity = 3;
    ObstacleId id = arena.obstacles.add(crate);
    arena.events.drain();

    EXPECT_EQ(arena.obstacles.damage(id, 1), 2);
    EXPECT_FALSE(arena.obstacles.get(id)->destroyed);
    EXPECT_EQ(arena.obstacles.damage(id, 5), 0);
    EXPECT_TRUE(arena.obstacles.get(id)->destroyed);
    EXPECT_EQ(arena.obstacles.damage(id, 1), -1);

    std::vector<Event> ev = arena.events.drain();
    ASSERT_EQ(ev.size(), 3u);
    EXPECT_EQ(ev[0].kind, EventKind::ObstacleDamaged);
    EXPECT_EQ(ev[0].amount, 2);
    EXPECT_EQ(ev[1].kind, EventKind::ObstacleDamaged);
    EXPECT_EQ(ev[1].amount, 0);
    EXPECT_EQ(ev[2].kind, EventKind::ObstacleDestroyed);
}

TEST_F(ObstacleTest, IndestructibleIgnoresDamage) {
    ObstacleId id = arena.obstacles.add(high_wall(0,3));
    EXPECT_EQ(arena.obstacles.damage(id, 10), -1);
    EXPECT_FALSE(arena.obstacles.get(id)->destroyed);
}

TEST_F(ObstacleTest, DestructibleGetsAtLeastOneIntegrity) {
    ObstacleSpec s = high_wall(3,3);
    s.destructible = true;
    s.integrity = 0;
    ObstacleId id = arena.obstacles.add(s);
    EXPECT_EQ(arena.obstacles.get(id)->max_integrity, 1);
    EXPECT_EQ(arena.obstacles.damage(id, 1), 0);
    EXPECT_FALSE(arena.occupancy.is_blocked({3,3}));
}

TEST_F(ObstacleTest, ObserversSeeBeforeAndAfter) {
    std::vector<GridCoord> seen;
    arena.obstacles.on_change([&](GridCoord c){ seen.push_back(c); });
    ObstacleId id = arena.obstacles.add(high_wall(2,3));
    ASSERT_TRUE(arena.obstacles.destroy(id));
    ASSERT_EQ(seen.size(), 4u);
    for(const auto& c: seen) EXPECT_EQ(c, (GridCoord{2,3}));
}
