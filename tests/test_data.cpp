#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "data.hpp"
#include "test_support.hpp"

static const char* kSmallArena =
    "# four by four\n"
    "size=4\n"
    "diagonal_moves=1\n"
    "attack_range=2\n"
    "damage=3\n"
    "cover_reduction=50\n"
    "map:\n"
    "....\n"
    ".H.C\n"
    "..L.\n"
    "T...\n"
    "units:\n"
    "0,0,0\n"
    "2,1,1,move|target\n";

static const ObstacleSpec* spec_at(const ArenaConfig& c, GridCoord p){
    for(const auto& o: c.obstacles) if(o.pos==p) return &o;
    return nullptr;
}

TEST(ObstacleKindsTest, BuiltInKinds) {
    std::vector<ObstacleKind> kinds = default_obstacle_kinds();
    ASSERT_EQ(kinds.size(), 4u);
    EXPECT_EQ(kinds[0].glyph, 'L');
    EXPECT_EQ(kinds[1].height, HeightClass::High);
    EXPECT_TRUE(std::isinf(kinds[1].move_cost));
    EXPECT_TRUE(kinds[3].destructible);
}

TEST(ObstacleKindsTest, ParsesCsv) {
    std::istringstream in(
        "id,glyph,height,cover,move_cost,destructible,integrity\n"
        "Sandbag,S,Low,35,1.0,yes,4\n"
        "Pillar,P,High,100,inf,0,0\n"
        "\n"
        "Mud,M,None,0,2.5,false,0\n");
    std::vector<ObstacleKind> kinds;
    ASSERT_TRUE(parse_obstacle_kinds(in, kinds));
    ASSERT_EQ(kinds.size(), 3u);
    EXPECT_EQ(kinds[0].id, "Sandbag");
    EXPECT_EQ(kinds[0].cover, 35);
    EXPECT_TRUE(kinds[0].destructible);
    EXPECT_EQ(kinds[0].integrity, 4);
    EXPECT_TRUE(std::isinf(kinds[1].move_cost));
    EXPECT_FLOAT_EQ(kinds[2].move_cost, 2.5f);
    EXPECT_EQ(kinds[2].height, HeightClass::None);
}

TEST(ObstacleKindsTest, RejectsBadRows) {
    const char* header = "id,glyph,height,cover,move_cost,destructible,integrity\n";
    std::vector<std::string> bad{
        "Wall,W,Tall,100,inf,0,0\n",
        "Wall,W,High,100,inf,0\n",
        "Wall,W,High,abc,inf,0,0\n",
        "Wall,W,High,120,inf,0,0\n",
        "Wall,.,High,100,inf,0,0\n",
        "A,X,Low,10,1,0,0\nB,X,Low,20,1,0,0\n",
        "Wall,W,High,100x,inf,0,0\n",
        "Mud,M,None,0,2.5kg,0,0\n",
    };
    for(const auto& rows: bad){
        std::istringstream in(std::string(header) + rows);
        std::vector<ObstacleKind> kinds = default_obstacle_kinds();
        EXPECT_FALSE(parse_obstacle_kinds(in, kinds)) << rows;
        EXPECT_EQ(kinds.size(), 4u);
    }
    std::istringstream empty(header);
    std::vector<ObstacleKind> kinds;
    EXPECT_FALSE(parse_obstacle_kinds(empty, kinds));
}

TEST(ArenaFileTest, ParsesHeaderMapAndUnits) {
    std::istringstream in(kSmallArena);
    ArenaConfig cfg;
    ASSERT_TRUE(parse_arena(in, default_obstacle_kinds(), cfg));
    EXPECT_EQ(cfg.grid_size, 4);
    EXPECT_TRUE(cfg.diagonal_moves);
    EXPECT_TRUE(cfg.diagonal_attacks);
    EXPECT_EQ(cfg.attack_range, 2);
    EXPECT_EQ(cfg.damage.base, 3);
    EXPECT_EQ(cfg.damage.cover_reduction, 50);

    ASSERT_EQ(cfg.obstacles.size(), 4u);
    const ObstacleSpec* wall = spec_at(cfg, {1,1});
    ASSERT_NE(wall, nullptr);
    EXPECT_EQ(wall->height, HeightClass::High);
    const ObstacleSpec* crate = spec_at(cfg, {3,1});
    ASSERT_NE(crate, nullptr);
    EXPECT_TRUE(crate->destructible);
    ASSERT_NE(spec_at(cfg, {2,2}), nullptr);
    ASSERT_NE(spec_at(cfg, {0,3}), nullptr);
    EXPECT_EQ(spec_at(cfg, {0,3})->height, HeightClass::None);

    ASSERT_EQ(cfg.units.size(), 2u);
    EXPECT_EQ(cfg.units[0].pos, (GridCoord{0,0}));
    EXPECT_EQ(cfg.units[0].caps, CAP_ALL);
    EXPECT_EQ(cfg.units[1].team, 1);
    EXPECT_EQ(cfg.units[1].caps, CAP_MOVE|CAP_TARGET);
}

TEST(ArenaFileTest, RejectsMalformedInput) {
    std::vector<std::string> bad{
        "size=4\nfog=1\n",
        "size=four\n",
        "size=2\nmap:\n..\n...\n",
        "size=2\nmap:\n..\n",
        "size=2\nmap:\n.Z\n..\n",
        "size=2\nunits:\n0,0\n",
        "size=2\nunits:\n0,0,1,fly\n",
        "size=2\ndiagonal_moves=maybe\n",
        "size=4x\n",
        "size=2\nseed=-1\n",
        "size=2\nunits:\n0,0,256\n",
        "size=2\nunits:\n0,0,-1\n",
        "size=2\nunits:\n0,1x,0\n",
    };
    for(const auto& text: bad){
        std::istringstream in(text);
        ArenaConfig cfg;
        EXPECT_FALSE(parse_arena(in, default_obstacle_kinds(), cfg)) << text;
    }
}

TEST(ArenaFileTest, MapIsOptional) {
    std::istringstream in("size=3\nunits:\n1,1,0,none\n");
    ArenaConfig cfg;
    ASSERT_TRUE(parse_arena(in, default_obstacle_kinds(), cfg));
    EXPECT_TRUE(cfg.obstacles.empty());
    ASSERT_EQ(cfg.units.size(), 1u);
    EXPECT_EQ(cfg.units[0].caps, 0);
}

TEST(ConfigValidationTest, AcceptsParsedArena) {
    std::istringstream in(kSmallArena);
    ArenaConfig cfg;
    ASSERT_TRUE(parse_arena(in, default_obstacle_kinds(), cfg));
    std::string err;
    EXPECT_TRUE(validate_config(cfg, &err)) << err;
}

TEST(ArenaFileTest, HighTeamNumbersStayDistinct) {
    std::istringstream in("size=2\nunits:\n0,0,255\n1,0,0\n");
    ArenaConfig cfg;
    ASSERT_TRUE(parse_arena(in, default_obstacle_kinds(), cfg));
    ASSERT_EQ(cfg.units.size(), 2u);
    EXPECT_EQ(cfg.units[0].team, 255);
    EXPECT_NE(cfg.units[0].team, cfg.units[1].team);
}

TEST(ConfigValidationTest, OversizedGridIsRejected) {
    std::istringstream in("size=50000\n");
    ArenaConfig cfg;
    ASSERT_TRUE(parse_arena(in, default_obstacle_kinds(), cfg));
    std::string err;
    EXPECT_FALSE(validate_config(cfg, &err));
    EXPECT_NE(err.find("grid size"), std::string::npos);

    cfg.grid_size = GRID_SIZE_MAX;
    EXPECT_TRUE(validate_config(cfg, nullptr));
}

TEST(ConfigValidationTest, RejectsInconsistentConfigs) {
    std::string err;

    ArenaConfig walled = arena_cfg(4);
    walled.obstacles.push_back(high_wall(1,1));
    walled.units.push_back(UnitSpawn{{1,1}, 0, CAP_ALL});
    EXPECT_FALSE(validate_config(walled, &err));
    EXPECT_NE(err.find("wall"), std::string::npos);

    ArenaConfig crowded = arena_cfg(4);
    crowded.units.push_back(UnitSpawn{{2,2}, 0, CAP_ALL});
    crowded.units.push_back(UnitSpawn{{2,2}, 1, CAP_ALL});
    EXPECT_FALSE(validate_config(crowded, nullptr));

    ArenaConfig offgrid = arena_cfg(4);
    offgrid.obstacles.push_back(low_cover(4,0,10));
    EXPECT_FALSE(validate_config(offgrid, nullptr));

    ArenaConfig stacked = arena_cfg(4);
    stacked.obstacles.push_back(low_cover(0,0,10));
    stacked.obstacles.push_back(terrain(0,0,2.0f));
    EXPECT_FALSE(validate_config(stacked, nullptr));

    ArenaConfig empty = arena_cfg(4);
    empty.grid_size = 0;
    EXPECT_FALSE(validate_config(empty, nullptr));

    ArenaConfig crit = arena_cfg(4);
    crit.damage.crit_chance = 101;
    EXPECT_FALSE(validate_config(crit, nullptr));

    ArenaConfig range = arena_cfg(4);
    range.attack_range = -1;
    EXPECT_FALSE(validate_config(range, nullptr));
}

TEST(ConfigValidationTest, LowCoverUnderUnitIsFine) {
    ArenaConfig cfg = arena_cfg(4);
    cfg.obstacles.push_back(low_cover(1,1,50));
    cfg.units.push_back(UnitSpawn{{1,1}, 0, CAP_ALL});
    EXPECT_TRUE(validate_config(cfg, nullptr));
}

TEST(AssetLoadTest, LoadsFromDirectory) {
    std::string dir = ::testing::TempDir();
    {
        std::ofstream k(dir + "/obstacles.csv");
        k << "id,glyph,height,cover,move_cost,destructible,integrity\n"
          << "Rock,R,High,100,inf,0,0\n";
        std::ofstream a(dir + "/arena.txt");
        a << "size=3\nmap:\n...\n.R.\n...\nunits:\n0,0,0\n2,2,1\n";
    }
    ArenaConfig cfg;
    ASSERT_TRUE(load_arena(cfg, dir));
    EXPECT_EQ(cfg.grid_size, 3);
    ASSERT_EQ(cfg.obstacles.size(), 1u);
    EXPECT_EQ(cfg.obstacles[0].height, HeightClass::High);

    Arena arena(cfg);
    ASSERT_TRUE(setup_arena(arena));
    EXPECT_TRUE(arena.occupancy.is_blocked({1,1}));
    EXPECT_EQ(arena.occupancy.unit_count(), 2u);
}

TEST(AssetLoadTest, MissingArenaFails) {
    ArenaConfig cfg;
    EXPECT_FALSE(load_arena(cfg, "/nonexistent/tacgrid/assets"));
}
