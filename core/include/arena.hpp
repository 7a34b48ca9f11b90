#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "types.hpp"
#include "grid.hpp"
#include "events.hpp"
#include "occupancy.hpp"
#include "obstacles.hpp"
#include "units.hpp"
#include "los.hpp"
#include "validation.hpp"
#include "damage.hpp"
#include "rng.hpp"

struct UnitSpawn{ GridCoord pos; TeamId team; uint8_t caps; };

struct ArenaConfig{
    int grid_size=TACGRID_DEFAULT_GRID;
    bool diagonal_moves=false;
    bool diagonal_attacks=true;
    int attack_range=1;
    int attacks_per_turn=1;
    size_t los_cache_limit=256;
    bool log_events=false;
    uint32_t seed=12345;
    DamageRules damage;
    std::vector<ObstacleSpec> obstacles;
    std::vector<UnitSpawn> units;
};

// One battlefield. Everything the validators need lives here; there is no global state.
struct Arena{
    explicit Arena(const ArenaConfig& config);
    Arena(const Arena&)=delete;
    Arena& operator=(const Arena&)=delete;

    ArenaConfig cfg;
    GridIndex grid;
    EventQueue events;
    OccupancyTracker occupancy;
    ObstacleModel obstacles;
    UnitRegistry units;
    LosEngine los;
    MovementValidator movement;
    CombatValidator combat;
    Rng rng;
};

struct AttackOutcome{
    AttackCheck check;
    int damage=0;
    bool critical=false;
    bool ok() const { return check.ok(); }
};

// Places the configured obstacles and units. False (with a message on stderr) on the first failure.
bool setup_arena(Arena& a);

UnitId spawn_unit(Arena& a, TeamId team, uint8_t caps, GridCoord pos);
MoveCheck order_move(Arena& a, UnitId u, GridCoord target);
AttackOutcome order_attack(Arena& a, UnitId attacker, UnitId target);
void kill_unit(Arena& a, UnitId u);
int damage_obstacle(Arena& a, ObstacleId id, int amount);
