#pragma once
#include <vector>
#include "types.hpp"
#include "grid.hpp"

struct OccupancyTracker;
struct ObstacleModel;
struct UnitRegistry;
struct LosEngine;

struct MoveCheck{
    Reason reason=Reason::Ok;
    float cost=0.0f;            // movement cost of the target tile, reported only
    bool ok() const { return reason==Reason::Ok; }
};

struct AttackCheck{
    Reason reason=Reason::Ok;
    int cover=0;                // defender's cover, for the damage roll
    bool ok() const { return reason==Reason::Ok; }
};

// Read-only. Checks run in a fixed order and the first failure is reported:
// state, bounds, adjacency, obstruction, occupancy.
struct MovementValidator{
    MovementValidator(const GridIndex& grid, const OccupancyTracker& occupancy,
                      const ObstacleModel& obstacles, const UnitRegistry& units, bool diagonal);

    MoveCheck validate(UnitId unit, GridCoord target) const;
    std::vector<GridCoord> valid_moves(UnitId unit) const;
    bool diagonal() const { return diagonal_; }

private:
    const GridIndex& grid_;
    const OccupancyTracker& occupancy_;
    const ObstacleModel& obstacles_;
    const UnitRegistry& units_;
    bool diagonal_;
};

// Read-only. Order: attacker state, team, target state, range, line of sight.
struct CombatValidator{
    CombatValidator(const GridIndex& grid, const OccupancyTracker& occupancy,
                    const UnitRegistry& units, const LosEngine& los, int range, bool diagonal);

    AttackCheck validate(UnitId attacker, UnitId target) const;
    std::vector<UnitId> valid_targets(UnitId attacker) const;
    int range() const { return range_; }

private:
    const GridIndex& grid_;
    const OccupancyTracker& occupancy_;
    const UnitRegistry& units_;
    const LosEngine& los_;
    int range_;
    bool diagonal_;
};
