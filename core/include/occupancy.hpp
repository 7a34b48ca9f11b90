#pragma once
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "types.hpp"
#include "grid.hpp"

struct EventQueue;

struct Tile{
    UnitId occupant=NO_UNIT;
    ObstacleId obstacle=NO_OBSTACLE;
    bool blocked=false;   // holds a High obstacle
};

// Which unit and which obstacle sit on which tile. Every call takes the one lock,
// so a reader never sees a unit half-way through a move.
struct OccupancyTracker{
    OccupancyTracker(const GridIndex& grid, EventQueue* events);

    std::optional<UnitId> occupant_at(GridCoord c) const;
    std::optional<ObstacleId> obstacle_at(GridCoord c) const;
    bool is_blocked(GridCoord c) const;
    Tile tile(GridCoord c) const;
    std::optional<GridCoord> position_of(UnitId u) const;
    size_t unit_count() const;

    // TileBlocked on a wall, TileOccupied if the tile holds another unit or if u is
    // already on the board somewhere (a unit is only ever on one tile).
    Reason place(UnitId u, GridCoord c);
    Reason move(UnitId u, GridCoord from, GridCoord to);
    bool remove(UnitId u);

    // obstacle bookkeeping, driven by ObstacleModel
    Reason set_obstacle(GridCoord c, ObstacleId id, bool blocking);
    bool clear_obstacle(GridCoord c, ObstacleId id);

    void check_consistency() const;

private:
    Reason can_enter(const Tile& t, UnitId u) const;
    void check_locked() const;

    const GridIndex& grid_;
    EventQueue* events_;
    mutable std::mutex mu_;
    std::vector<Tile> tiles_;
    std::unordered_map<UnitId, GridCoord> units_;
};
