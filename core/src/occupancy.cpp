#include "occupancy.hpp"
#include "events.hpp"

OccupancyTracker::OccupancyTracker(const GridIndex& grid, EventQueue* events)
    : grid_(grid), events_(events), tiles_(grid.tile_count()) {}

std::optional<UnitId> OccupancyTracker::occupant_at(GridCoord c) const {
    int i = grid_.index_of(c);
    std::lock_guard<std::mutex> lock(mu_);
    if(tiles_[i].occupant==NO_UNIT) return std::nullopt;
    return tiles_[i].occupant;
}

std::optional<ObstacleId> OccupancyTracker::obstacle_at(GridCoord c) const {
    int i = grid_.index_of(c);
    std::lock_guard<std::mutex> lock(mu_);
    if(tiles_[i].obstacle==NO_OBSTACLE) return std::nullopt;
    return tiles_[i].obstacle;
}

bool OccupancyTracker::is_blocked(GridCoord c) const {
    int i = grid_.index_of(c);
    std::lock_guard<std::mutex> lock(mu_);
    return tiles_[i].blocked;
}

Tile OccupancyTracker::tile(GridCoord c) const {
    int i = grid_.index_of(c);
    std::lock_guard<std::mutex> lock(mu_);
    return tiles_[i];
}

std::optional<GridCoord> OccupancyTracker::position_of(UnitId u) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = units_.find(u);
    if(it==units_.end()) return std::nullopt;
    return it->second;
}

size_t OccupancyTracker::unit_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return units_.size();
}

Reason OccupancyTracker::can_enter(const Tile& t, UnitId u) const {
    if(t.blocked) return Reason::TileBlocked;
    if(t.occupant!=NO_UNIT && t.occupant!=u) return Reason::TileOccupied;
    return Reason::Ok;
}

Reason OccupancyTracker::place(UnitId u, GridCoord c){
    int i = grid_.index_of(c);
    if(u==NO_UNIT) return Reason::UnitNotFound;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if(units_.count(u)) return Reason::TileOccupied;
        Reason r = can_enter(tiles_[i], u);
        if(r!=Reason::Ok) return r;
        tiles_[i].occupant = u;
        units_[u] = c;
#ifndef NDEBUG
        check_locked();
#endif
    }
    if(events_){
        Event e{EventKind::UnitPlaced};
        e.unit=u; e.to=c;
        events_->push(e);
    }
    return Reason::Ok;
}

Reason OccupancyTracker::move(UnitId u, GridCoord from, GridCoord to){
    int fi = grid_.index_of(from);
    int ti = grid_.index_of(to);
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = units_.find(u);
        if(it==units_.end() || it->second!=from) return Reason::UnitNotFound;
        if(fi==ti) return Reason::Ok;
        Reason r = can_enter(tiles_[ti], u);
        if(r!=Reason::Ok) return r;
        tiles_[fi].occupant = NO_UNIT;
        tiles_[ti].occupant = u;
        it->second = to;
#ifndef NDEBUG
        check_locked();
#endif
    }
    if(events_){
        Event e{EventKind::UnitMoved};
        e.unit=u; e.from=from; e.to=to;
        events_->push(e);
    }
    return Reason::Ok;
}

bool OccupancyTracker::remove(UnitId u){
    GridCoord at{-1,-1};
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = units_.find(u);
        if(it==units_.end()) return false; // late death cleanup, nothing to do
        at = it->second;
        tiles_[grid_.index_of(at)].occupant = NO_UNIT;
        units_.erase(it);
#ifndef NDEBUG
        check_locked();
#endif
    }
    if(events_){
        Event e{EventKind::UnitRemoved};
        e.unit=u; e.from=at;
        events_->push(e);
    }
    return true;
}

Reason OccupancyTracker::set_obstacle(GridCoord c, ObstacleId id, bool blocking){
    int i = grid_.index_of(c);
    std::lock_guard<std::mutex> lock(mu_);
    Tile& t = tiles_[i];
    if(t.obstacle!=NO_OBSTACLE) return Reason::TileBlocked;
    if(blocking && t.occupant!=NO_UNIT) return Reason::TileOccupied;
    t.obstacle = id;
    t.blocked = blocking;
#ifndef NDEBUG
    check_locked();
#endif
    return Reason::Ok;
}

bool OccupancyTracker::clear_obstacle(GridCoord c, ObstacleId id){
    int i = grid_.index_of(c);
    std::lock_guard<std::mutex> lock(mu_);
    Tile& t = tiles_[i];
    if(t.obstacle!=id) return false;
    t.obstacle = NO_OBSTACLE;
    t.blocked = false;
    return true;
}

void OccupancyTracker::check_consistency() const {
    std::lock_guard<std::mutex> lock(mu_);
    check_locked();
}

void OccupancyTracker::check_locked() const {
    size_t occupied = 0;
    for(int i=0;i<(int)tiles_.size();++i){
        const Tile& t = tiles_[i];
        check_invariant(!(t.blocked && t.obstacle==NO_OBSTACLE), "blocked tile without obstacle");
        if(t.occupant==NO_UNIT) continue;
        ++occupied;
        check_invariant(!t.blocked, "unit standing on a blocked tile");
        auto it = units_.find(t.occupant);
        check_invariant(it!=units_.end(), "tile occupant missing from unit map");
        check_invariant(grid_.index_of(it->second)==i, "unit map disagrees with tile occupant");
    }
    check_invariant(occupied==units_.size(), "unit registered on more or fewer tiles than tracked");
}
