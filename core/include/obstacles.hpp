#pragma once
#include <functional>
#include <limits>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"
#include "grid.hpp"

struct EventQueue;
struct OccupancyTracker;

constexpr float IMPASSABLE = std::numeric_limits<float>::infinity();

// Named obstacle template, loaded from obstacles.csv and referenced by map glyph.
struct ObstacleKind{
    std::string id; char glyph;
    HeightClass height; int cover; float move_cost;
    bool destructible; int integrity;
};

struct ObstacleSpec{
    GridCoord pos;
    HeightClass height=HeightClass::Low;
    int cover=0;                // percent
    float move_cost=1.0f;
    bool destructible=false;
    int integrity=0;
};

ObstacleSpec spec_from_kind(const ObstacleKind& k, GridCoord pos);

struct Obstacle{
    ObstacleId id; GridCoord pos;
    HeightClass height; float move_cost; int cover;
    bool destructible; int integrity, max_integrity;
    bool destroyed=false;

    bool blocks_sight() const { return height==HeightClass::High; }
    bool blocks_movement() const { return height==HeightClass::High; }
};

struct ObstacleModel{
    using Observer = std::function<void(GridCoord)>;
    using ObserverToken = size_t;

    ObstacleModel(const GridIndex& grid, OccupancyTracker& occupancy, EventQueue* events);

    ObstacleId add(const ObstacleSpec& spec, Reason* why=nullptr);
    bool destroy(ObstacleId id);
    // Returns remaining integrity, or -1 when nothing could be damaged.
    int damage(ObstacleId id, int amount);

    std::optional<Obstacle> get(ObstacleId id) const;
    std::optional<Obstacle> at(GridCoord c) const;
    std::vector<Obstacle> all() const;

    // called with the tile coordinate before and after every tile mutation;
    // whoever registers must call off_change before it goes away
    ObserverToken on_change(Observer fn);
    bool off_change(ObserverToken token);

private:
    void notify(GridCoord c) const;

    const GridIndex& grid_;
    OccupancyTracker& occupancy_;
    EventQueue* events_;
    mutable std::shared_mutex mu_;
    std::vector<Obstacle> obstacles_;   // index = id-1, destroyed ones stay
    std::vector<std::pair<ObserverToken, Observer>> observers_;
    ObserverToken next_token_=1;
};
