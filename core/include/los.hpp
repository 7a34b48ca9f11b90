#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "types.hpp"
#include "grid.hpp"

struct OccupancyTracker;
struct ObstacleModel;

struct LosResult{
    bool visible=true;
    int cover=0;                        // percent, 100 when blocked
    std::optional<ObstacleId> blocker;  // set only when !visible
};

inline bool operator==(const LosResult& a, const LosResult& b){
    return a.visible==b.visible && a.cover==b.cover && a.blocker==b.blocker;
}
inline bool operator!=(const LosResult& a, const LosResult& b){ return !(a==b); }

struct LosStats{ size_t hits=0, misses=0, entries=0, invalidations=0; };

// Visibility and cover between two tiles. Only obstacles occlude; units never do.
//
// Results are cached per unordered tile pair together with the interior tiles the
// line crossed. An obstacle change on tile c drops exactly the entries whose
// interior contains c. Every invalidation bumps an epoch, and a query only stores
// its result if the epoch did not move while it was computing, so a result computed
// against the old obstacle layout is never cached after the change.
struct LosEngine{
    LosEngine(const GridIndex& grid, const OccupancyTracker& occupancy, ObstacleModel& obstacles,
              size_t cache_limit=256);
    ~LosEngine();
    LosEngine(const LosEngine&)=delete;
    LosEngine& operator=(const LosEngine&)=delete;

    LosResult query(GridCoord a, GridCoord b) const;
    int cover_at(GridCoord defender, GridCoord attacker) const;
    std::vector<GridCoord> visible_from(GridCoord from) const;

    void invalidate(GridCoord c);
    void clear();
    LosStats stats() const;

private:
    struct Entry{ LosResult result; std::vector<int> interior; };

    uint64_t key(GridCoord a, GridCoord b) const;
    LosResult compute(GridCoord a, GridCoord b, std::vector<int>& interior) const;

    const GridIndex& grid_;
    const OccupancyTracker& occupancy_;
    ObstacleModel& obstacles_;
    size_t limit_;
    size_t observer_=0;

    mutable std::shared_mutex mu_;
    mutable std::unordered_map<uint64_t, Entry> cache_;
    mutable uint64_t epoch_=0;
    mutable size_t invalidations_=0;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
};
