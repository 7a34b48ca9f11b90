#include "los.hpp"
#include "occupancy.hpp"
#include "obstacles.hpp"
#include <algorithm>
#include <mutex>

LosEngine::LosEngine(const GridIndex& grid, const OccupancyTracker& occupancy, ObstacleModel& obstacles,
                     size_t cache_limit)
    : grid_(grid), occupancy_(occupancy), obstacles_(obstacles), limit_(cache_limit) {
    observer_ = obstacles.on_change([this](GridCoord c){ invalidate(c); });
}

LosEngine::~LosEngine(){
    obstacles_.off_change(observer_);
}

uint64_t LosEngine::key(GridCoord a, GridCoord b) const {
    uint64_t ia = (uint64_t)grid_.index_of(a), ib = (uint64_t)grid_.index_of(b);
    if(ib<ia) std::swap(ia, ib);
    return ia*(uint64_t)grid_.tile_count() + ib;
}

LosResult LosEngine::compute(GridCoord a, GridCoord b, std::vector<int>& interior) const {
    // canonical direction, so the blocker does not depend on who asks
    std::vector<GridCoord> line = grid_.trace_line(b<a ? b : a, b<a ? a : b);
    LosResult r;
    if(line.size()<3) return r;
    interior.reserve(line.size()-2);
    for(size_t i=1;i+1<line.size();++i) interior.push_back(grid_.index_of(line[i]));

    for(size_t i=1;i+1<line.size();++i){
        auto id = occupancy_.obstacle_at(line[i]);
        if(!id) continue;
        auto o = obstacles_.get(*id);
        if(!o || o->destroyed) continue;
        if(o->height==HeightClass::High){
            r.visible=false; r.cover=100; r.blocker=o->id;
            return r;
        }
        // cover does not stack, the best single piece counts
        if(o->height==HeightClass::Low) r.cover = std::max(r.cover, o->cover);
    }
    return r;
}

LosResult LosEngine::query(GridCoord a, GridCoord b) const {
    grid_.require(a);
    grid_.require(b);
    if(a==b) return LosResult{};

    uint64_t k = key(a,b);
    uint64_t seen;
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        auto it = cache_.find(k);
        if(it!=cache_.end()){ ++hits_; return it->second.result; }
        seen = epoch_;
    }
    ++misses_;

    std::vector<int> interior;
    LosResult r = compute(a, b, interior);
    if(limit_==0) return r;

    std::unique_lock<std::shared_mutex> lock(mu_);
    if(epoch_==seen){
        if(cache_.size()>=limit_ && !cache_.count(k)) cache_.clear();
        cache_[k] = Entry{ r, std::move(interior) };
    }
    return r;
}

int LosEngine::cover_at(GridCoord defender, GridCoord attacker) const {
    return query(attacker, defender).cover;
}

std::vector<GridCoord> LosEngine::visible_from(GridCoord from) const {
    grid_.require(from);
    std::vector<GridCoord> out;
    for(int i=0;i<grid_.tile_count();++i){
        GridCoord c = grid_.coord_of(i);
        if(query(from, c).visible) out.push_back(c);
    }
    return out;
}

void LosEngine::invalidate(GridCoord c){
    if(!grid_.is_valid(c)) return;
    int ti = grid_.index_of(c);
    std::unique_lock<std::shared_mutex> lock(mu_);
    ++epoch_;
    for(auto it=cache_.begin(); it!=cache_.end();){
        const auto& in = it->second.interior;
        if(std::find(in.begin(), in.end(), ti)!=in.end()){
            it = cache_.erase(it);
            ++invalidations_;
        }else{
            ++it;
        }
    }
}

void LosEngine::clear(){
    std::unique_lock<std::shared_mutex> lock(mu_);
    ++epoch_;
    invalidations_ += cache_.size();
    cache_.clear();
}

LosStats LosEngine::stats() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    LosStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.entries = cache_.size();
    s.invalidations = invalidations_;
    return s;
}
