#include "obstacles.hpp"
#include "occupancy.hpp"
#include "events.hpp"
#include <algorithm>
#include <mutex>

ObstacleSpec spec_from_kind(const ObstacleKind& k, GridCoord pos){
    ObstacleSpec s;
    s.pos=pos; s.height=k.height; s.cover=k.cover; s.move_cost=k.move_cost;
    s.destructible=k.destructible; s.integrity=k.integrity;
    return s;
}

ObstacleModel::ObstacleModel(const GridIndex& grid, OccupancyTracker& occupancy, EventQueue* events)
    : grid_(grid), occupancy_(occupancy), events_(events) {}

ObstacleModel::ObserverToken ObstacleModel::on_change(Observer fn){
    std::unique_lock<std::shared_mutex> lock(mu_);
    ObserverToken token = next_token_++;
    observers_.emplace_back(token, std::move(fn));
    return token;
}

bool ObstacleModel::off_change(ObserverToken token){
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = std::find_if(observers_.begin(), observers_.end(),
                           [&](const auto& o){ return o.first==token; });
    if(it==observers_.end()) return false;
    observers_.erase(it);
    return true;
}

void ObstacleModel::notify(GridCoord c) const {
    std::vector<std::pair<ObserverToken, Observer>> obs;
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        obs = observers_;
    }
    for(auto& o: obs) o.second(c);
}

ObstacleId ObstacleModel::add(const ObstacleSpec& spec, Reason* why){
    if(!grid_.is_valid(spec.pos)){ if(why) *why=Reason::InvalidCoordinate; return NO_OBSTACLE; }
    bool blocking = spec.height==HeightClass::High;

    // observers drop anything cached across this tile before and after it changes
    notify(spec.pos);
    ObstacleId id;
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        id = (ObstacleId)obstacles_.size() + 1;
        Reason r = occupancy_.set_obstacle(spec.pos, id, blocking);
        if(r!=Reason::Ok){ if(why) *why=r; return NO_OBSTACLE; }
        Obstacle o{};
        o.id=id; o.pos=spec.pos; o.height=spec.height;
        o.move_cost = blocking ? IMPASSABLE : std::max(0.0f, spec.move_cost);
        o.cover = std::clamp(spec.cover, 0, 100);
        o.destructible = spec.destructible;
        o.max_integrity = spec.destructible ? std::max(1, spec.integrity) : std::max(0, spec.integrity);
        o.integrity = o.max_integrity;
        obstacles_.push_back(o);
    }
    notify(spec.pos);

    if(events_){
        Event e{EventKind::ObstacleAdded};
        e.obstacle=id; e.to=spec.pos;
        events_->push(e);
    }
    if(why) *why=Reason::Ok;
    return id;
}

bool ObstacleModel::destroy(ObstacleId id){
    GridCoord pos{-1,-1};
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        if(id==NO_OBSTACLE || id>obstacles_.size()) return false;
        const Obstacle& o = obstacles_[id-1];
        if(o.destroyed) return false;
        pos = o.pos;
    }

    notify(pos);
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        Obstacle& o = obstacles_[id-1];
        if(o.destroyed) return false;
        o.destroyed = true;
        o.integrity = 0;
        bool cleared = occupancy_.clear_obstacle(pos, id);
        check_invariant(cleared, "obstacle missing from its tile");
    }
    notify(pos);

    if(events_){
        Event e{EventKind::ObstacleDestroyed};
        e.obstacle=id; e.from=pos;
        events_->push(e);
    }
    return true;
}

int ObstacleModel::damage(ObstacleId id, int amount){
    int remaining;
    GridCoord pos;
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        if(id==NO_OBSTACLE || id>obstacles_.size()) return -1;
        Obstacle& o = obstacles_[id-1];
        if(o.destroyed || !o.destructible) return -1;
        o.integrity = std::max(0, o.integrity - std::max(0, amount));
        remaining = o.integrity;
        pos = o.pos;
    }
    if(events_){
        Event e{EventKind::ObstacleDamaged};
        e.obstacle=id; e.from=pos; e.amount=remaining;
        events_->push(e);
    }
    if(remaining==0) destroy(id);
    return remaining;
}

std::optional<Obstacle> ObstacleModel::get(ObstacleId id) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    if(id==NO_OBSTACLE || id>obstacles_.size()) return std::nullopt;
    return obstacles_[id-1];
}

std::optional<Obstacle> ObstacleModel::at(GridCoord c) const {
    auto id = occupancy_.obstacle_at(c);
    if(!id) return std::nullopt;
    auto o = get(*id);
    if(!o || o->destroyed) return std::nullopt;
    return o;
}

std::vector<Obstacle> ObstacleModel::all() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<Obstacle> out;
    for(const auto& o: obstacles_) if(!o.destroyed) out.push_back(o);
    return out;
}
