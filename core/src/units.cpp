#include "units.hpp"
#include <algorithm>
#include <mutex>

static bool id_less(const UnitState& u, UnitId id){ return u.id<id; }

UnitId UnitRegistry::add(TeamId team, uint8_t caps, int attacks_left){
    std::unique_lock<std::shared_mutex> lock(mu_);
    UnitState u;
    u.id=next_id_++; u.team=team; u.caps=caps;
    u.attacks_left = std::max(0, attacks_left);
    units_.push_back(u);
    return u.id;
}

bool UnitRegistry::erase(UnitId id){
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = std::lower_bound(units_.begin(), units_.end(), id, id_less);
    if(it==units_.end() || it->id!=id) return false;
    units_.erase(it);
    return true;
}

UnitState* UnitRegistry::find_locked(UnitId id){
    auto it = std::lower_bound(units_.begin(), units_.end(), id, id_less);
    if(it==units_.end() || it->id!=id) return nullptr;
    return &*it;
}

std::optional<UnitState> UnitRegistry::find(UnitId id) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = std::lower_bound(units_.begin(), units_.end(), id, id_less);
    if(it==units_.end() || it->id!=id) return std::nullopt;
    return *it;
}

std::vector<UnitId> UnitRegistry::ids() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<UnitId> out;
    out.reserve(units_.size());
    for(const auto& u: units_) out.push_back(u.id);
    return out;
}

bool UnitRegistry::set_alive(UnitId id, bool alive){
    std::unique_lock<std::shared_mutex> lock(mu_);
    UnitState* u = find_locked(id);
    if(!u) return false;
    u->alive = alive;
    return true;
}

bool UnitRegistry::set_moving(UnitId id, bool moving){
    std::unique_lock<std::shared_mutex> lock(mu_);
    UnitState* u = find_locked(id);
    if(!u) return false;
    u->moving = moving;
    return true;
}

bool UnitRegistry::set_attacks_left(UnitId id, int n){
    std::unique_lock<std::shared_mutex> lock(mu_);
    UnitState* u = find_locked(id);
    if(!u) return false;
    u->attacks_left = std::max(0, n);
    return true;
}

bool UnitRegistry::spend_attack(UnitId id){
    std::unique_lock<std::shared_mutex> lock(mu_);
    UnitState* u = find_locked(id);
    if(!u || u->attacks_left<=0) return false;
    --u->attacks_left;
    return true;
}
