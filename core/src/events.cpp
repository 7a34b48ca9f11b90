#include "events.hpp"

void EventQueue::push(const Event& e){
    std::lock_guard<std::mutex> lock(mu_);
    q_.push_back(e);
}

std::vector<Event> EventQueue::drain(){
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<Event> out(q_.begin(), q_.end());
    q_.clear();
    return out;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
}

const char* event_name(EventKind k){
    switch(k){
        case EventKind::UnitPlaced:        return "unit-placed";
        case EventKind::UnitMoved:         return "unit-moved";
        case EventKind::UnitRemoved:       return "unit-removed";
        case EventKind::ObstacleAdded:     return "obstacle-added";
        case EventKind::ObstacleDamaged:   return "obstacle-damaged";
        case EventKind::ObstacleDestroyed: return "obstacle-destroyed";
        case EventKind::AttackResolved:    return "attack-resolved";
    }
    return "?";
}
