#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>
#include "types.hpp"
#include "grid.hpp"

enum class EventKind : uint8_t {
    UnitPlaced, UnitMoved, UnitRemoved,
    ObstacleAdded, ObstacleDamaged, ObstacleDestroyed,
    AttackResolved
};

struct Event{
    EventKind kind;
    UnitId unit=NO_UNIT;
    UnitId target=NO_UNIT;          // AttackResolved
    ObstacleId obstacle=NO_OBSTACLE;
    GridCoord from{-1,-1};
    GridCoord to{-1,-1};
    Reason reason=Reason::Ok;       // AttackResolved
    int cover=0;                    // AttackResolved
    int amount=0;                   // damage dealt, or remaining integrity for ObstacleDamaged
};

// Outbound notification channel. The core only pushes; presentation drains.
struct EventQueue{
    void push(const Event& e);
    std::vector<Event> drain();
    size_t size() const;
private:
    mutable std::mutex mu_;
    std::deque<Event> q_;
};

const char* event_name(EventKind k);
