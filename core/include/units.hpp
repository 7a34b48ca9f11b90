#pragma once
#include <optional>
#include <shared_mutex>
#include <vector>
#include "types.hpp"

// What the core knows about a unit besides its tile. The turn system and the
// health system own the values; they write them here.
struct UnitState{
    UnitId id=NO_UNIT;
    TeamId team=0;
    uint8_t caps=0;
    bool alive=true;
    bool moving=false;       // a move is still playing out
    int attacks_left=0;

    bool can(Capability c) const { return (caps & c)!=0; }
};

struct UnitRegistry{
    UnitId add(TeamId team, uint8_t caps, int attacks_left=1);
    bool erase(UnitId id);

    std::optional<UnitState> find(UnitId id) const;
    std::vector<UnitId> ids() const;

    bool set_alive(UnitId id, bool alive);
    bool set_moving(UnitId id, bool moving);
    bool set_attacks_left(UnitId id, int n);
    // Consumes one attack; false when none are left.
    bool spend_attack(UnitId id);

private:
    UnitState* find_locked(UnitId id);

    mutable std::shared_mutex mu_;
    std::vector<UnitState> units_;   // sorted by id
    UnitId next_id_=1;
};
