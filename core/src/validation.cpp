#include "validation.hpp"
#include "occupancy.hpp"
#include "obstacles.hpp"
#include "units.hpp"
#include "los.hpp"

static MoveCheck fail_move(Reason r){ MoveCheck m; m.reason=r; return m; }
static AttackCheck fail_attack(Reason r){ AttackCheck a; a.reason=r; return a; }

MovementValidator::MovementValidator(const GridIndex& grid, const OccupancyTracker& occupancy,
                                     const ObstacleModel& obstacles, const UnitRegistry& units, bool diagonal)
    : grid_(grid), occupancy_(occupancy), obstacles_(obstacles), units_(units), diagonal_(diagonal) {}

MoveCheck MovementValidator::validate(UnitId unit, GridCoord target) const {
    // 1. state
    auto u = units_.find(unit);
    if(!u || !u->can(CAP_MOVE) || !u->alive || u->moving) return fail_move(Reason::UnitCannotMove);
    auto from = occupancy_.position_of(unit);
    if(!from) return fail_move(Reason::UnitCannotMove);

    // 2. bounds
    if(!grid_.is_valid(target)) return fail_move(Reason::OutOfBounds);

    // 3. adjacency, one tile per move
    if(grid_.distance(*from, target, diagonal_)!=1) return fail_move(Reason::NotAdjacent);

    // 4. obstruction
    MoveCheck ok;
    ok.cost = 1.0f;
    if(auto o = obstacles_.at(target)){
        if(o->blocks_movement()) return fail_move(Reason::TileBlocked);
        ok.cost = o->move_cost;
    }

    // 5. occupancy
    if(occupancy_.occupant_at(target)) return fail_move(Reason::TileOccupied);
    return ok;
}

std::vector<GridCoord> MovementValidator::valid_moves(UnitId unit) const {
    std::vector<GridCoord> out;
    auto from = occupancy_.position_of(unit);
    if(!from) return out;
    for(GridCoord n: grid_.neighbors(*from, diagonal_)){
        if(validate(unit, n).ok()) out.push_back(n);
    }
    return out;
}

CombatValidator::CombatValidator(const GridIndex& grid, const OccupancyTracker& occupancy,
                                 const UnitRegistry& units, const LosEngine& los, int range, bool diagonal)
    : grid_(grid), occupancy_(occupancy), units_(units), los_(los), range_(range), diagonal_(diagonal) {}

AttackCheck CombatValidator::validate(UnitId attacker, UnitId target) const {
    auto a = units_.find(attacker);
    auto apos = occupancy_.position_of(attacker);
    if(!a || !apos) return fail_attack(Reason::UnitNotFound);

    // 1. attacker state
    if(!a->can(CAP_ATTACK) || !a->alive || a->attacks_left<=0) return fail_attack(Reason::NoAttacksRemaining);

    // 2. self / friendly fire
    if(attacker==target) return fail_attack(Reason::InvalidTeam);
    auto t = units_.find(target);
    if(!t) return fail_attack(Reason::InvalidTarget);
    if(t->team==a->team) return fail_attack(Reason::InvalidTeam);

    // 3. target state
    auto tpos = occupancy_.position_of(target);
    if(!t->can(CAP_TARGET) || !t->alive || !tpos) return fail_attack(Reason::InvalidTarget);

    // 4. range
    if(grid_.distance(*apos, *tpos, diagonal_) > range_) return fail_attack(Reason::OutOfRange);

    // 5. line of sight
    LosResult los = los_.query(*apos, *tpos);
    if(!los.visible) return fail_attack(Reason::NoLineOfSight);

    AttackCheck ok;
    ok.cover = los.cover;
    return ok;
}

std::vector<UnitId> CombatValidator::valid_targets(UnitId attacker) const {
    std::vector<UnitId> out;
    for(UnitId id: units_.ids()){
        if(id==attacker) continue;
        if(validate(attacker, id).ok()) out.push_back(id);
    }
    return out;
}
