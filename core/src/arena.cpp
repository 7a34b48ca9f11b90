#include "arena.hpp"
#include <cstdio>

Arena::Arena(const ArenaConfig& config)
    : cfg(config),
      grid(config.grid_size),
      occupancy(grid, &events),
      obstacles(grid, occupancy, &events),
      los(grid, occupancy, obstacles, config.los_cache_limit),
      movement(grid, occupancy, obstacles, units, config.diagonal_moves),
      combat(grid, occupancy, units, los, config.attack_range, config.diagonal_attacks),
      rng(config.seed) {}

bool setup_arena(Arena& a){
    for(const auto& spec: a.cfg.obstacles){
        Reason why = Reason::Ok;
        if(a.obstacles.add(spec, &why)==NO_OBSTACLE){
            std::fprintf(stderr, "Obstacle at (%d,%d) rejected: %s\n", spec.pos.x, spec.pos.z, reason_name(why));
            return false;
        }
    }
    for(const auto& s: a.cfg.units){
        if(spawn_unit(a, s.team, s.caps, s.pos)==NO_UNIT) return false;
    }
    if(a.cfg.log_events){
        std::printf("[ARENA] %dx%d, %zu obstacles, %zu units\n", a.grid.size(), a.grid.size(),
                    a.obstacles.all().size(), a.occupancy.unit_count());
    }
    return true;
}

UnitId spawn_unit(Arena& a, TeamId team, uint8_t caps, GridCoord pos){
    if(!a.grid.is_valid(pos)){
        std::fprintf(stderr, "Unit spawn at (%d,%d) is off the grid\n", pos.x, pos.z);
        return NO_UNIT;
    }
    UnitId id = a.units.add(team, caps, a.cfg.attacks_per_turn);
    Reason r = a.occupancy.place(id, pos);
    if(r!=Reason::Ok){
        a.units.erase(id);
        std::fprintf(stderr, "Unit spawn at (%d,%d) failed: %s\n", pos.x, pos.z, reason_name(r));
        return NO_UNIT;
    }
    return id;
}

MoveCheck order_move(Arena& a, UnitId u, GridCoord target){
    MoveCheck chk = a.movement.validate(u, target);
    if(chk.ok()){
        auto from = a.occupancy.position_of(u);
        Reason r = from ? a.occupancy.move(u, *from, target) : Reason::UnitNotFound;
        if(r!=Reason::Ok) chk.reason = r;   // lost a race with another mutation
        else if(a.cfg.log_events) std::printf("[MOVE] unit %u (%d,%d) -> (%d,%d) cost %.1f\n",
                                              u, from->x, from->z, target.x, target.z, chk.cost);
    }
    if(!chk.ok() && a.cfg.log_events){
        std::printf("[MOVE] unit %u -> (%d,%d) refused: %s\n", u, target.x, target.z, reason_name(chk.reason));
    }
    return chk;
}

AttackOutcome order_attack(Arena& a, UnitId attacker, UnitId target){
    AttackOutcome out;
    out.check = a.combat.validate(attacker, target);
    if(out.check.ok()){
        if(!a.units.spend_attack(attacker)){
            out.check.reason = Reason::NoAttacksRemaining;
        }else{
            DamageRoll roll = roll_damage(a.cfg.damage, out.check.cover, a.rng);
            out.damage = roll.damage;
            out.critical = roll.critical;
        }
    }

    Event e{EventKind::AttackResolved};
    e.unit=attacker; e.target=target;
    e.reason=out.check.reason; e.cover=out.check.cover; e.amount=out.damage;
    a.events.push(e);

    if(a.cfg.log_events){
        if(out.ok()) std::printf("[ATTACK] %u -> %u: %d dmg%s (cover %d%%)\n", attacker, target,
                                 out.damage, out.critical?" CRIT":"", out.check.cover);
        else std::printf("[ATTACK] %u -> %u refused: %s\n", attacker, target, reason_name(out.check.reason));
    }
    return out;
}

void kill_unit(Arena& a, UnitId u){
    a.units.set_alive(u, false);
    a.occupancy.remove(u);
}

int damage_obstacle(Arena& a, ObstacleId id, int amount){
    int left = a.obstacles.damage(id, amount);
    if(a.cfg.log_events && left>=0){
        if(left==0) std::printf("[OBSTACLE] %u destroyed\n", id);
        else std::printf("[OBSTACLE] %u integrity %d\n", id, left);
    }
    return left;
}
