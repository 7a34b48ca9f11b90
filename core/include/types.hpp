#pragma once
#include <cstdint>

#ifndef TACGRID_DEFAULT_GRID
#define TACGRID_DEFAULT_GRID 4
#endif

using UnitId = uint32_t;
using ObstacleId = uint32_t;
using TeamId = uint8_t;

constexpr UnitId NO_UNIT = 0;
constexpr ObstacleId NO_OBSTACLE = 0;

enum class HeightClass : uint8_t { None=0, Low=1, High=2 };

// capability bits attached to a unit id
enum Capability : uint8_t { CAP_MOVE=1, CAP_ATTACK=2, CAP_TARGET=4, CAP_ALL=7 };

// Outcome of a rule check or tracker mutation. Ok is the only success value.
enum class Reason : uint8_t {
    Ok=0,
    InvalidCoordinate,
    UnitNotFound,
    // movement
    UnitCannotMove, OutOfBounds, NotAdjacent, TileBlocked, TileOccupied,
    // combat
    NoAttacksRemaining, InvalidTeam, InvalidTarget, OutOfRange, NoLineOfSight
};

const char* reason_name(Reason r);
const char* height_name(HeightClass h);

// Internal consistency check. Prints what broke and aborts; rule failures never come here.
void check_invariant(bool ok, const char* what);
