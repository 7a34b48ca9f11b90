#include "types.hpp"
#include <cstdio>
#include <cstdlib>

const char* reason_name(Reason r){
    switch(r){
        case Reason::Ok:                 return "Ok";
        case Reason::InvalidCoordinate:  return "InvalidCoordinate";
        case Reason::UnitNotFound:       return "UnitNotFound";
        case Reason::UnitCannotMove:     return "UnitCannotMove";
        case Reason::OutOfBounds:        return "OutOfBounds";
        case Reason::NotAdjacent:        return "NotAdjacent";
        case Reason::TileBlocked:        return "TileBlocked";
        case Reason::TileOccupied:       return "TileOccupied";
        case Reason::NoAttacksRemaining: return "NoAttacksRemaining";
        case Reason::InvalidTeam:        return "InvalidTeam";
        case Reason::InvalidTarget:      return "InvalidTarget";
        case Reason::OutOfRange:         return "OutOfRange";
        case Reason::NoLineOfSight:      return "NoLineOfSight";
    }
    return "?";
}

const char* height_name(HeightClass h){
    switch(h){
        case HeightClass::None: return "None";
        case HeightClass::Low:  return "Low";
        case HeightClass::High: return "High";
    }
    return "?";
}

void check_invariant(bool ok, const char* what){
    if(ok) return;
    std::fprintf(stderr, "tacgrid invariant violated: %s\n", what);
    std::abort();
}
