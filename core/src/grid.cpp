#include "grid.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

InvalidCoordinate::InvalidCoordinate(GridCoord c)
    : std::out_of_range("invalid grid coordinate (" + std::to_string(c.x) + "," + std::to_string(c.z) + ")"),
      coord(c) {}

GridCoord step(GridCoord c, Dir d){
    static const int offs[8][2]={{0,1},{1,0},{0,-1},{-1,0},{1,1},{1,-1},{-1,-1},{-1,1}};
    int i=(int)d;
    return GridCoord{ c.x+offs[i][0], c.z+offs[i][1] };
}

GridIndex::GridIndex(int size):n_(size){
    if(size<1 || size>GRID_SIZE_MAX)
        throw std::invalid_argument("grid size must be in 1.." + std::to_string(GRID_SIZE_MAX) + ", got " + std::to_string(size));
}

std::optional<GridCoord> GridIndex::make(int x, int z) const {
    GridCoord c{x,z};
    if(!is_valid(c)) return std::nullopt;
    return c;
}

void GridIndex::require(GridCoord c) const {
    if(!is_valid(c)) throw InvalidCoordinate(c);
}

int GridIndex::index_of(GridCoord c) const {
    require(c);
    return c.z*n_ + c.x;
}

std::vector<GridCoord> GridIndex::neighbors(GridCoord c, bool diagonals) const {
    require(c);
    std::vector<GridCoord> out;
    out.reserve(diagonals?8:4);
    int count = diagonals?8:4;
    for(int i=0;i<count;++i){
        GridCoord n = step(c, (Dir)i);
        if(is_valid(n)) out.push_back(n);
    }
    return out;
}

int GridIndex::chebyshev(GridCoord a, GridCoord b) const {
    require(a); require(b);
    return std::max(std::abs(a.x-b.x), std::abs(a.z-b.z));
}

int GridIndex::manhattan(GridCoord a, GridCoord b) const {
    require(a); require(b);
    return std::abs(a.x-b.x) + std::abs(a.z-b.z);
}

int GridIndex::distance(GridCoord a, GridCoord b, bool diagonals) const {
    return diagonals ? chebyshev(a,b) : manhattan(a,b);
}

// plain all-octant Bresenham from a to b
static void bresenham(GridCoord a, GridCoord b, std::vector<GridCoord>& out){
    int dx = std::abs(b.x-a.x), sx = a.x<b.x ? 1 : -1;
    int dz = -std::abs(b.z-a.z), sz = a.z<b.z ? 1 : -1;
    int err = dx+dz;
    GridCoord p = a;
    for(;;){
        out.push_back(p);
        if(p==b) break;
        int e2 = 2*err;
        if(e2>=dz){ err+=dz; p.x+=sx; }
        if(e2<=dx){ err+=dx; p.z+=sz; }
    }
}

std::vector<GridCoord> GridIndex::trace_line(GridCoord a, GridCoord b) const {
    require(a); require(b);
    std::vector<GridCoord> line;
    line.reserve(std::max(std::abs(a.x-b.x), std::abs(a.z-b.z)) + 1);
    // always trace from the smaller endpoint so both directions visit the same tiles
    if(b<a){
        bresenham(b, a, line);
        std::reverse(line.begin(), line.end());
    }else{
        bresenham(a, b, line);
    }
    return line;
}
