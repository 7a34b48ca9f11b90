#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <vector>

struct GridCoord{ int x, z; };

inline bool operator==(GridCoord a, GridCoord b){ return a.x==b.x && a.z==b.z; }
inline bool operator!=(GridCoord a, GridCoord b){ return !(a==b); }
inline bool operator<(GridCoord a, GridCoord b){ return a.x!=b.x ? a.x<b.x : a.z<b.z; }

struct GridCoordHash{
    size_t operator()(GridCoord c) const {
        return std::hash<unsigned long long>()(((unsigned long long)(unsigned)c.x<<32) | (unsigned)c.z);
    }
};

// Thrown for out-of-bounds input to geometric queries and trackers.
struct InvalidCoordinate : std::out_of_range {
    GridCoord coord;
    explicit InvalidCoordinate(GridCoord c);
};

// Neighbor order used everywhere: N(0,+1), E(+1,0), S(0,-1), W(-1,0), then NE, SE, SW, NW.
enum class Dir : uint8_t { N, E, S, W, NE, SE, SW, NW };
GridCoord step(GridCoord c, Dir d);

// Largest supported side length. Keeps tile counts and row-major indices well inside int.
constexpr int GRID_SIZE_MAX = 1024;

struct GridIndex{
    // throws std::invalid_argument outside 1..GRID_SIZE_MAX
    explicit GridIndex(int size);

    int size() const { return n_; }
    int tile_count() const { return n_*n_; }

    bool is_valid(GridCoord c) const { return c.x>=0 && c.z>=0 && c.x<n_ && c.z<n_; }
    std::optional<GridCoord> make(int x, int z) const;
    void require(GridCoord c) const;

    int index_of(GridCoord c) const;
    GridCoord coord_of(int i) const { return GridCoord{ i%n_, i/n_ }; }

    std::vector<GridCoord> neighbors(GridCoord c, bool diagonals) const;

    int chebyshev(GridCoord a, GridCoord b) const;
    int manhattan(GridCoord a, GridCoord b) const;
    // Chebyshev when diagonal steps count as adjacent, Manhattan otherwise.
    int distance(GridCoord a, GridCoord b, bool diagonals) const;

    // Bresenham line, both endpoints included. trace_line(b,a) is the exact reverse of trace_line(a,b).
    std::vector<GridCoord> trace_line(GridCoord a, GridCoord b) const;

private:
    int n_;
};
