#pragma once
#include "core/Grid.hpp"

#include <numeric>
#include <queue>
#include <string>
#include <vector>

struct UnionFind
{
    std::vector<size_t> parent;

    explicit UnionFind(size_t n) : parent(n) { std::iota(parent.begin(), parent.end(), 0); }

    size_t Find(size_t x)
    {
        while (parent[x] != x)
        {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    }

    // false if a and b were already joined
    bool Unite(size_t a, size_t b)
    {
        a = Find(a);
        b = Find(b);
        if (a == b) return false;
        parent[a] = b;
        return true;
    }
};

inline size_t CellIndex(const Grid& g, const CellCoord& c)
{
    return static_cast<size_t>(c.row) * static_cast<size_t>(g.Width()) + static_cast<size_t>(c.col);
}

// number of cells reachable from (0,0) through open passages
inline size_t ReachableFromOrigin(const Grid& g)
{
    std::vector<bool> seen(g.CellCount(), false);
    std::queue<CellCoord> q;
    q.push({0, 0});
    seen[0] = true;
    size_t count = 0;

    while (!q.empty())
    {
        const CellCoord cur = q.front();
        q.pop();
        ++count;
        for (Direction d : kAllDirections)
        {
            CellCoord n{};
            if (!g.Neighbor(cur, d, n) || g.HasWall(cur, d)) continue;
            if (seen[CellIndex(g, n)]) continue;
            seen[CellIndex(g, n)] = true;
            q.push(n);
        }
    }
    return count;
}

// every shared wall agrees on both sides
inline bool WallsConsistent(const Grid& g)
{
    for (int32_t r = 0; r < g.Height(); ++r)
    {
        for (int32_t c = 0; c < g.Width(); ++c)
        {
            for (Direction d : kAllDirections)
            {
                CellCoord n{};
                if (!g.Neighbor({r, c}, d, n)) continue;
                if (g.HasWall({r, c}, d) != g.HasWall(n, Opposite(d))) return false;
            }
        }
    }
    return true;
}

// "NESW" flags of a cell, '1' = wall
inline std::string WallString(const Grid& g, int32_t row, int32_t col)
{
    std::string s;
    for (Direction d : kAllDirections) s += g.HasWall({row, col}, d) ? '1' : '0';
    return s;
}
