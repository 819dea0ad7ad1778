// src/Game/NavigationGrid.h

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "Math/Vector3.h"

struct GridCell {
    int x = 0;
    int y = 0;
    bool operator==(const GridCell& o) const { return x == o.x && y == o.y; }
};

// Walkability grid over the map with A* search. The world origin is the
// grid corner; cell (x,y) covers [x*cellSize, (x+1)*cellSize).
class NavigationGrid {
public:
    NavigationGrid();
    NavigationGrid(int width, int height, float cellSize);

    void  Resize(int width, int height, float cellSize);

    int   GetWidth() const { return m_width; }
    int   GetHeight() const { return m_height; }
    float GetCellSize() const { return m_cellSize; }
    float GetWorldWidth() const { return m_width * m_cellSize; }
    float GetWorldHeight() const { return m_height * m_cellSize; }

    void  SetBlocked(int x, int y, bool blocked);
    bool  IsBlocked(int x, int y) const;
    bool  InBounds(int x, int y) const;
    bool  IsWalkable(const Vector3& world) const;

    GridCell WorldToCell(const Vector3& world) const;
    Vector3  CellCenter(const GridCell& cell) const;

    // Waypoints in world space ending exactly at goal; just {goal} when start
    // shares its cell. nullopt when no route exists or the node budget runs out.
    std::optional<std::vector<Vector3>> FindPath(const Vector3& start, const Vector3& goal,
                                                 int maxNodes = 20000) const;

private:
    int  Index(int x, int y) const { return y * m_width + x; }

    int   m_width;
    int   m_height;
    float m_cellSize;
    std::vector<uint8_t> m_blocked;
};
