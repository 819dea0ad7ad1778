// src/Game/VisibilityEngine.h – Per-team vision grids and snapshot filtering

#pragma once

#include <cstdint>
#include <map>
#include <vector>
#include "Game/EntityStore.h"
#include "Game/GameTypes.h"
#include "Math/Vector3.h"

class VisionGrid {
public:
    VisionGrid();
    VisionGrid(int width, int height, float cellSize);

    int   GetWidth() const { return m_width; }
    int   GetHeight() const { return m_height; }
    float GetCellSize() const { return m_cellSize; }
    size_t CellCount() const { return m_cells.size(); }

    void  Clear();
    void  SetVisible(int x, int y, bool visible);
    bool  IsCellVisible(int x, int y) const;
    // False outside the grid
    bool  IsVisible(const Vector3& world) const;
    size_t CountVisible() const;

    // Marks every cell whose nearest point lies within radius of center
    void  RevealDisk(const Vector3& center, float radius);

    // Fraction of cells that differ; 1.0 when dimensions differ
    float ChangedFraction(const VisionGrid& other) const;

    // One bit per cell, row-major, LSB first
    std::vector<uint8_t> Pack() const;
    static bool Unpack(int width, int height, float cellSize,
                       const std::vector<uint8_t>& bits, VisionGrid& out);

    bool operator==(const VisionGrid& other) const;
    bool operator!=(const VisionGrid& other) const { return !(*this == other); }

private:
    int   m_width;
    int   m_height;
    float m_cellSize;
    std::vector<uint8_t> m_cells;
};

class VisibilityEngine {
public:
    VisibilityEngine(float mapWidth, float mapHeight, float cellSize, float stealthRevealRadius);

    // Full rebuild of both team grids from live unit positions
    void Recompute(const EntityStore& store);

    const VisionGrid& GetGrid(TeamId team) const;
    bool IsVisible(TeamId team, const Vector3& world) const;

    // Own units always; enemies when their cell is visible and they are not concealed
    bool CanObserve(const EntityStore& store, TeamId viewer, const Unit& unit) const;

    float GetStealthRevealRadius() const { return m_stealthRevealRadius; }

    // A stealthed unit stays hidden from viewer unless one of viewer's live
    // units is within revealRadius of it
    static bool IsConcealed(const EntityStore& store, const Unit& unit,
                            TeamId viewer, float revealRadius);

private:
    std::map<TeamId, VisionGrid> m_grids;
    VisionGrid m_empty;
    float m_stealthRevealRadius;
};
