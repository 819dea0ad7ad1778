// src/Game/VisibilityEngine.cpp

#include "Game/VisibilityEngine.h"
#include "Utils/Logger.h"

#include <algorithm>
#include <cmath>

VisionGrid::VisionGrid()
    : m_width(0)
    , m_height(0)
    , m_cellSize(1.0f)
{
}

VisionGrid::VisionGrid(int width, int height, float cellSize)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height))
    , m_cellSize(cellSize > 0.0f ? cellSize : 1.0f)
    , m_cells(static_cast<size_t>(m_width) * m_height, 0)
{
}

void VisionGrid::Clear() {
    std::fill(m_cells.begin(), m_cells.end(), 0);
}

void VisionGrid::SetVisible(int x, int y, bool visible) {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) return;
    m_cells[static_cast<size_t>(y) * m_width + x] = visible ? 1 : 0;
}

bool VisionGrid::IsCellVisible(int x, int y) const {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) return false;
    return m_cells[static_cast<size_t>(y) * m_width + x] != 0;
}

bool VisionGrid::IsVisible(const Vector3& world) const {
    int cx = static_cast<int>(std::floor(world.x / m_cellSize));
    int cy = static_cast<int>(std::floor(world.y / m_cellSize));
    return IsCellVisible(cx, cy);
}

size_t VisionGrid::CountVisible() const {
    return static_cast<size_t>(std::count(m_cells.begin(), m_cells.end(), 1));
}

void VisionGrid::RevealDisk(const Vector3& center, float radius) {
    if (radius < 0.0f || m_cells.empty()) return;

    int minX = std::max(0, static_cast<int>(std::floor((center.x - radius) / m_cellSize)));
    int maxX = std::min(m_width - 1, static_cast<int>(std::floor((center.x + radius) / m_cellSize)));
    int minY = std::max(0, static_cast<int>(std::floor((center.y - radius) / m_cellSize)));
    int maxY = std::min(m_height - 1, static_cast<int>(std::floor((center.y + radius) / m_cellSize)));
    const float r2 = radius * radius;

    for (int y = minY; y <= maxY; ++y) {
        float cellMinY = y * m_cellSize;
        float nearY = std::clamp(center.y, cellMinY, cellMinY + m_cellSize);
        float dy = nearY - center.y;
        for (int x = minX; x <= maxX; ++x) {
            float cellMinX = x * m_cellSize;
            float nearX = std::clamp(center.x, cellMinX, cellMinX + m_cellSize);
            float dx = nearX - center.x;
            if (dx * dx + dy * dy <= r2) {
                m_cells[static_cast<size_t>(y) * m_width + x] = 1;
            }
        }
    }
}

float VisionGrid::ChangedFraction(const VisionGrid& other) const {
    if (m_width != other.m_width || m_height != other.m_height) return 1.0f;
    if (m_cells.empty()) return 0.0f;
    size_t changed = 0;
    for (size_t i = 0; i < m_cells.size(); ++i) {
        if (m_cells[i] != other.m_cells[i]) ++changed;
    }
    return static_cast<float>(changed) / static_cast<float>(m_cells.size());
}

std::vector<uint8_t> VisionGrid::Pack() const {
    std::vector<uint8_t> bits((m_cells.size() + 7) / 8, 0);
    for (size_t i = 0; i < m_cells.size(); ++i) {
        if (m_cells[i]) bits[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
    }
    return bits;
}

bool VisionGrid::Unpack(int width, int height, float cellSize,
                        const std::vector<uint8_t>& bits, VisionGrid& out) {
    if (width < 0 || height < 0) return false;
    size_t cells = static_cast<size_t>(width) * height;
    if (bits.size() != (cells + 7) / 8) {
        Logger::Warn("VisionGrid::Unpack: %zu bytes for %dx%d grid", bits.size(), width, height);
        return false;
    }
    VisionGrid grid(width, height, cellSize);
    for (size_t i = 0; i < cells; ++i) {
        grid.m_cells[i] = (bits[i / 8] >> (i % 8)) & 1u;
    }
    out = std::move(grid);
    return true;
}

bool VisionGrid::operator==(const VisionGrid& other) const {
    return m_width == other.m_width && m_height == other.m_height && m_cells == other.m_cells;
}

VisibilityEngine::VisibilityEngine(float mapWidth, float mapHeight, float cellSize,
                                   float stealthRevealRadius)
    : m_stealthRevealRadius(stealthRevealRadius)
{
    float cs = cellSize > 0.0f ? cellSize : 1.0f;
    int w = static_cast<int>(std::ceil(mapWidth / cs));
    int h = static_cast<int>(std::ceil(mapHeight / cs));
    m_grids.emplace(TEAM_A, VisionGrid(w, h, cs));
    m_grids.emplace(TEAM_B, VisionGrid(w, h, cs));
    m_empty = VisionGrid(w, h, cs);
    Logger::Info("VisibilityEngine: %dx%d cells of %.1f", w, h, cs);
}

void VisibilityEngine::Recompute(const EntityStore& store) {
    for (auto& [team, grid] : m_grids) {
        grid.Clear();
    }
    for (const Unit* u : store.GetAllUnits()) {
        if (!u->IsAlive()) continue;
        auto it = m_grids.find(u->GetTeam());
        if (it == m_grids.end()) continue;
        it->second.RevealDisk(u->GetPosition(), u->GetArchetype().visionRange);
    }
}

const VisionGrid& VisibilityEngine::GetGrid(TeamId team) const {
    auto it = m_grids.find(team);
    return it == m_grids.end() ? m_empty : it->second;
}

bool VisibilityEngine::IsVisible(TeamId team, const Vector3& world) const {
    return GetGrid(team).IsVisible(world);
}

bool VisibilityEngine::CanObserve(const EntityStore& store, TeamId viewer, const Unit& unit) const {
    if (unit.GetTeam() == viewer) return true;
    if (!IsVisible(viewer, unit.GetPosition())) return false;
    return !IsConcealed(store, unit, viewer, m_stealthRevealRadius);
}

bool VisibilityEngine::IsConcealed(const EntityStore& store, const Unit& unit,
                                   TeamId viewer, float revealRadius) {
    if (!unit.IsStealthed() || unit.GetTeam() == viewer) return false;
    const float r2 = revealRadius * revealRadius;
    for (const Unit* other : store.GetUnitsOfTeam(viewer)) {
        if (other->IsAlive() &&
            other->GetPosition().DistanceSquared2D(unit.GetPosition()) <= r2) {
            return false;
        }
    }
    return true;
}
