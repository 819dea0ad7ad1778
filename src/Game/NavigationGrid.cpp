// src/Game/NavigationGrid.cpp

#include "Game/NavigationGrid.h"
#include "Utils/Logger.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <queue>

namespace {

// Octile heuristic in tenths of a cell
int Heuristic(const GridCell& a, const GridCell& b) {
    int dx = std::abs(a.x - b.x);
    int dy = std::abs(a.y - b.y);
    return 10 * (dx + dy) - 6 * std::min(dx, dy);
}

struct OpenNode {
    int f;
    int index;
};

struct OpenNodeGreater {
    bool operator()(const OpenNode& a, const OpenNode& b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.index > b.index;
    }
};

const int kDirs[8][2] = {{1,0},{-1,0},{0,1},{0,-1},{1,1},{1,-1},{-1,1},{-1,-1}};

}

NavigationGrid::NavigationGrid()
    : m_width(0)
    , m_height(0)
    , m_cellSize(1.0f)
{
}

NavigationGrid::NavigationGrid(int width, int height, float cellSize)
    : NavigationGrid()
{
    Resize(width, height, cellSize);
}

void NavigationGrid::Resize(int width, int height, float cellSize) {
    m_width = std::max(0, width);
    m_height = std::max(0, height);
    m_cellSize = cellSize > 0.0f ? cellSize : 1.0f;
    m_blocked.assign(static_cast<size_t>(m_width) * m_height, 0);
}

void NavigationGrid::SetBlocked(int x, int y, bool blocked) {
    if (!InBounds(x, y)) return;
    m_blocked[Index(x, y)] = blocked ? 1 : 0;
}

bool NavigationGrid::IsBlocked(int x, int y) const {
    if (!InBounds(x, y)) return true;
    return m_blocked[Index(x, y)] != 0;
}

bool NavigationGrid::InBounds(int x, int y) const {
    return x >= 0 && y >= 0 && x < m_width && y < m_height;
}

bool NavigationGrid::IsWalkable(const Vector3& world) const {
    auto c = WorldToCell(world);
    return !IsBlocked(c.x, c.y);
}

GridCell NavigationGrid::WorldToCell(const Vector3& world) const {
    return GridCell{static_cast<int>(std::floor(world.x / m_cellSize)),
                    static_cast<int>(std::floor(world.y / m_cellSize))};
}

Vector3 NavigationGrid::CellCenter(const GridCell& cell) const {
    return Vector3((cell.x + 0.5f) * m_cellSize, (cell.y + 0.5f) * m_cellSize, 0.0f);
}

std::optional<std::vector<Vector3>> NavigationGrid::FindPath(const Vector3& start, const Vector3& goal,
                                                             int maxNodes) const {
    GridCell s = WorldToCell(start);
    GridCell g = WorldToCell(goal);

    if (IsBlocked(g.x, g.y)) {
        Logger::Debug("FindPath: goal (%.1f,%.1f) not walkable", goal.x, goal.y);
        return std::nullopt;
    }
    if (s == g) {
        return std::vector<Vector3>{goal};
    }
    // Starting on a blocked cell is fine, the unit walks off it
    if (!InBounds(s.x, s.y)) {
        Logger::Debug("FindPath: start (%.1f,%.1f) outside grid", start.x, start.y);
        return std::nullopt;
    }

    const int cellCount = m_width * m_height;
    std::vector<int> gCost(cellCount, std::numeric_limits<int>::max());
    std::vector<int> parent(cellCount, -1);
    std::vector<uint8_t> closed(cellCount, 0);
    std::priority_queue<OpenNode, std::vector<OpenNode>, OpenNodeGreater> open;

    const int startIdx = Index(s.x, s.y);
    const int goalIdx = Index(g.x, g.y);
    gCost[startIdx] = 0;
    open.push({Heuristic(s, g), startIdx});

    int processed = 0;
    bool found = false;
    while (!open.empty()) {
        OpenNode node = open.top();
        open.pop();
        if (closed[node.index]) continue;
        closed[node.index] = 1;

        if (node.index == goalIdx) {
            found = true;
            break;
        }
        if (++processed > maxNodes) {
            Logger::Debug("FindPath: node budget %d exhausted", maxNodes);
            break;
        }

        int cx = node.index % m_width;
        int cy = node.index / m_width;
        for (int i = 0; i < 8; ++i) {
            int nx = cx + kDirs[i][0];
            int ny = cy + kDirs[i][1];
            if (IsBlocked(nx, ny)) continue;
            bool diagonal = i >= 4;
            // No corner cutting
            if (diagonal && (IsBlocked(cx + kDirs[i][0], cy) || IsBlocked(cx, cy + kDirs[i][1]))) {
                continue;
            }
            int nIdx = Index(nx, ny);
            if (closed[nIdx]) continue;
            int cost = gCost[node.index] + (diagonal ? 14 : 10);
            if (cost < gCost[nIdx]) {
                gCost[nIdx] = cost;
                parent[nIdx] = node.index;
                open.push({cost + Heuristic(GridCell{nx, ny}, g), nIdx});
            }
        }
    }

    if (!found) {
        return std::nullopt;
    }

    std::vector<Vector3> path;
    for (int cur = parent[goalIdx]; cur != -1 && cur != startIdx; cur = parent[cur]) {
        path.push_back(CellCenter(GridCell{cur % m_width, cur / m_width}));
    }
    std::reverse(path.begin(), path.end());
    path.push_back(goal);
    return path;
}
