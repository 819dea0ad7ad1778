// src/Client/ClientWorldMirror.h – Client-side shadow of the host world

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include "Game/GameEvents.h"
#include "Protocol/SnapshotCodec.h"

struct MirroredUnit {
    UnitSnapshot authoritative;     // latest from the host
    Vector3      renderPosition;
    float        renderYaw = 0.0f;
    Vector3      fromPosition;
    float        fromYaw = 0.0f;
    float        blend = 1.0f;      // 0 → from, 1 → authoritative
    std::string  annotation;        // client-local, never touched by merges
};

// Rendering seam. Hidden units left the observer's view and may come
// back; destroyed units died on the host.
class IEntityPresenter {
public:
    virtual ~IEntityPresenter() = default;
    virtual void OnUnitCreated(const MirroredUnit& unit) = 0;
    virtual void OnUnitHidden(UnitId id) = 0;
    virtual void OnUnitDestroyed(UnitId id) = 0;
    virtual void OnControlPointChanged(const ControlPointSnapshot& point) = 0;
};

class ClientWorldMirror {
public:
    // blendSeconds is how long a unit takes to reach a new authoritative pose
    explicit ClientWorldMirror(IEntityPresenter* presenter = nullptr, float blendSeconds = 0.1f);

    // False when older than (or equal to) the last applied snapshot
    bool ApplySnapshot(const WorldSnapshot& snapshot);
    void ApplyEvent(const GameEvent& event);
    void ApplyFog(const FogUpdate& fog);

    // Advances interpolation of every mirrored unit
    void Update(float dt);

    const MirroredUnit* FindUnit(UnitId id) const;
    const std::map<UnitId, MirroredUnit>& GetUnits() const { return m_units; }
    std::optional<ControlPointSnapshot> FindControlPoint(PointId id) const;
    const VisionGrid& GetFog() const { return m_fog; }

    bool IsDestroyed(UnitId id) const { return m_destroyed.count(id) != 0; }
    std::optional<uint32_t> GetLastAppliedTick() const { return m_lastTick; }

    bool SetAnnotation(UnitId id, const std::string& text);
    void ClearAnnotation(UnitId id) { SetAnnotation(id, std::string()); }

    void Clear();

private:
    void CreateUnit(const UnitSnapshot& snap);
    void HideUnit(UnitId id);

    IEntityPresenter*                     m_presenter;
    float                                 m_blendSeconds;
    std::map<UnitId, MirroredUnit>        m_units;
    std::map<UnitId, std::string>         m_hidden;      // id → kept annotation
    std::set<UnitId>                      m_destroyed;
    std::map<PointId, ControlPointSnapshot> m_points;
    VisionGrid                            m_fog;
    std::optional<uint32_t>               m_lastTick;
};
