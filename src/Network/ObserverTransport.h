// src/Network/ObserverTransport.h

#pragma once

#include "Game/GameTypes.h"
#include "Network/Packet.h"

// Outbound seam used by replication. Implementations decide framing;
// SendReliable packets arrive exactly once and in order or the peer is
// eventually disconnected.
class IObserverTransport {
public:
    virtual ~IObserverTransport() = default;
    virtual bool SendUnreliable(ConnectionId conn, const Packet& packet) = 0;
    virtual bool SendReliable(ConnectionId conn, const Packet& packet) = 0;
    virtual void Disconnect(ConnectionId conn) = 0;
};
