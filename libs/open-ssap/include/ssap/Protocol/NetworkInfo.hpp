#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>

namespace ssap {

struct InterfaceMacs {
    QString wifi;   // null when the TV reports none
    QString wired;

    QString firstAvailable() const;
};

/// One known shape of a "this interface is connected" answer.
struct ConnectivityShape {
    const char* name;
    bool (*matches)(const QJsonObject& status);
};

/// MAC addresses from a connectionmanager/getinfo reply envelope.
InterfaceMacs extractMacs(const QJsonObject& infoEnvelope);

/// Status endpoints, probed in this order until one answers without "error".
const QList<const char*>& statusEndpoints();

/// Shapes that mean "wifi is connected", in priority order. Firmware differs in which
/// (if any) it produces, so none of them is authoritative.
const QList<ConnectivityShape>& wifiConnectedShapes();

bool isWiredConnected(const QJsonObject& statusEnvelope);
bool isWifiConnected(const QJsonObject& statusEnvelope);

/// Wired if connected, else wifi if connected, else first available.
/// Pass an empty status when no status endpoint answered.
QString selectConnectedMac(const InterfaceMacs& macs, const QJsonObject& statusEnvelope);

} // namespace ssap
