#include <ssap/Protocol/NetworkInfo.hpp>
#include <ssap/Protocol/Endpoints.hpp>
#include <QDebug>

namespace ssap {

namespace {

QString stringAt(const QJsonObject& obj, const char* outer, const char* inner)
{
    const QJsonValue v = obj.value(QLatin1String(outer)).toObject().value(QLatin1String(inner));
    return v.isString() ? v.toString() : QString();
}

bool stateConnected(const QJsonObject& payload, const char* key)
{
    return stringAt(payload, key, "state") == QLatin1String("connected");
}

QJsonObject payloadOf(const QJsonObject& envelope)
{
    return envelope.value("payload").toObject();
}

} // namespace

QString InterfaceMacs::firstAvailable() const
{
    return !wifi.isNull() ? wifi : wired;
}

InterfaceMacs extractMacs(const QJsonObject& infoEnvelope)
{
    const QJsonObject payload = payloadOf(infoEnvelope);
    InterfaceMacs macs;
    macs.wifi = stringAt(payload, "wifiInfo", "macAddress");
    macs.wired = stringAt(payload, "wiredInfo", "macAddress");
    return macs;
}

const QList<const char*>& statusEndpoints()
{
    static const QList<const char*> endpoints = {
        Endpoint::ConnectionManagerStatus,
        Endpoint::WifiStatus,
        Endpoint::PalmWifiStatus,
    };
    return endpoints;
}

const QList<ConnectivityShape>& wifiConnectedShapes()
{
    static const QList<ConnectivityShape> shapes = {
        {"payload.wifi.state", [](const QJsonObject& s) {
            return stateConnected(payloadOf(s), "wifi"); }},
        {"payload.wifiInfo.state", [](const QJsonObject& s) {
            return stateConnected(payloadOf(s), "wifiInfo"); }},
        {"payload.isConnected", [](const QJsonObject& s) {
            const QJsonValue v = payloadOf(s).value("isConnected");
            return v.isBool() && v.toBool(); }},
        {"payload.status", [](const QJsonObject& s) {
            return payloadOf(s).value("status").toString() == QLatin1String("connectionStateChanged"); }},
        {"status", [](const QJsonObject& s) {
            return s.value("status").toString() == QLatin1String("connectionStateChanged"); }},
        {"payload.networkInfo", [](const QJsonObject& s) {
            return payloadOf(s).value("networkInfo").isObject(); }},
        {"networkInfo", [](const QJsonObject& s) {
            return s.value("networkInfo").isObject(); }},
    };
    return shapes;
}

bool isWiredConnected(const QJsonObject& statusEnvelope)
{
    return stateConnected(payloadOf(statusEnvelope), "wired");
}

bool isWifiConnected(const QJsonObject& statusEnvelope)
{
    for (const auto& shape : wifiConnectedShapes()) {
        if (shape.matches(statusEnvelope)) {
            qDebug() << "[NetworkInfo] wifi connected via" << shape.name;
            return true;
        }
    }
    return false;
}

QString selectConnectedMac(const InterfaceMacs& macs, const QJsonObject& statusEnvelope)
{
    if (!statusEnvelope.isEmpty()) {
        if (isWiredConnected(statusEnvelope) && !macs.wired.isNull()) {
            qInfo() << "[NetworkInfo] using wired MAC (connected):" << macs.wired;
            return macs.wired;
        }
        if (isWifiConnected(statusEnvelope) && !macs.wifi.isNull()) {
            qInfo() << "[NetworkInfo] using wifi MAC (connected):" << macs.wifi;
            return macs.wifi;
        }
    }
    qWarning() << "[NetworkInfo] could not determine connected interface, using first available MAC";
    return macs.firstAvailable();
}

} // namespace ssap
