#include <ssap/Wake/WakeTarget.hpp>

namespace ssap {

WakeTarget WakeTarget::wakeOnLan(const QString& mac, const QString& broadcastAddress)
{
    WakeTarget target;
    target.kind = Kind::WakeOnLan;
    target.mac = mac;
    target.broadcastAddress = broadcastAddress;
    return target;
}

WakeTarget WakeTarget::adb(const QString& address, quint16 port)
{
    WakeTarget target;
    target.kind = Kind::Adb;
    target.address = address;
    target.port = port;
    return target;
}

WakeTarget WakeTarget::roku(const QString& address)
{
    WakeTarget target;
    target.kind = Kind::Roku;
    target.address = address;
    return target;
}

const char* WakeTarget::kindName(Kind kind)
{
    switch (kind) {
    case Kind::WakeOnLan: return "wol";
    case Kind::Adb: return "adb";
    case Kind::Roku: return "roku";
    }
    return "unknown";
}

bool WakeTarget::kindFromName(const QString& name, Kind& out)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("wol")) out = Kind::WakeOnLan;
    else if (key == QLatin1String("adb")) out = Kind::Adb;
    else if (key == QLatin1String("roku")) out = Kind::Roku;
    else return false;
    return true;
}

} // namespace ssap
