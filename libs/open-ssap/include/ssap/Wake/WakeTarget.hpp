#pragma once

#include <QString>
#include <ssap/Version.hpp>

namespace ssap {

/// A device that can be woken, and how.
struct WakeTarget {
    enum class Kind { WakeOnLan, Adb, Roku };

    Kind kind = Kind::WakeOnLan;
    QString mac;                // WakeOnLan
    QString broadcastAddress;   // WakeOnLan, optional subnet broadcast
    QString address;            // Adb, Roku
    quint16 port = 0;           // Adb; 0 means ADB_DEFAULT_PORT

    static WakeTarget wakeOnLan(const QString& mac, const QString& broadcastAddress = QString());
    static WakeTarget adb(const QString& address, quint16 port = ADB_DEFAULT_PORT);
    static WakeTarget roku(const QString& address);

    static const char* kindName(Kind kind);
    /// Accepts the names kindName() produces ("wol", "adb", "roku").
    static bool kindFromName(const QString& name, Kind& out);
};

} // namespace ssap
