#pragma once

#include <QObject>

#include <ssap/Session/CommandResult.hpp>
#include <ssap/Wake/AdbWaker.hpp>
#include <ssap/Wake/IDatagramSender.hpp>
#include <ssap/Wake/IProcessRunner.hpp>
#include <ssap/Wake/RokuWaker.hpp>
#include <ssap/Wake/WakeOnLanWaker.hpp>
#include <ssap/Wake/WakeTarget.hpp>

namespace ssap {

/// Dispatches a WakeTarget to the matching mechanism. None of them needs a session.
/// The sender and runner are not owned.
class WakeService : public QObject {
    Q_OBJECT
public:
    WakeService(IDatagramSender* sender, IProcessRunner* runner, QObject* parent = nullptr);

    void wake(const WakeTarget& target, ResultCallback done);

    CommandResult wakeOnLan(const QString& mac, const QString& broadcastAddress = QString()) const;
    void wakeAdb(const QString& address, quint16 port, ResultCallback done);
    void wakeRoku(const QString& address, ResultCallback done);

    /// ECP port and connect bound; tests point these at a local server.
    void setRokuEndpoint(quint16 port, int timeoutMs);

private:
    WakeOnLanWaker wol_;
    AdbWaker adb_;
    RokuWaker* roku_;
};

} // namespace ssap
