#include <ssap/Wake/WakeService.hpp>
#include <QDebug>

namespace ssap {

WakeService::WakeService(IDatagramSender* sender, IProcessRunner* runner, QObject* parent)
    : QObject(parent)
    , wol_(sender)
    , adb_(runner)
    , roku_(new RokuWaker(ECP_PORT, 5000, this))
{
}

void WakeService::wake(const WakeTarget& target, ResultCallback done)
{
    qDebug() << "[WakeService] wake via" << WakeTarget::kindName(target.kind);
    switch (target.kind) {
    case WakeTarget::Kind::WakeOnLan:
        done(wakeOnLan(target.mac, target.broadcastAddress));
        return;
    case WakeTarget::Kind::Adb:
        wakeAdb(target.address, target.port, done);
        return;
    case WakeTarget::Kind::Roku:
        wakeRoku(target.address, done);
        return;
    }
    done(CommandResult::failure(ErrorKind::WakeError, QStringLiteral("Unknown wake mechanism")));
}

CommandResult WakeService::wakeOnLan(const QString& mac, const QString& broadcastAddress) const
{
    return wol_.wake(mac, broadcastAddress);
}

void WakeService::wakeAdb(const QString& address, quint16 port, ResultCallback done)
{
    adb_.wake(address, port, done);
}

void WakeService::wakeRoku(const QString& address, ResultCallback done)
{
    roku_->wake(address, done);
}

void WakeService::setRokuEndpoint(quint16 port, int timeoutMs)
{
    roku_->deleteLater();
    roku_ = new RokuWaker(port, timeoutMs, this);
}

} // namespace ssap
