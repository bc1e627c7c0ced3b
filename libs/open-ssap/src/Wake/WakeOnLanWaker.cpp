#include <ssap/Wake/WakeOnLanWaker.hpp>
#include <ssap/Wake/MagicPacket.hpp>
#include <ssap/Version.hpp>
#include <QDebug>

namespace ssap {

WakeOnLanWaker::WakeOnLanWaker(IDatagramSender* sender)
    : sender_(sender)
{
}

CommandResult WakeOnLanWaker::wake(const QString& mac, const QString& broadcastAddress) const
{
    QByteArray address;
    QString error;
    if (!parseMacAddress(mac, address, &error))
        return CommandResult::failure(ErrorKind::FormatError, error);

    const QByteArray packet = buildMagicPacket(address);
    if (!sender_->sendDatagram(packet, QHostAddress(QHostAddress::Broadcast), WOL_PORT, error))
        return CommandResult::failure(ErrorKind::WakeError,
                                      QStringLiteral("WoL send failed: %1").arg(error));
    qInfo() << "[WakeOnLan] magic packet sent for" << formatMacAddress(address);

    const QString subnet = broadcastAddress.trimmed();
    if (!subnet.isEmpty()) {
        const QHostAddress host(subnet);
        if (host.isNull()) {
            qWarning() << "[WakeOnLan] ignoring invalid broadcast address" << subnet;
        } else {
            for (quint16 port : {WOL_PORT, WOL_LEGACY_PORT}) {
                QString secondaryError;
                if (!sender_->sendDatagram(packet, host, port, secondaryError))
                    qWarning() << "[WakeOnLan] send to" << subnet << port << "failed:" << secondaryError;
            }
        }
    }

    return CommandResult::okWithMessage(QStringLiteral("Wake-on-LAN packet sent"));
}

} // namespace ssap
