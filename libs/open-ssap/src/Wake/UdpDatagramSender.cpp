#include <ssap/Wake/IDatagramSender.hpp>
#include <QUdpSocket>

namespace ssap {

bool UdpDatagramSender::sendDatagram(const QByteArray& data, const QHostAddress& host,
                                     quint16 port, QString& error)
{
    QUdpSocket socket;
    if (!socket.bind(QHostAddress::AnyIPv4, 0)) {
        error = QStringLiteral("Failed to bind socket: %1").arg(socket.errorString());
        return false;
    }

    const qint64 written = socket.writeDatagram(data, host, port);
    if (written != data.size()) {
        error = QStringLiteral("Failed to send packet: %1").arg(socket.errorString());
        return false;
    }
    return true;
}

} // namespace ssap
