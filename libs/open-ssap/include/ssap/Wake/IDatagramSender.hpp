#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QString>

namespace ssap {

class IDatagramSender {
public:
    virtual ~IDatagramSender() = default;

    /// Fire-and-forget UDP send with broadcast enabled. Returns false with error filled
    /// when the datagram could not be handed to the network stack.
    virtual bool sendDatagram(const QByteArray& data, const QHostAddress& host,
                              quint16 port, QString& error) = 0;
};

class UdpDatagramSender : public IDatagramSender {
public:
    bool sendDatagram(const QByteArray& data, const QHostAddress& host,
                      quint16 port, QString& error) override;
};

} // namespace ssap
