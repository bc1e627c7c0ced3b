#pragma once

#include <QObject>
#include <QString>
#include <QUrl>

namespace ssap {

/// A bidirectional, message-framed connection to the TV.
/// Both the command channel and the pointer input channel are IChannels.
class IChannel : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IChannel() override = default;

    virtual void open(const QUrl& url, bool secure) = 0;
    virtual void close() = 0;
    /// Returns false when the frame could not be handed to the socket.
    virtual bool sendText(const QString& text) = 0;
    virtual bool isOpen() const = 0;

signals:
    void opened();
    void closed();
    void textReceived(const QString& text);
    void error(const QString& message);
};

} // namespace ssap
