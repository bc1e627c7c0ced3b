#pragma once

#include <QObject>
#include <QPointer>
#include <QUrl>
#include <functional>

#include <ssap/Transport/IChannel.hpp>
#include <ssap/Transport/ChannelFactory.hpp>
#include <ssap/Session/SessionState.hpp>

namespace ssap {

/// Owns the command and input channels of the one live session.
/// Either channel can be replaced or dropped without touching the other.
class SessionTransport : public QObject {
    Q_OBJECT
public:
    /// channel is null on failure; kind is ConnectTimeout or ConnectError.
    using OpenCallback = std::function<void(IChannel* channel, ErrorKind kind, const QString& error)>;

    SessionTransport(IChannelFactory* factory, int connectTimeoutMs, QObject* parent = nullptr);
    ~SessionTransport() override;

    /// Opens a new channel. The callback runs exactly once. On success the caller
    /// receives ownership (the channel is parented to this transport).
    void openChannel(const QUrl& target, bool secure, OpenCallback done);
    /// Best effort; never reports failure.
    void closeChannel(IChannel* channel);

    IChannel* commandChannel() const { return command_; }
    IChannel* inputChannel() const { return input_; }
    void setCommandChannel(IChannel* channel);
    void setInputChannel(IChannel* channel);
    void closeCommandChannel();
    void closeInputChannel();
    void closeAll();

signals:
    /// The device closed the command channel we still held. A closed input channel is
    /// only dropped; the session reopens it on next use.
    void commandChannelLost();

private:
    IChannelFactory* factory_;
    int connectTimeoutMs_;
    QPointer<IChannel> command_;
    QPointer<IChannel> input_;
};

} // namespace ssap
