#include <ssap/Session/SessionTransport.hpp>
#include <QTimer>
#include <QDebug>
#include <memory>

namespace ssap {

SessionTransport::SessionTransport(IChannelFactory* factory, int connectTimeoutMs, QObject* parent)
    : QObject(parent)
    , factory_(factory)
    , connectTimeoutMs_(connectTimeoutMs)
{
}

SessionTransport::~SessionTransport()
{
    closeAll();
}

void SessionTransport::openChannel(const QUrl& target, bool secure, OpenCallback done)
{
    IChannel* channel = factory_->createChannel(this);
    auto* timer = new QTimer(channel);
    timer->setSingleShot(true);

    // Shared between the possible outcomes; whichever fires first wins.
    auto finished = std::make_shared<bool>(false);
    auto finish = [this, channel, timer, finished, done](ErrorKind kind, const QString& error) {
        if (*finished) return;
        *finished = true;
        timer->stop();
        disconnect(channel, nullptr, this, nullptr);
        if (kind == ErrorKind::None) {
            done(channel, kind, QString());
            return;
        }
        qWarning() << "[SessionTransport] open failed:" << error;
        channel->close();
        channel->deleteLater();
        done(nullptr, kind, error);
    };

    connect(channel, &IChannel::opened, this, [finish]() {
        finish(ErrorKind::None, QString());
    });
    connect(channel, &IChannel::error, this, [finish](const QString& message) {
        finish(ErrorKind::ConnectError, QStringLiteral("WebSocket connection failed: %1").arg(message));
    });
    connect(channel, &IChannel::closed, this, [finish]() {
        finish(ErrorKind::ConnectError, QStringLiteral("WebSocket connection failed: closed during connect"));
    });
    connect(timer, &QTimer::timeout, this, [finish]() {
        finish(ErrorKind::ConnectTimeout, QStringLiteral("Connection timeout"));
    });

    timer->start(connectTimeoutMs_);
    channel->open(target, secure);
}

void SessionTransport::closeChannel(IChannel* channel)
{
    if (!channel) return;
    disconnect(channel, nullptr, this, nullptr);
    channel->close();
    channel->deleteLater();
}

void SessionTransport::setCommandChannel(IChannel* channel)
{
    closeCommandChannel();
    command_ = channel;
    if (!channel) return;
    connect(channel, &IChannel::closed, this, [this, channel]() {
        if (command_ != channel) return;
        qWarning() << "[SessionTransport] command channel closed by device";
        emit commandChannelLost();
    });
}

void SessionTransport::setInputChannel(IChannel* channel)
{
    closeInputChannel();
    input_ = channel;
    if (!channel) return;
    connect(channel, &IChannel::closed, this, [this, channel]() {
        if (input_ != channel) return;
        qInfo() << "[SessionTransport] input channel closed by device";
        input_ = nullptr;
        channel->deleteLater();
    });
}

void SessionTransport::closeCommandChannel()
{
    IChannel* channel = command_;
    command_ = nullptr;
    closeChannel(channel);
}

void SessionTransport::closeInputChannel()
{
    IChannel* channel = input_;
    input_ = nullptr;
    closeChannel(channel);
}

void SessionTransport::closeAll()
{
    closeInputChannel();
    closeCommandChannel();
}

} // namespace ssap
