#include <ssap/Session/CommandCorrelator.hpp>
#include <ssap/Protocol/Envelope.hpp>
#include <QDebug>

namespace ssap {

CommandCorrelator::CommandCorrelator(int responseTimeoutMs, QObject* parent)
    : QObject(parent)
    , responseTimeoutMs_(responseTimeoutMs)
{
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, [this]() {
        Reply reply;
        reply.kind = ErrorKind::ResponseTimeout;
        reply.error = QStringLiteral("Command timeout (disconnected)");
        complete(reply);
    });
}

CommandCorrelator::~CommandCorrelator()
{
    timer_.stop();
    if (channel_)
        disconnect(channel_, nullptr, this, nullptr);
}

QString CommandCorrelator::lastRequestId() const
{
    return counter_ == 0 ? QString() : QStringLiteral("cmd_%1").arg(counter_);
}

void CommandCorrelator::send(IChannel* channel, const QString& uri, const QJsonObject& payload,
                             ReplyCallback done)
{
    if (pending_) {
        qWarning() << "[CommandCorrelator] call already in flight, rejecting" << uri;
        Reply reply;
        reply.kind = ErrorKind::SendError;
        reply.error = QStringLiteral("Another command is in flight");
        done(reply);
        return;
    }

    ++counter_;
    const QString id = lastRequestId();
    qDebug() << "[CommandCorrelator] TX" << id << uri;

    if (!channel || !channel->sendText(Envelope::encodeRequest(id, uri, payload))) {
        Reply reply;
        reply.kind = ErrorKind::SendError;
        reply.error = QStringLiteral("Send failed (disconnected)");
        done(reply);
        return;
    }

    channel_ = channel;
    pending_ = std::move(done);
    connect(channel, &IChannel::textReceived, this, &CommandCorrelator::onText);
    connect(channel, &IChannel::closed, this, [this]() {
        Reply reply;
        reply.kind = ErrorKind::ChannelClosed;
        reply.error = QStringLiteral("Connection closed");
        complete(reply);
    });
    connect(channel, &IChannel::error, this, [this](const QString& message) {
        Reply reply;
        reply.kind = ErrorKind::ChannelClosed;
        reply.error = QStringLiteral("WebSocket error: %1").arg(message);
        complete(reply);
    });
    timer_.start(responseTimeoutMs_);
}

void CommandCorrelator::onText(const QString& text)
{
    Envelope envelope;
    if (!Envelope::decode(text, envelope)) {
        qDebug() << "[CommandCorrelator] skipping undecodable frame";
        return;
    }
    Reply reply;
    reply.envelope = envelope.raw;
    complete(reply);
}

void CommandCorrelator::complete(const Reply& reply)
{
    if (!pending_) return;
    timer_.stop();
    if (channel_)
        disconnect(channel_, nullptr, this, nullptr);
    channel_ = nullptr;

    ReplyCallback done = std::move(pending_);
    pending_ = nullptr;
    if (!reply.ok())
        qWarning() << "[CommandCorrelator]" << reply.error;
    done(reply);
}

} // namespace ssap
