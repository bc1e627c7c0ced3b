#include <ssap/Session/PairingHandshake.hpp>
#include <ssap/Protocol/Envelope.hpp>
#include <ssap/Protocol/Endpoints.hpp>
#include <ssap/Protocol/Manifest.hpp>
#include <QDebug>

namespace ssap {

PairingHandshake::PairingHandshake(int handshakeTimeoutMs, int pairingTimeoutMs, QObject* parent)
    : QObject(parent)
    , handshakeTimeoutMs_(handshakeTimeoutMs)
    , pairingTimeoutMs_(pairingTimeoutMs)
{
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, &PairingHandshake::onTimeout);
}

PairingHandshake::~PairingHandshake()
{
    abort();
}

int PairingHandshake::timeoutFor(const QString& clientKey) const
{
    return clientKey.isEmpty() ? pairingTimeoutMs_ : handshakeTimeoutMs_;
}

void PairingHandshake::start(IChannel* channel, const QString& clientKey)
{
    abort();
    channel_ = channel;

    connect(channel, &IChannel::textReceived, this, &PairingHandshake::onText);
    connect(channel, &IChannel::closed, this, &PairingHandshake::onClosed);
    connect(channel, &IChannel::error, this, [this](const QString& message) {
        finish();
        emit failed(ErrorKind::ConnectError, QStringLiteral("WebSocket error: %1").arg(message));
    });

    qDebug() << "[PairingHandshake] register, client key"
             << (clientKey.isEmpty() ? "absent" : "present")
             << "- waiting up to" << timeoutFor(clientKey) << "ms";

    if (!channel->sendText(encodeRegister(clientKey))) {
        finish();
        emit failed(ErrorKind::SendError, QStringLiteral("Failed to send handshake"));
        return;
    }
    timer_.start(timeoutFor(clientKey));
}

void PairingHandshake::abort()
{
    finish();
}

void PairingHandshake::onText(const QString& text)
{
    Envelope envelope;
    if (!Envelope::decode(text, envelope))
        return;

    if (envelope.type == QLatin1String(MessageType::Registered)) {
        const QJsonValue key = envelope.payload.value("client-key");
        const QString clientKey = key.isString() ? key.toString() : QString();
        qInfo() << "[PairingHandshake] registered, key length" << clientKey.size();
        finish();
        emit registered(clientKey);
    } else if (envelope.type == QLatin1String(MessageType::Error)) {
        const QString reason = envelope.error.isEmpty() ? QStringLiteral("Unknown") : envelope.error;
        qWarning() << "[PairingHandshake] rejected:" << reason;
        finish();
        emit failed(ErrorKind::RegistrationError, QStringLiteral("Registration error: %1").arg(reason));
    } else {
        qDebug() << "[PairingHandshake] ignoring" << envelope.type << "while waiting for registration";
    }
}

void PairingHandshake::onClosed()
{
    finish();
    emit failed(ErrorKind::ConnectError, QStringLiteral("Connection closed"));
}

void PairingHandshake::onTimeout()
{
    qWarning() << "[PairingHandshake] no registration reply";
    finish();
    emit failed(ErrorKind::HandshakeTimeout,
                QStringLiteral("Registration timeout - check TV for pairing prompt"));
}

void PairingHandshake::finish()
{
    timer_.stop();
    if (channel_)
        disconnect(channel_, nullptr, this, nullptr);
    channel_ = nullptr;
}

} // namespace ssap
