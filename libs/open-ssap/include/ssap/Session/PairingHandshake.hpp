#pragma once

#include <QObject>
#include <QPointer>
#include <QTimer>

#include <ssap/Transport/IChannel.hpp>
#include <ssap/Session/SessionState.hpp>

namespace ssap {

/// Registration exchange over an already-open command channel.
///
/// Sends the "register" frame, then waits for "registered" or "error" while ignoring
/// anything else (the TV sends interim pairing-prompt frames). With a client key the
/// wait is short; without one the user has to accept a prompt on the TV, so the
/// wait is long. Running out of time is reported as HandshakeTimeout, an explicit
/// rejection as RegistrationError.
class PairingHandshake : public QObject {
    Q_OBJECT
public:
    PairingHandshake(int handshakeTimeoutMs, int pairingTimeoutMs, QObject* parent = nullptr);
    ~PairingHandshake() override;

    void start(IChannel* channel, const QString& clientKey);
    void abort();
    bool isRunning() const { return channel_ != nullptr; }

    /// Wait bound that start() will apply for the given key.
    int timeoutFor(const QString& clientKey) const;

signals:
    /// clientKey is null when the TV did not return one.
    void registered(const QString& clientKey);
    void failed(ssap::ErrorKind kind, const QString& reason);

private:
    void onText(const QString& text);
    void onClosed();
    void onTimeout();
    void finish();

    int handshakeTimeoutMs_;
    int pairingTimeoutMs_;
    QPointer<IChannel> channel_;
    QTimer timer_;
};

} // namespace ssap
