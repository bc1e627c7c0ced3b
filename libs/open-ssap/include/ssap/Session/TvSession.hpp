#pragma once

#include <QJsonObject>
#include <QObject>
#include <QQueue>
#include <QTimer>
#include <QUrl>

#include <ssap/Transport/ChannelFactory.hpp>
#include <ssap/Protocol/NetworkInfo.hpp>
#include <ssap/Session/CommandCorrelator.hpp>
#include <ssap/Session/CommandResult.hpp>
#include <ssap/Session/PairingHandshake.hpp>
#include <ssap/Session/SessionConfig.hpp>
#include <ssap/Session/SessionState.hpp>
#include <ssap/Session/SessionTransport.hpp>

namespace ssap {

/// The one live session with a TV.
///
/// Every operation that touches the channels or the connection state goes through a
/// FIFO queue and runs alone; the next one starts when the running one completes.
/// Timer waits (keepalive period, refresh grace) happen outside the queue.
///
/// Any I/O failure on the command channel is fatal: the session drops both channels
/// and goes back to Disconnected. There is no automatic reconnect. Commands issued
/// while disconnected fail with NotConnected without touching the network.
class TvSession : public QObject {
    Q_OBJECT
public:
    TvSession(IChannelFactory* factory, const SessionConfig& config, QObject* parent = nullptr);
    ~TvSession() override;

    /// Closes whatever is left of a previous session, opens the command channel and
    /// registers. On success the result carries the client key the TV returned
    /// (null if none) for the caller to persist.
    void connectToDevice(const QString& deviceId, const QString& address,
                         const QString& clientKey, bool secure, ResultCallback done);
    void disconnectFromDevice(ResultCallback done = {});

    bool isConnected() const;
    SessionState state() const { return state_; }
    QString deviceId() const { return deviceId_; }
    QString address() const { return address_; }
    bool isSecure() const { return secure_; }
    QString clientKey() const { return clientKey_; }
    bool hasInputChannel() const;
    const SessionConfig& config() const { return config_; }

    void sendButton(const QString& buttonName, ResultCallback done);
    void volumeUp(ResultCallback done);
    void volumeDown(ResultCallback done);
    void setMute(bool mute, ResultCallback done);
    /// The TV drops its sockets right after turning off, so success also ends the session.
    void powerOff(ResultCallback done);
    /// Raw request; the reply envelope is returned in CommandResult::payload.
    void sendCommand(const QString& uri, const QJsonObject& payload, ResultCallback done);
    /// Closes and reopens the pointer input channel.
    void refreshInputChannel(ResultCallback done);
    /// MAC of the interface the TV is connected through; CommandResult::mac is null
    /// when the TV reported none.
    void fetchConnectedMac(ResultCallback done);

signals:
    void stateChanged(ssap::SessionState state);
    /// Keepalive found the session dead. Sent once; the next one can only follow a
    /// successful connect.
    void connectionLost();

private:
    struct PendingOperation {
        const char* name;
        std::function<void()> run;
    };

    void enqueue(const char* name, std::function<void()> run);
    void runNext();
    ResultCallback releasing(ResultCallback done);

    void onRegistered(const QString& clientKey);
    void onRegistrationFailed(ErrorKind kind, const QString& reason);
    void onCommandChannelLost();

    void issueCommand(const QString& uri, const QJsonObject& payload,
                      CommandCorrelator::ReplyCallback done);
    void runCommand(const char* name, const QString& uri, const QJsonObject& payload,
                    std::function<CommandResult(const QJsonObject&)> onReply, ResultCallback done);
    void ensureInputChannel(ResultCallback done);
    void reopenInputChannel(ResultCallback done);
    void probeStatus(int index, const InterfaceMacs& macs, ResultCallback done);

    void startKeepalive();
    void stopKeepalive();
    void onKeepaliveTick();
    void onRefreshRetry();
    void notifyConnectionLost();

    void demote(const QString& reason);
    void setState(SessionState state);
    QUrl commandUrl() const;
    static CommandResult notConnected();

    SessionConfig config_;
    SessionTransport* transport_;
    PairingHandshake* handshake_;
    CommandCorrelator* correlator_;

    SessionState state_ = SessionState::Disconnected;
    QString deviceId_;
    QString address_;
    bool secure_ = true;
    QString clientKey_;

    QQueue<PendingOperation> queue_;
    bool busy_ = false;
    ResultCallback pendingConnect_;

    QTimer keepaliveTimer_;
    QTimer refreshRetryTimer_;
    bool keepaliveQueued_ = false;
    bool lostNotified_ = false;    // also set when the caller ended the session
};

} // namespace ssap
