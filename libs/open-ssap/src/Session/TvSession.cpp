#include <ssap/Session/TvSession.hpp>
#include <ssap/Protocol/Endpoints.hpp>
#include <ssap/Protocol/Envelope.hpp>
#include <QDebug>

namespace ssap {

TvSession::TvSession(IChannelFactory* factory, const SessionConfig& config, QObject* parent)
    : QObject(parent)
    , config_(config)
    , transport_(new SessionTransport(factory, config.connectTimeout, this))
    , handshake_(new PairingHandshake(config.handshakeTimeout, config.pairingTimeout, this))
    , correlator_(new CommandCorrelator(config.commandTimeout, this))
{
    keepaliveTimer_.setInterval(config_.keepaliveInterval);
    connect(&keepaliveTimer_, &QTimer::timeout, this, &TvSession::onKeepaliveTick);

    refreshRetryTimer_.setSingleShot(true);
    refreshRetryTimer_.setInterval(config_.refreshGrace);
    connect(&refreshRetryTimer_, &QTimer::timeout, this, &TvSession::onRefreshRetry);

    connect(handshake_, &PairingHandshake::registered, this, &TvSession::onRegistered);
    connect(handshake_, &PairingHandshake::failed, this, &TvSession::onRegistrationFailed);
    connect(transport_, &SessionTransport::commandChannelLost, this, &TvSession::onCommandChannelLost);
}

TvSession::~TvSession()
{
    stopKeepalive();
    queue_.clear();
    handshake_->abort();
    transport_->closeAll();
}

bool TvSession::isConnected() const
{
    return state_ == SessionState::Connected && transport_->commandChannel() != nullptr;
}

bool TvSession::hasInputChannel() const
{
    return transport_->inputChannel() != nullptr;
}

// --- Operation queue ---

void TvSession::enqueue(const char* name, std::function<void()> run)
{
    queue_.enqueue({name, std::move(run)});
    if (!busy_)
        runNext();
}

void TvSession::runNext()
{
    if (busy_ || queue_.isEmpty()) return;
    PendingOperation op = queue_.dequeue();
    busy_ = true;
    qDebug() << "[TvSession] run" << op.name;
    op.run();
}

ResultCallback TvSession::releasing(ResultCallback done)
{
    return [this, done](const CommandResult& result) {
        busy_ = false;
        if (done) done(result);
        if (!busy_)
            runNext();
    };
}

CommandResult TvSession::notConnected()
{
    return CommandResult::failure(ErrorKind::NotConnected, QStringLiteral("Not connected"));
}

// --- Connect / disconnect ---

void TvSession::connectToDevice(const QString& deviceId, const QString& address,
                                const QString& clientKey, bool secure, ResultCallback done)
{
    enqueue("connect", [this, deviceId, address, clientKey, secure, done]() {
        ResultCallback finish = releasing(done);

        stopKeepalive();
        handshake_->abort();
        transport_->closeAll();

        deviceId_ = deviceId;
        address_ = address;
        clientKey_ = clientKey;
        secure_ = secure;
        setState(SessionState::Connecting);

        const QUrl url = commandUrl();
        qInfo() << "[TvSession] connecting to" << deviceId_ << "at" << url.toString();

        transport_->openChannel(url, secure_, [this, finish](IChannel* channel, ErrorKind kind,
                                                            const QString& error) {
            if (!channel) {
                setState(SessionState::Disconnected);
                finish(CommandResult::failure(kind, error));
                return;
            }
            transport_->setCommandChannel(channel);
            pendingConnect_ = finish;
            handshake_->start(channel, clientKey_);
        });
    });
}

void TvSession::onRegistered(const QString& clientKey)
{
    ResultCallback finish = std::move(pendingConnect_);
    pendingConnect_ = nullptr;
    if (!finish) return;

    if (!clientKey.isNull())
        clientKey_ = clientKey;
    lostNotified_ = false;
    setState(SessionState::Connected);
    startKeepalive();
    qInfo() << "[TvSession] registered with" << deviceId_;

    ensureInputChannel([this, finish, clientKey](const CommandResult& input) {
        if (!input.success)
            qWarning() << "[TvSession] input channel not available:" << input.error;

        CommandResult result = isConnected()
            ? CommandResult::okWithMessage(QStringLiteral("Connected"))
            : CommandResult::failure(input.kind, input.error);
        result.clientKey = clientKey;
        finish(result);
    });
}

void TvSession::onRegistrationFailed(ErrorKind kind, const QString& reason)
{
    ResultCallback finish = std::move(pendingConnect_);
    pendingConnect_ = nullptr;
    qWarning() << "[TvSession] registration failed:" << reason;
    transport_->closeAll();
    setState(SessionState::Disconnected);
    if (finish)
        finish(CommandResult::failure(kind, reason));
}

void TvSession::disconnectFromDevice(ResultCallback done)
{
    enqueue("disconnect", [this, done]() {
        ResultCallback finish = releasing(done);
        stopKeepalive();
        lostNotified_ = true;
        transport_->closeAll();
        clientKey_.clear();
        setState(SessionState::Disconnected);
        qInfo() << "[TvSession] disconnected from" << deviceId_;
        finish(CommandResult::okWithMessage(QStringLiteral("Disconnected")));
    });
}

void TvSession::onCommandChannelLost()
{
    // While connecting, the handshake reports the close itself.
    if (state_ != SessionState::Connected)
        return;
    stopKeepalive();
    demote(QStringLiteral("command channel closed by device"));
    notifyConnectionLost();
}

// --- Commands ---

void TvSession::issueCommand(const QString& uri, const QJsonObject& payload,
                             CommandCorrelator::ReplyCallback done)
{
    correlator_->send(transport_->commandChannel(), uri, payload,
                      [this, done](const CommandCorrelator::Reply& reply) {
        if (!reply.ok())
            demote(reply.error);
        done(reply);
    });
}

void TvSession::runCommand(const char* name, const QString& uri, const QJsonObject& payload,
                           std::function<CommandResult(const QJsonObject&)> onReply,
                           ResultCallback done)
{
    enqueue(name, [this, uri, payload, onReply, done]() {
        ResultCallback finish = releasing(done);
        if (!isConnected()) {
            finish(notConnected());
            return;
        }
        issueCommand(uri, payload, [finish, onReply](const CommandCorrelator::Reply& reply) {
            if (!reply.ok()) {
                finish(CommandResult::failure(reply.kind, reply.error));
                return;
            }
            finish(onReply(reply.envelope));
        });
    });
}

void TvSession::volumeUp(ResultCallback done)
{
    runCommand("volumeUp", QLatin1String(Endpoint::VolumeUp), {},
               [](const QJsonObject&) { return CommandResult::ok(); }, done);
}

void TvSession::volumeDown(ResultCallback done)
{
    runCommand("volumeDown", QLatin1String(Endpoint::VolumeDown), {},
               [](const QJsonObject&) { return CommandResult::ok(); }, done);
}

void TvSession::setMute(bool mute, ResultCallback done)
{
    QJsonObject payload;
    payload[QStringLiteral("mute")] = mute;
    runCommand("setMute", QLatin1String(Endpoint::SetMute), payload,
               [](const QJsonObject&) { return CommandResult::ok(); }, done);
}

void TvSession::powerOff(ResultCallback done)
{
    runCommand("powerOff", QLatin1String(Endpoint::TurnOff), {},
               [this](const QJsonObject&) {
        stopKeepalive();
        lostNotified_ = true;
        demote(QStringLiteral("TV powered off"));
        return CommandResult::okWithMessage(QStringLiteral("TV powered off"));
    }, done);
}

void TvSession::sendCommand(const QString& uri, const QJsonObject& payload, ResultCallback done)
{
    runCommand("sendCommand", uri, payload, [](const QJsonObject& envelope) {
        CommandResult result = CommandResult::ok();
        result.payload = envelope;
        return result;
    }, done);
}

// --- Pointer input channel ---

void TvSession::ensureInputChannel(ResultCallback done)
{
    if (transport_->inputChannel()) {
        done(CommandResult::ok());
        return;
    }

    issueCommand(QLatin1String(Endpoint::PointerInputSocket), {},
                 [this, done](const CommandCorrelator::Reply& reply) {
        if (!reply.ok()) {
            done(CommandResult::failure(reply.kind, reply.error));
            return;
        }
        const QString socketPath = reply.envelope.value(QStringLiteral("payload")).toObject()
                                       .value(QStringLiteral("socketPath")).toString();
        if (socketPath.isEmpty()) {
            done(CommandResult::failure(ErrorKind::ChannelRefreshError,
                                        QStringLiteral("No socketPath in input socket response")));
            return;
        }

        qDebug() << "[TvSession] opening input channel" << socketPath;
        transport_->openChannel(QUrl(socketPath), secure_,
                                [this, done](IChannel* channel, ErrorKind, const QString& error) {
            if (!channel) {
                done(CommandResult::failure(ErrorKind::ChannelRefreshError, error));
                return;
            }
            if (state_ != SessionState::Connected) {
                transport_->closeChannel(channel);
                done(notConnected());
                return;
            }
            transport_->setInputChannel(channel);
            done(CommandResult::ok());
        });
    });
}

void TvSession::reopenInputChannel(ResultCallback done)
{
    transport_->closeInputChannel();
    ensureInputChannel(done);
}

void TvSession::refreshInputChannel(ResultCallback done)
{
    enqueue("refreshInputChannel", [this, done]() {
        ResultCallback finish = releasing(done);
        if (!isConnected()) {
            finish(notConnected());
            return;
        }
        reopenInputChannel(finish);
    });
}

void TvSession::sendButton(const QString& buttonName, ResultCallback done)
{
    enqueue("sendButton", [this, buttonName, done]() {
        ResultCallback finish = releasing(done);
        if (!isConnected()) {
            finish(notConnected());
            return;
        }
        ensureInputChannel([this, buttonName, finish](const CommandResult& input) {
            if (!input.success) {
                demote(input.error);
                finish(CommandResult::failure(input.kind,
                    QStringLiteral("Failed to connect input socket: %1").arg(input.error)));
                return;
            }
            if (!transport_->inputChannel()->sendText(buttonFrame(buttonName))) {
                demote(QStringLiteral("button write failed"));
                finish(CommandResult::failure(ErrorKind::SendError,
                                              QStringLiteral("Button send failed (disconnected)")));
                return;
            }
            finish(CommandResult::ok());
        });
    });
}

// --- MAC discovery ---

void TvSession::fetchConnectedMac(ResultCallback done)
{
    enqueue("fetchConnectedMac", [this, done]() {
        ResultCallback finish = releasing(done);
        if (!isConnected()) {
            finish(notConnected());
            return;
        }
        issueCommand(QLatin1String(Endpoint::NetworkInfo), {},
                     [this, finish](const CommandCorrelator::Reply& reply) {
            if (!reply.ok()) {
                finish(CommandResult::failure(reply.kind, reply.error));
                return;
            }
            probeStatus(0, extractMacs(reply.envelope), finish);
        });
    });
}

void TvSession::probeStatus(int index, const InterfaceMacs& macs, ResultCallback done)
{
    auto select = [macs, done](const QJsonObject& status) {
        CommandResult result = CommandResult::ok();
        result.mac = selectConnectedMac(macs, status);
        done(result);
    };

    const QList<const char*>& endpoints = statusEndpoints();
    if (index >= endpoints.size()) {
        qDebug() << "[TvSession] no status endpoint answered, using first available MAC";
        select(QJsonObject());
        return;
    }

    issueCommand(QLatin1String(endpoints.at(index)), {},
                 [this, index, macs, done, select](const CommandCorrelator::Reply& reply) {
        if (!reply.ok()) {
            // The session is gone; whatever the info reply gave us is still usable.
            select(QJsonObject());
            return;
        }
        if (reply.envelope.contains(QStringLiteral("error"))) {
            probeStatus(index + 1, macs, done);
            return;
        }
        select(reply.envelope);
    });
}

// --- Keepalive ---

void TvSession::startKeepalive()
{
    keepaliveQueued_ = false;
    keepaliveTimer_.start();
}

void TvSession::stopKeepalive()
{
    keepaliveTimer_.stop();
    refreshRetryTimer_.stop();
}

void TvSession::onKeepaliveTick()
{
    if (keepaliveQueued_) return;   // previous cycle still waiting for its turn
    keepaliveQueued_ = true;

    enqueue("keepalive", [this]() {
        ResultCallback finish = releasing([this](const CommandResult&) { keepaliveQueued_ = false; });
        if (!isConnected()) {
            qDebug() << "[TvSession] session no longer connected, keepalive stopped";
            stopKeepalive();
            notifyConnectionLost();
            finish(notConnected());
            return;
        }

        issueCommand(QLatin1String(Endpoint::NetworkInfo), {},
                     [this, finish](const CommandCorrelator::Reply& reply) {
            if (!reply.ok()) {
                qWarning() << "[TvSession] keepalive failed, connection dropped:" << reply.error;
                stopKeepalive();
                notifyConnectionLost();
                finish(CommandResult::failure(reply.kind, reply.error));
                return;
            }

            reopenInputChannel([this, finish](const CommandResult& refreshed) {
                if (!refreshed.success) {
                    if (isConnected()) {
                        qWarning() << "[TvSession] input channel refresh failed:" << refreshed.error
                                   << "- retrying in" << config_.refreshGrace << "ms";
                        refreshRetryTimer_.start();
                    } else {
                        stopKeepalive();
                        notifyConnectionLost();
                    }
                }
                finish(refreshed);
            });
        });
    });
}

void TvSession::onRefreshRetry()
{
    enqueue("refreshRetry", [this]() {
        ResultCallback finish = releasing({});
        if (!isConnected()) {
            finish(notConnected());
            return;
        }
        reopenInputChannel([this, finish](const CommandResult& refreshed) {
            if (refreshed.success) {
                qDebug() << "[TvSession] input channel refreshed on retry";
            } else if (isConnected()) {
                qWarning() << "[TvSession] input channel refresh failed again:" << refreshed.error;
            } else {
                stopKeepalive();
                notifyConnectionLost();
            }
            finish(refreshed);
        });
    });
}

void TvSession::notifyConnectionLost()
{
    if (lostNotified_) return;
    lostNotified_ = true;
    emit connectionLost();
}

// --- State ---

void TvSession::demote(const QString& reason)
{
    if (state_ == SessionState::Disconnected
        && !transport_->commandChannel() && !transport_->inputChannel())
        return;
    qWarning() << "[TvSession] session dropped:" << reason;
    transport_->closeAll();
    setState(SessionState::Disconnected);
}

void TvSession::setState(SessionState state)
{
    if (state_ == state) return;
    state_ = state;
    emit stateChanged(state);
}

QUrl TvSession::commandUrl() const
{
    return QUrl(QStringLiteral("%1://%2:%3")
                    .arg(secure_ ? QStringLiteral("wss") : QStringLiteral("ws"))
                    .arg(address_)
                    .arg(secure_ ? config_.securePort : config_.plainPort));
}

} // namespace ssap
