#include "RemoteController.hpp"
#include "ActionRegistry.hpp"
#include <ssap/Wake/MagicPacket.hpp>
#include <boost/log/trivial.hpp>

namespace ltr {

namespace {

ssap::CommandResult noDevice()
{
    return ssap::CommandResult::failure(ssap::ErrorKind::NoDevice, QStringLiteral("No TV configured"));
}

} // namespace

RemoteController::RemoteController(ssap::TvSession* session, ssap::WakeService* wake,
                                   IDeviceStore* store, QObject* parent)
    : QObject(parent), session_(session), wake_(wake), store_(store)
{
    connect(session_, &ssap::TvSession::connectionLost, this, [this]() {
        BOOST_LOG_TRIVIAL(warning) << "RemoteController: connection to TV lost";
        emit connectionLost();
    });
    connect(session_, &ssap::TvSession::stateChanged, this, &RemoteController::stateChanged);
}

void RemoteController::persistClientKey(const QString& name, const QString& clientKey)
{
    if (clientKey.isEmpty()) return;
    store_->updateClientKey(name, clientKey);
    if (!store_->save())
        BOOST_LOG_TRIVIAL(warning) << "RemoteController: could not persist client key";
}

ssap::CommandResult RemoteController::saveStore(const ssap::CommandResult& onSuccess)
{
    if (!store_->save())
        return ssap::CommandResult::failure(ssap::ErrorKind::ConfigError,
                                            QStringLiteral("Failed to save configuration"));
    return onSuccess;
}

// --- Session ---

void RemoteController::connectActive(ssap::ResultCallback done)
{
    TvDevice device;
    if (!store_->activeDevice(device)) {
        done(noDevice());
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "RemoteController: connecting to '" << device.name.toStdString()
                            << "' at " << device.ip.toStdString()
                            << (device.useSsl ? " (wss)" : " (ws)");
    const QString name = device.name;
    session_->connectToDevice(name, device.ip, device.clientKey, device.useSsl,
                              [this, name, done](const ssap::CommandResult& result) {
        if (result.success)
            persistClientKey(name, result.clientKey);
        done(result);
    });
}

void RemoteController::authenticate(const QString& name, const QString& address, bool useSsl,
                                    ssap::ResultCallback done)
{
    TvDevice device;
    device.name = name;
    device.ip = address;
    device.useSsl = useSsl;
    store_->setDevice(device);
    store_->setActiveDevice(name);
    if (!store_->save()) {
        done(ssap::CommandResult::failure(ssap::ErrorKind::ConfigError,
                                          QStringLiteral("Failed to save configuration")));
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "RemoteController: pairing with '" << name.toStdString()
                            << "', accept the prompt on the TV";
    session_->connectToDevice(name, address, QString(), useSsl,
                              [this, name, done](const ssap::CommandResult& result) {
        if (!result.success || result.clientKey.isEmpty()) {
            done(result);
            return;
        }

        store_->updateClientKey(name, result.clientKey);
        session_->fetchConnectedMac([this, name, result, done](const ssap::CommandResult& macResult) {
            if (!macResult.success)
                BOOST_LOG_TRIVIAL(warning) << "RemoteController: failed to get MAC address: "
                                           << macResult.error.toStdString();
            else if (macResult.mac.isEmpty())
                BOOST_LOG_TRIVIAL(warning) << "RemoteController: could not find MAC address in network info";
            else
                store_->updateMac(name, macResult.mac);

            done(saveStore(result));
        });
    });
}

void RemoteController::disconnectTv(ssap::ResultCallback done)
{
    session_->disconnectFromDevice(done);
}

bool RemoteController::isConnected() const
{
    return session_->isConnected();
}

void RemoteController::sendButton(const QString& buttonName, ssap::ResultCallback done)
{
    session_->sendButton(buttonName, done);
}

void RemoteController::volumeUp(ssap::ResultCallback done)
{
    session_->volumeUp(done);
}

void RemoteController::volumeDown(ssap::ResultCallback done)
{
    session_->volumeDown(done);
}

void RemoteController::setMute(bool mute, ssap::ResultCallback done)
{
    session_->setMute(mute, done);
}

void RemoteController::powerOff(ssap::ResultCallback done)
{
    session_->powerOff(done);
}

// --- Wake ---

void RemoteController::powerOn(ssap::ResultCallback done)
{
    TvDevice device;
    if (!store_->activeDevice(device)) {
        done(noDevice());
        return;
    }
    if (device.mac.isEmpty()) {
        done(ssap::CommandResult::failure(ssap::ErrorKind::NoDevice,
            QStringLiteral("MAC address not saved. Connect to the TV while it's on and fetch "
                           "the MAC, or set it manually.")));
        return;
    }

    const ssap::CommandResult result = wake_->wakeOnLan(device.mac);
    ssap::WakeTarget streaming;
    if (!result.success || !store_->wakeStreamingOnPowerOn() || !store_->streamingDevice(streaming)) {
        done(result);
        return;
    }

    wake_->wake(streaming, [result, done](const ssap::CommandResult& streamingResult) {
        if (!streamingResult.success)
            BOOST_LOG_TRIVIAL(warning) << "RemoteController: streaming device wake failed: "
                                       << streamingResult.error.toStdString();
        done(result);
    });
}

void RemoteController::wakeStreamingDevice(ssap::ResultCallback done)
{
    ssap::WakeTarget target;
    if (!store_->streamingDevice(target)) {
        done(ssap::CommandResult::failure(ssap::ErrorKind::NoDevice,
            QStringLiteral("No streaming device configured")));
        return;
    }
    wake_->wake(target, done);
}

ssap::CommandResult RemoteController::setStreamingDevice(const ssap::WakeTarget& target)
{
    if (target.kind == ssap::WakeTarget::Kind::WakeOnLan) {
        const QString mac = ssap::normalizeMacAddress(target.mac);
        if (mac.isNull())
            return ssap::CommandResult::failure(ssap::ErrorKind::FormatError,
                                                QStringLiteral("Invalid MAC address format"));
        ssap::WakeTarget normalized = target;
        normalized.mac = mac;
        store_->setStreamingDevice(normalized);
    } else {
        if (target.address.trimmed().isEmpty())
            return ssap::CommandResult::failure(ssap::ErrorKind::FormatError,
                                                QStringLiteral("Streaming device address is required"));
        store_->setStreamingDevice(target);
    }
    return saveStore(ssap::CommandResult::ok());
}

ssap::CommandResult RemoteController::clearStreamingDevice()
{
    store_->clearStreamingDevice();
    return saveStore(ssap::CommandResult::ok());
}

ssap::CommandResult RemoteController::setWakeStreamingOnPowerOn(bool enabled)
{
    store_->setWakeStreamingOnPowerOn(enabled);
    return saveStore(ssap::CommandResult::ok());
}

// --- MAC ---

void RemoteController::fetchMac(ssap::ResultCallback done)
{
    TvDevice device;
    if (!store_->activeDevice(device)) {
        done(noDevice());
        return;
    }
    if (!session_->isConnected()) {
        done(ssap::CommandResult::failure(ssap::ErrorKind::NotConnected,
            QStringLiteral("Not connected. Connect to the TV first.")));
        return;
    }

    const QString name = device.name;
    session_->fetchConnectedMac([this, name, done](const ssap::CommandResult& result) {
        if (!result.success) {
            ssap::CommandResult failed = result;
            failed.error = QStringLiteral("Failed to get MAC address: %1. Please enter manually.")
                               .arg(result.error);
            done(failed);
            return;
        }
        if (result.mac.isEmpty()) {
            done(ssap::CommandResult::failure(ssap::ErrorKind::NoDevice,
                QStringLiteral("Could not find MAC address in TV response. Please enter manually.")));
            return;
        }
        store_->updateMac(name, result.mac);
        ssap::CommandResult saved = saveStore(
            ssap::CommandResult::okWithMessage(QStringLiteral("MAC address saved: %1").arg(result.mac)));
        saved.mac = result.mac;
        done(saved);
    });
}

ssap::CommandResult RemoteController::setMac(const QString& text)
{
    const QString mac = ssap::normalizeMacAddress(text);
    if (mac.isNull())
        return ssap::CommandResult::failure(ssap::ErrorKind::FormatError,
            QStringLiteral("Invalid MAC address format. Use format like AA:BB:CC:DD:EE:FF or AABBCCDDEEFF"));

    TvDevice device;
    if (!store_->activeDevice(device))
        return noDevice();

    store_->updateMac(device.name, mac);
    ssap::CommandResult result = saveStore(
        ssap::CommandResult::okWithMessage(QStringLiteral("MAC address set to: %1").arg(mac)));
    result.mac = mac;
    return result;
}

// --- Actions ---

void RemoteController::registerActions(ActionRegistry* registry)
{
    const QList<QPair<QString, QString>> buttons = {
        {QStringLiteral("up"), QStringLiteral("UP")},
        {QStringLiteral("down"), QStringLiteral("DOWN")},
        {QStringLiteral("left"), QStringLiteral("LEFT")},
        {QStringLiteral("right"), QStringLiteral("RIGHT")},
        {QStringLiteral("enter"), QStringLiteral("ENTER")},
        {QStringLiteral("back"), QStringLiteral("BACK")},
        {QStringLiteral("home"), QStringLiteral("HOME")},
    };
    for (const auto& button : buttons) {
        const QString name = button.second;
        registry->registerAction(button.first, [this, name](const QVariant&, ssap::ResultCallback done) {
            sendButton(name, done);
        });
    }

    registry->registerAction(QStringLiteral("volume_up"), [this](const QVariant&, ssap::ResultCallback done) {
        volumeUp(done);
    });
    registry->registerAction(QStringLiteral("volume_down"), [this](const QVariant&, ssap::ResultCallback done) {
        volumeDown(done);
    });
    registry->registerAction(QStringLiteral("mute"), [this](const QVariant&, ssap::ResultCallback done) {
        setMute(true, done);
    });
    registry->registerAction(QStringLiteral("unmute"), [this](const QVariant&, ssap::ResultCallback done) {
        setMute(false, done);
    });
    registry->registerAction(QStringLiteral("power_on"), [this](const QVariant&, ssap::ResultCallback done) {
        powerOn(done);
    });
    registry->registerAction(QStringLiteral("power_off"), [this](const QVariant&, ssap::ResultCallback done) {
        powerOff(done);
    });
    registry->registerAction(QStringLiteral("wake_streaming_device"),
                             [this](const QVariant&, ssap::ResultCallback done) {
        wakeStreamingDevice(done);
    });
}

} // namespace ltr
