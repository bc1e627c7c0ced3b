#pragma once

#include <QObject>

#include <ssap/Session/CommandResult.hpp>
#include <ssap/Session/SessionState.hpp>
#include <ssap/Session/TvSession.hpp>
#include <ssap/Wake/WakeService.hpp>
#include "IDeviceStore.hpp"

namespace ltr {

class ActionRegistry;

/// What the user interface talks to: ties the session, the wake mechanisms and the
/// device store together. Credentials and MACs the TV hands out are persisted here.
/// Does NOT own the session, wake service or store.
class RemoteController : public QObject {
    Q_OBJECT
public:
    RemoteController(ssap::TvSession* session, ssap::WakeService* wake, IDeviceStore* store,
                     QObject* parent = nullptr);

    /// Connect to the active TV with its stored client key.
    void connectActive(ssap::ResultCallback done);
    /// Store a new TV, make it active and pair with it. The TV shows a prompt, so this
    /// can take up to the pairing timeout. The issued key and the MAC of the connected
    /// interface are stored.
    void authenticate(const QString& name, const QString& address, bool useSsl,
                      ssap::ResultCallback done);
    void disconnectTv(ssap::ResultCallback done = {});
    bool isConnected() const;

    void sendButton(const QString& buttonName, ssap::ResultCallback done);
    void volumeUp(ssap::ResultCallback done);
    void volumeDown(ssap::ResultCallback done);
    void setMute(bool mute, ssap::ResultCallback done);
    void powerOff(ssap::ResultCallback done);
    /// Wake-on-LAN to the stored MAC; also wakes the streaming device when configured to.
    void powerOn(ssap::ResultCallback done);

    void fetchMac(ssap::ResultCallback done);
    ssap::CommandResult setMac(const QString& text);

    void wakeStreamingDevice(ssap::ResultCallback done);
    ssap::CommandResult setStreamingDevice(const ssap::WakeTarget& target);
    ssap::CommandResult clearStreamingDevice();
    ssap::CommandResult setWakeStreamingOnPowerOn(bool enabled);

    /// Binds the named remote actions to this controller.
    void registerActions(ActionRegistry* registry);

signals:
    void connectionLost();
    void stateChanged(ssap::SessionState state);

private:
    void persistClientKey(const QString& name, const QString& clientKey);
    ssap::CommandResult saveStore(const ssap::CommandResult& onSuccess);

    ssap::TvSession* session_;
    ssap::WakeService* wake_;
    IDeviceStore* store_;
};

} // namespace ltr
