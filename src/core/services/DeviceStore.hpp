#pragma once

#include <QObject>
#include "IDeviceStore.hpp"

namespace ltr {

class YamlConfig;

/// IDeviceStore on top of YamlConfig.
/// Does NOT own the YamlConfig (caller manages lifetime).
class DeviceStore : public QObject, public IDeviceStore {
    Q_OBJECT
public:
    DeviceStore(YamlConfig* config, const QString& configPath, QObject* parent = nullptr);

    bool activeDevice(TvDevice& out) const override;
    void setDevice(const TvDevice& device) override;
    bool setActiveDevice(const QString& name) override;
    void updateClientKey(const QString& name, const QString& clientKey) override;
    void updateMac(const QString& name, const QString& mac) override;
    bool streamingDevice(ssap::WakeTarget& out) const override;
    void setStreamingDevice(const ssap::WakeTarget& target) override;
    void clearStreamingDevice() override;
    bool wakeStreamingOnPowerOn() const override;
    void setWakeStreamingOnPowerOn(bool enabled) override;
    bool save() override;

    QString configPath() const { return configPath_; }

signals:
    void devicesChanged();

private:
    YamlConfig* config_;
    QString configPath_;
};

} // namespace ltr
