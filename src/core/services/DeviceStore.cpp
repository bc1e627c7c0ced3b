#include "DeviceStore.hpp"
#include "core/YamlConfig.hpp"
#include <boost/log/trivial.hpp>

namespace ltr {

DeviceStore::DeviceStore(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

bool DeviceStore::activeDevice(TvDevice& out) const
{
    const QString active = config_->activeTv();
    if (!active.isEmpty())
        return config_->tv(active, out);

    const QStringList names = config_->tvNames();
    return !names.isEmpty() && config_->tv(names.first(), out);
}

void DeviceStore::setDevice(const TvDevice& device)
{
    config_->setTv(device);
    if (config_->activeTv().isEmpty())
        config_->setActiveTv(device.name);
    emit devicesChanged();
}

bool DeviceStore::setActiveDevice(const QString& name)
{
    TvDevice device;
    if (!config_->tv(name, device)) {
        BOOST_LOG_TRIVIAL(warning) << "DeviceStore: no TV named '" << name.toStdString() << "'";
        return false;
    }
    config_->setActiveTv(name);
    emit devicesChanged();
    return true;
}

void DeviceStore::updateClientKey(const QString& name, const QString& clientKey)
{
    TvDevice device;
    if (!config_->tv(name, device)) return;
    device.clientKey = clientKey;
    config_->setTv(device);
    BOOST_LOG_TRIVIAL(info) << "DeviceStore: stored client key for '" << name.toStdString()
                            << "' (" << clientKey.size() << " chars)";
    emit devicesChanged();
}

void DeviceStore::updateMac(const QString& name, const QString& mac)
{
    TvDevice device;
    if (!config_->tv(name, device)) return;
    device.mac = mac;
    config_->setTv(device);
    BOOST_LOG_TRIVIAL(info) << "DeviceStore: stored MAC " << mac.toStdString()
                            << " for '" << name.toStdString() << "'";
    emit devicesChanged();
}

bool DeviceStore::streamingDevice(ssap::WakeTarget& out) const
{
    return config_->streamingDevice(out);
}

void DeviceStore::setStreamingDevice(const ssap::WakeTarget& target)
{
    config_->setStreamingDevice(target);
    emit devicesChanged();
}

void DeviceStore::clearStreamingDevice()
{
    config_->clearStreamingDevice();
    emit devicesChanged();
}

bool DeviceStore::wakeStreamingOnPowerOn() const
{
    return config_->wakeStreamingOnPowerOn();
}

void DeviceStore::setWakeStreamingOnPowerOn(bool enabled)
{
    config_->setWakeStreamingOnPowerOn(enabled);
    emit devicesChanged();
}

bool DeviceStore::save()
{
    return config_->save(configPath_);
}

} // namespace ltr
