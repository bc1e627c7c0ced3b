#pragma once

#include <QString>
#include "core/YamlConfig.hpp"

namespace ltr {

/// Persistent record of paired TVs and the streaming device, as the remote
/// controller sees it.
class IDeviceStore {
public:
    virtual ~IDeviceStore() = default;

    /// The TV named by active_tv, or the first stored TV when none is named.
    /// Returns false when no TV is stored.
    virtual bool activeDevice(TvDevice& out) const = 0;

    /// Adds or replaces a TV. The first TV stored becomes active.
    virtual void setDevice(const TvDevice& device) = 0;
    /// Returns false if no TV by that name is stored.
    virtual bool setActiveDevice(const QString& name) = 0;

    virtual void updateClientKey(const QString& name, const QString& clientKey) = 0;
    virtual void updateMac(const QString& name, const QString& mac) = 0;

    virtual bool streamingDevice(ssap::WakeTarget& out) const = 0;
    virtual void setStreamingDevice(const ssap::WakeTarget& target) = 0;
    virtual void clearStreamingDevice() = 0;

    virtual bool wakeStreamingOnPowerOn() const = 0;
    virtual void setWakeStreamingOnPowerOn(bool enabled) = 0;

    /// Flush to disk.
    virtual bool save() = 0;
};

} // namespace ltr
