#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <yaml-cpp/yaml.h>

#include <ssap/Session/SessionConfig.hpp>
#include <ssap/Wake/WakeTarget.hpp>

namespace ltr {

struct TvDevice {
    QString name;
    QString ip;
    bool useSsl = true;
    QString clientKey;  // null until paired
    QString mac;        // null until fetched or set
};

class YamlConfig {
public:
    YamlConfig();

    /// Deep-merges the file over the built-in defaults. On a missing or malformed
    /// file the defaults stay in effect and false is returned.
    bool load(const QString& filePath);
    /// Creates the parent directory if needed.
    bool save(const QString& filePath) const;

    // TVs
    QStringList tvNames() const;
    bool tv(const QString& name, TvDevice& out) const;
    void setTv(const TvDevice& device);
    QString activeTv() const;
    void setActiveTv(const QString& name);

    // Streaming device
    bool streamingDevice(ssap::WakeTarget& out) const;
    void setStreamingDevice(const ssap::WakeTarget& target);
    void clearStreamingDevice();
    bool wakeStreamingOnPowerOn() const;
    void setWakeStreamingOnPowerOn(bool v);

    // Session tuning
    ssap::SessionConfig sessionConfig() const;

    // Logging
    QString logLevel() const;

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace ltr
