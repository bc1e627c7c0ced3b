#include "core/YamlConfig.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace ltr {

namespace {

// Deep merge: overlay values override base values.
// Mappings recurse, sequences and scalars override entirely,
// missing keys in overlay preserve base defaults.
YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (base.IsMap() && overlay.IsMap()) {
        YAML::Node result = YAML::Clone(base);
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            const auto key = it->first.as<std::string>();
            if (result[key])
                result[key] = mergeYaml(result[key], it->second);
            else
                result[key] = YAML::Clone(it->second);
        }
        return result;
    }

    return YAML::Clone(overlay);
}

QString scalar(const YAML::Node& node, const QString& fallback = QString())
{
    if (!node || !node.IsScalar()) return fallback;
    return QString::fromStdString(node.Scalar());
}

int scalarInt(const YAML::Node& node, int fallback)
{
    bool ok = false;
    const int v = scalar(node).toInt(&ok);
    return ok ? v : fallback;
}

bool scalarBool(const YAML::Node& node, bool fallback)
{
    const QString s = scalar(node).toLower();
    if (s == QLatin1String("true")) return true;
    if (s == QLatin1String("false")) return false;
    return fallback;
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["active_tv"] = "";
    root_["tvs"] = YAML::Node(YAML::NodeType::Map);
    root_["wake_streaming_on_power_on"] = false;

    root_["session"]["connect_timeout_ms"] = 5000;
    root_["session"]["handshake_timeout_ms"] = 5000;
    root_["session"]["pairing_timeout_ms"] = 60000;
    root_["session"]["command_timeout_ms"] = 3000;
    root_["session"]["keepalive_interval_ms"] = 25000;
    root_["session"]["refresh_grace_ms"] = 3000;

    root_["logging"]["level"] = "info";
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    const YAML::Node defaults = YAML::Clone(root_);

    YAML::Node loaded;
    try {
        loaded = YAML::LoadFile(filePath.toStdString());
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "YamlConfig: cannot load " << filePath.toStdString()
                                   << ": " << e.what();
        return false;
    }
    if (loaded.IsDefined() && !loaded.IsNull() && !loaded.IsMap()) {
        BOOST_LOG_TRIVIAL(warning) << "YamlConfig: " << filePath.toStdString()
                                   << " is not a mapping, using defaults";
        return false;
    }

    root_ = mergeYaml(defaults, loaded);
    if (!root_["tvs"].IsMap())
        root_["tvs"] = YAML::Node(YAML::NodeType::Map);
    return true;
}

bool YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    std::ofstream fout(filePath.toStdString());
    fout << root_ << "\n";
    if (!fout.good()) {
        BOOST_LOG_TRIVIAL(error) << "YamlConfig: failed to write " << filePath.toStdString();
        return false;
    }
    return true;
}

// --- TVs ---

QStringList YamlConfig::tvNames() const
{
    QStringList names;
    const YAML::Node tvs = root_["tvs"];
    if (!tvs.IsMap()) return names;
    for (auto it = tvs.begin(); it != tvs.end(); ++it)
        names << QString::fromStdString(it->first.as<std::string>());
    return names;
}

bool YamlConfig::tv(const QString& name, TvDevice& out) const
{
    const YAML::Node tvs = root_["tvs"];
    if (name.isEmpty() || !tvs.IsMap()) return false;
    const YAML::Node node = tvs[name.toStdString()];
    if (!node || !node.IsMap()) return false;

    out.name = name;
    out.ip = scalar(node["ip"], QStringLiteral(""));
    out.useSsl = scalarBool(node["use_ssl"], true);
    out.clientKey = scalar(node["client_key"]);
    out.mac = scalar(node["mac"]);
    if (out.clientKey.isEmpty()) out.clientKey = QString();
    if (out.mac.isEmpty()) out.mac = QString();
    return true;
}

void YamlConfig::setTv(const TvDevice& device)
{
    YAML::Node node(YAML::NodeType::Map);
    node["ip"] = device.ip.toStdString();
    node["use_ssl"] = device.useSsl;
    if (!device.clientKey.isEmpty())
        node["client_key"] = device.clientKey.toStdString();
    if (!device.mac.isEmpty())
        node["mac"] = device.mac.toStdString();
    root_["tvs"][device.name.toStdString()] = node;
}

QString YamlConfig::activeTv() const
{
    return scalar(root_["active_tv"], QStringLiteral(""));
}

void YamlConfig::setActiveTv(const QString& name)
{
    root_["active_tv"] = name.toStdString();
}

// --- Streaming device ---

bool YamlConfig::streamingDevice(ssap::WakeTarget& out) const
{
    const YAML::Node node = root_["streaming_device"];
    if (!node || !node.IsMap()) return false;

    ssap::WakeTarget::Kind kind;
    if (!ssap::WakeTarget::kindFromName(scalar(node["type"]), kind)) {
        BOOST_LOG_TRIVIAL(warning) << "YamlConfig: unknown streaming_device type '"
                                   << scalar(node["type"]).toStdString() << "'";
        return false;
    }

    switch (kind) {
    case ssap::WakeTarget::Kind::WakeOnLan:
        out = ssap::WakeTarget::wakeOnLan(scalar(node["mac"]), scalar(node["broadcast_ip"]));
        return !out.mac.isEmpty();
    case ssap::WakeTarget::Kind::Adb: {
        int port = scalarInt(node["port"], ssap::ADB_DEFAULT_PORT);
        if (port < 1 || port > 65535) {
            BOOST_LOG_TRIVIAL(warning) << "YamlConfig: streaming_device port " << port
                                       << " out of range, using " << ssap::ADB_DEFAULT_PORT;
            port = ssap::ADB_DEFAULT_PORT;
        }
        out = ssap::WakeTarget::adb(scalar(node["ip"]), static_cast<quint16>(port));
        return !out.address.isEmpty();
    }
    case ssap::WakeTarget::Kind::Roku:
        out = ssap::WakeTarget::roku(scalar(node["ip"]));
        return !out.address.isEmpty();
    }
    return false;
}

void YamlConfig::setStreamingDevice(const ssap::WakeTarget& target)
{
    YAML::Node node(YAML::NodeType::Map);
    node["type"] = ssap::WakeTarget::kindName(target.kind);
    switch (target.kind) {
    case ssap::WakeTarget::Kind::WakeOnLan:
        node["mac"] = target.mac.toStdString();
        if (!target.broadcastAddress.trimmed().isEmpty())
            node["broadcast_ip"] = target.broadcastAddress.trimmed().toStdString();
        break;
    case ssap::WakeTarget::Kind::Adb:
        node["ip"] = target.address.toStdString();
        node["port"] = static_cast<int>(target.port ? target.port : ssap::ADB_DEFAULT_PORT);
        break;
    case ssap::WakeTarget::Kind::Roku:
        node["ip"] = target.address.toStdString();
        break;
    }
    root_["streaming_device"] = node;
}

void YamlConfig::clearStreamingDevice()
{
    root_.remove("streaming_device");
}

bool YamlConfig::wakeStreamingOnPowerOn() const
{
    return scalarBool(root_["wake_streaming_on_power_on"], false);
}

void YamlConfig::setWakeStreamingOnPowerOn(bool v)
{
    root_["wake_streaming_on_power_on"] = v;
}

// --- Session ---

ssap::SessionConfig YamlConfig::sessionConfig() const
{
    ssap::SessionConfig config;
    const YAML::Node session = root_["session"];
    config.connectTimeout = scalarInt(session["connect_timeout_ms"], config.connectTimeout);
    config.handshakeTimeout = scalarInt(session["handshake_timeout_ms"], config.handshakeTimeout);
    config.pairingTimeout = scalarInt(session["pairing_timeout_ms"], config.pairingTimeout);
    config.commandTimeout = scalarInt(session["command_timeout_ms"], config.commandTimeout);
    config.keepaliveInterval = scalarInt(session["keepalive_interval_ms"], config.keepaliveInterval);
    config.refreshGrace = scalarInt(session["refresh_grace_ms"], config.refreshGrace);
    return config;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return scalar(root_["logging"]["level"], QStringLiteral("info"));
}

} // namespace ltr
