#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace ssap {

/// Permissions requested at registration. Fixed; changing them invalidates
/// every client key the TV has already issued for this app id.
const QStringList& manifestPermissions();

QJsonObject registrationManifest();

/// Full "register" frame. A null or empty clientKey omits "client-key",
/// which makes the TV show its pairing prompt.
QString encodeRegister(const QString& clientKey);

} // namespace ssap
