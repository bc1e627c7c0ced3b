#pragma once

#include <QJsonObject>
#include <QString>
#include <functional>

#include <ssap/Session/SessionState.hpp>

namespace ssap {

/// Uniform outcome of every session, wake and facade operation.
/// Null QStrings mean "absent" and are omitted from toJson().
struct CommandResult {
    bool success = false;
    ErrorKind kind = ErrorKind::None;
    QString message;
    QString error;
    QString clientKey;
    QString mac;
    QJsonObject payload;

    static CommandResult ok();
    static CommandResult okWithMessage(const QString& message);
    static CommandResult failure(ErrorKind kind, const QString& error);

    QJsonObject toJson() const;
};

using ResultCallback = std::function<void(const CommandResult&)>;

} // namespace ssap
