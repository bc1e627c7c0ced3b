#pragma once

#include <QObject>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <functional>

#include <ssap/Session/CommandResult.hpp>

namespace ltr {

/// Named remote actions ("volume_up", "power_on", ...) bound to handlers that
/// complete asynchronously through a result callback.
/// Dispatch must happen on the main thread.
class ActionRegistry : public QObject {
    Q_OBJECT
public:
    using Handler = std::function<void(const QVariant& payload, ssap::ResultCallback done)>;

    explicit ActionRegistry(QObject* parent = nullptr);

    void registerAction(const QString& actionId, Handler handler);
    void unregisterAction(const QString& actionId);
    bool hasAction(const QString& actionId) const;
    /// Returns false for unknown ids; done is not called in that case.
    bool dispatch(const QString& actionId, const QVariant& payload = {},
                  ssap::ResultCallback done = {});
    QStringList registeredActions() const;

signals:
    void actionDispatched(const QString& actionId);
    void actionCompleted(const QString& actionId, bool success);

private:
    QHash<QString, Handler> handlers_;
};

} // namespace ltr
