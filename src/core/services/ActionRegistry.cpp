#include "ActionRegistry.hpp"
#include <QPointer>
#include <boost/log/trivial.hpp>

namespace ltr {

ActionRegistry::ActionRegistry(QObject* parent) : QObject(parent) {}

void ActionRegistry::registerAction(const QString& actionId, Handler handler)
{
    handlers_[actionId] = std::move(handler);
}

void ActionRegistry::unregisterAction(const QString& actionId)
{
    handlers_.remove(actionId);
}

bool ActionRegistry::hasAction(const QString& actionId) const
{
    return handlers_.contains(actionId);
}

bool ActionRegistry::dispatch(const QString& actionId, const QVariant& payload,
                              ssap::ResultCallback done)
{
    auto it = handlers_.find(actionId);
    if (it == handlers_.end()) {
        BOOST_LOG_TRIVIAL(warning) << "ActionRegistry: unknown action '"
                                   << actionId.toStdString() << "'";
        return false;
    }

    QPointer<ActionRegistry> self(this);
    Handler handler = it.value();
    emit actionDispatched(actionId);
    handler(payload, [self, actionId, done](const ssap::CommandResult& result) {
        if (!result.success)
            BOOST_LOG_TRIVIAL(warning) << "ActionRegistry: '" << actionId.toStdString()
                                       << "' failed: " << result.error.toStdString();
        if (self)
            emit self->actionCompleted(actionId, result.success);
        if (done) done(result);
    });
    return true;
}

QStringList ActionRegistry::registeredActions() const
{
    return handlers_.keys();
}

} // namespace ltr
