#include <ssap/Transport/ReplayChannel.hpp>
#include <QTimer>

namespace ssap {

ReplayChannel::ReplayChannel(QObject* parent)
    : IChannel(parent)
{
}

ReplayChannel::~ReplayChannel() = default;

void ReplayChannel::open(const QUrl& url, bool secure)
{
    url_ = url;
    secure_ = secure;
    switch (openBehavior_) {
    case OpenBehavior::Succeed:
        QTimer::singleShot(0, this, &ReplayChannel::simulateOpen);
        break;
    case OpenBehavior::Fail:
        QTimer::singleShot(0, this, [this]() { emit error(QStringLiteral("Connection refused")); });
        break;
    case OpenBehavior::Hang:
        break;
    }
}

void ReplayChannel::close()
{
    ++closeCount_;
    open_ = false;
}

bool ReplayChannel::sendText(const QString& text)
{
    if (!open_ || failWrites_)
        return false;
    written_.append(text);
    if (responder_)
        responder_(this, text);
    return true;
}

bool ReplayChannel::isOpen() const
{
    return open_;
}

void ReplayChannel::feedText(const QString& text)
{
    QTimer::singleShot(0, this, [this, text]() { emit textReceived(text); });
}

void ReplayChannel::simulateOpen()
{
    open_ = true;
    emit opened();
}

void ReplayChannel::simulateClose()
{
    open_ = false;
    emit closed();
}

} // namespace ssap
