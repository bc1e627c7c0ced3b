#pragma once

#include <ssap/Transport/ReplayChannel.hpp>
#include <QList>
#include <QPointer>
#include <functional>

namespace ssap {

class IChannelFactory {
public:
    virtual ~IChannelFactory() = default;
    virtual IChannel* createChannel(QObject* parent) = 0;
};

class WebSocketChannelFactory : public IChannelFactory {
public:
    IChannel* createChannel(QObject* parent) override;
};

/// Hands out ReplayChannels and remembers them in creation order.
/// The configure hook runs before the channel is returned, so tests can script
/// each channel (command channel first, input channels after).
class ReplayChannelFactory : public IChannelFactory {
public:
    using Configure = std::function<void(ReplayChannel* channel, int index)>;

    void setConfigure(Configure configure) { configure_ = std::move(configure); }
    IChannel* createChannel(QObject* parent) override;

    int createdCount() const { return created_.size(); }
    ReplayChannel* channel(int index) const;
    ReplayChannel* last() const;

private:
    Configure configure_;
    QList<QPointer<ReplayChannel>> created_;
};

} // namespace ssap
