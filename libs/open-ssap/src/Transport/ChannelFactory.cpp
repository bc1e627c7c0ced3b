#include <ssap/Transport/ChannelFactory.hpp>
#include <ssap/Transport/WebSocketChannel.hpp>

namespace ssap {

IChannel* WebSocketChannelFactory::createChannel(QObject* parent)
{
    return new WebSocketChannel(parent);
}

IChannel* ReplayChannelFactory::createChannel(QObject* parent)
{
    auto* channel = new ReplayChannel(parent);
    if (configure_)
        configure_(channel, created_.size());
    created_.append(channel);
    return channel;
}

ReplayChannel* ReplayChannelFactory::channel(int index) const
{
    if (index < 0 || index >= created_.size())
        return nullptr;
    return created_.at(index).data();
}

ReplayChannel* ReplayChannelFactory::last() const
{
    return created_.isEmpty() ? nullptr : created_.last().data();
}

} // namespace ssap
