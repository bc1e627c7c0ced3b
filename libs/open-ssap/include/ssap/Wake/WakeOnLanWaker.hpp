#pragma once

#include <ssap/Session/CommandResult.hpp>
#include <ssap/Wake/IDatagramSender.hpp>

namespace ssap {

/// Magic packet to the limited broadcast address, and optionally to a subnet
/// broadcast address for networks that drop 255.255.255.255.
class WakeOnLanWaker {
public:
    explicit WakeOnLanWaker(IDatagramSender* sender);

    /// Only the primary send decides the result; secondary sends are logged.
    CommandResult wake(const QString& mac, const QString& broadcastAddress = QString()) const;

private:
    IDatagramSender* sender_;
};

} // namespace ssap
