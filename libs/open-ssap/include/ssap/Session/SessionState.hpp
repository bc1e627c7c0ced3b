#pragma once

#include <QMetaType>

namespace ssap {

enum class SessionState {
    Disconnected,
    Connecting,
    Connected
};

enum class ErrorKind {
    None,
    NotConnected,
    ConnectError,
    ConnectTimeout,
    RegistrationError,
    HandshakeTimeout,
    SendError,
    ResponseTimeout,
    ChannelClosed,
    ChannelRefreshError,
    WakeError,
    FormatError,
    NoDevice,
    ConfigError
};

const char* errorKindName(ErrorKind kind);

} // namespace ssap

Q_DECLARE_METATYPE(ssap::SessionState)
Q_DECLARE_METATYPE(ssap::ErrorKind)
