#include <ssap/Session/CommandResult.hpp>

namespace ssap {

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:                return "none";
    case ErrorKind::NotConnected:        return "not_connected";
    case ErrorKind::ConnectError:        return "connect_error";
    case ErrorKind::ConnectTimeout:      return "connect_timeout";
    case ErrorKind::RegistrationError:   return "registration_error";
    case ErrorKind::HandshakeTimeout:    return "handshake_timeout";
    case ErrorKind::SendError:           return "send_error";
    case ErrorKind::ResponseTimeout:     return "response_timeout";
    case ErrorKind::ChannelClosed:       return "channel_closed";
    case ErrorKind::ChannelRefreshError: return "channel_refresh_error";
    case ErrorKind::WakeError:           return "wake_error";
    case ErrorKind::FormatError:         return "format_error";
    case ErrorKind::NoDevice:            return "no_device";
    case ErrorKind::ConfigError:         return "config_error";
    }
    return "unknown";
}

CommandResult CommandResult::ok()
{
    CommandResult result;
    result.success = true;
    return result;
}

CommandResult CommandResult::okWithMessage(const QString& message)
{
    CommandResult result = ok();
    result.message = message;
    return result;
}

CommandResult CommandResult::failure(ErrorKind kind, const QString& error)
{
    CommandResult result;
    result.kind = kind;
    result.error = error;
    return result;
}

QJsonObject CommandResult::toJson() const
{
    QJsonObject obj;
    obj["success"] = success;
    if (!message.isNull()) obj["message"] = message;
    if (!error.isNull()) {
        obj["error"] = error;
        obj["kind"] = QString::fromLatin1(errorKindName(kind));
    }
    if (!clientKey.isNull()) obj["client_key"] = clientKey;
    if (!mac.isNull()) obj["mac"] = mac;
    if (!payload.isEmpty()) obj["payload"] = payload;
    return obj;
}

} // namespace ssap
