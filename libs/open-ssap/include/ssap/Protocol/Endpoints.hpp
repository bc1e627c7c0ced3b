#pragma once

namespace ssap {

namespace Endpoint {
    constexpr const char* VolumeUp   = "ssap://audio/volumeUp";
    constexpr const char* VolumeDown = "ssap://audio/volumeDown";
    constexpr const char* SetMute    = "ssap://audio/setMute";
    constexpr const char* TurnOff    = "ssap://system/turnOff";
    constexpr const char* PointerInputSocket =
        "ssap://com.webos.service.networkinput/getPointerInputSocket";
    // Cheap request that every firmware answers; doubles as the keepalive ping.
    constexpr const char* NetworkInfo =
        "ssap://com.webos.service.connectionmanager/getinfo";
    constexpr const char* ConnectionManagerStatus =
        "ssap://com.webos.service.connectionmanager/getStatus";
    constexpr const char* WifiStatus = "ssap://com.webos.service.wifi/getstatus";
    constexpr const char* PalmWifiStatus = "ssap://com.palm.wifi/getStatus";
}

namespace MessageType {
    constexpr const char* Request    = "request";
    constexpr const char* Register   = "register";
    constexpr const char* Registered = "registered";
    constexpr const char* Error      = "error";
    constexpr const char* Response   = "response";
}

} // namespace ssap
