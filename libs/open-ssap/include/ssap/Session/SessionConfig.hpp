#pragma once

#include <ssap/Version.hpp>
#include <cstdint>

namespace ssap {

struct SessionConfig {
    uint16_t plainPort = COMMAND_PORT_PLAIN;
    uint16_t securePort = COMMAND_PORT_SECURE;

    // Timeouts (ms)
    int connectTimeout = 5000;
    int handshakeTimeout = 5000;    // credential supplied, no prompt expected
    int pairingTimeout = 60000;     // no credential, user must accept on the TV
    int commandTimeout = 3000;
    int keepaliveInterval = 25000;
    int refreshGrace = 3000;
};

} // namespace ssap
