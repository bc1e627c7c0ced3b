#pragma once
#include <cstdint>

namespace ssap {

constexpr uint16_t COMMAND_PORT_PLAIN = 3000;
constexpr uint16_t COMMAND_PORT_SECURE = 3001;

constexpr int MANIFEST_VERSION = 1;
constexpr const char* MANIFEST_APP_VERSION = "1.1";

constexpr int MAC_ADDRESS_SIZE = 6;
constexpr int MAGIC_PACKET_SIZE = 6 + 16 * MAC_ADDRESS_SIZE; // 102 bytes
constexpr uint16_t WOL_PORT = 9;
constexpr uint16_t WOL_LEGACY_PORT = 7;

constexpr uint16_t ADB_DEFAULT_PORT = 5555;
constexpr uint16_t ECP_PORT = 8060;

} // namespace ssap
