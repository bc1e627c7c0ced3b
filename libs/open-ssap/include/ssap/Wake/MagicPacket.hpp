#pragma once

#include <QByteArray>
#include <QString>

namespace ssap {

/// Parses "AA:BB:CC:DD:EE:FF", "aa-bb-cc-dd-ee-ff" or "aabbccddeeff" into six bytes.
/// ':' and '-' are stripped; what is left must be exactly 12 hex digits.
/// On failure returns false and, if given, fills error.
bool parseMacAddress(const QString& text, QByteArray& out, QString* error = nullptr);

/// Canonical upper-case colon form of a six-byte address.
QString formatMacAddress(const QByteArray& mac);

/// User-entered address in canonical form, or a null string if it is not valid.
/// Whitespace is tolerated in addition to ':' and '-'.
QString normalizeMacAddress(const QString& text);

/// 6 x 0xFF followed by 16 copies of the address (102 bytes).
QByteArray buildMagicPacket(const QByteArray& mac);

} // namespace ssap
