#include <ssap/Wake/MagicPacket.hpp>
#include <ssap/Version.hpp>

namespace ssap {

bool parseMacAddress(const QString& text, QByteArray& out, QString* error)
{
    QString hex = text;
    hex.remove(QLatin1Char(':')).remove(QLatin1Char('-'));

    bool valid = hex.size() == MAC_ADDRESS_SIZE * 2;
    for (QChar c : hex) {
        if (!valid) break;
        valid = c.isDigit() || (c.toLower() >= QLatin1Char('a') && c.toLower() <= QLatin1Char('f'));
    }
    if (!valid) {
        if (error) *error = QStringLiteral("Invalid MAC address format");
        return false;
    }

    out = QByteArray::fromHex(hex.toLatin1());
    return true;
}

QString formatMacAddress(const QByteArray& mac)
{
    return QString::fromLatin1(mac.toHex(':').toUpper());
}

QString normalizeMacAddress(const QString& text)
{
    QString compact = text;
    compact.remove(QLatin1Char(' '));
    QByteArray mac;
    if (!parseMacAddress(compact, mac))
        return QString();
    return formatMacAddress(mac);
}

QByteArray buildMagicPacket(const QByteArray& mac)
{
    QByteArray packet;
    packet.reserve(MAGIC_PACKET_SIZE);
    packet.fill(char(0xFF), 6);
    for (int i = 0; i < 16; ++i)
        packet.append(mac);
    return packet;
}

} // namespace ssap
