#include <ssap/Transport/WebSocketChannel.hpp>
#include <QSslConfiguration>
#include <QSslError>
#include <QDebug>

namespace ssap {

WebSocketChannel::WebSocketChannel(QObject* parent)
    : IChannel(parent)
{
    connect(&socket_, &QWebSocket::connected, this, &WebSocketChannel::onConnected);
    connect(&socket_, &QWebSocket::disconnected, this, &WebSocketChannel::onDisconnected);
    connect(&socket_, &QWebSocket::textMessageReceived, this, &IChannel::textReceived);
    connect(&socket_, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        if (closing_) return;
        emit error(socket_.errorString());
    });
    // The TV presents an ephemeral self-signed certificate issued for no particular host.
    connect(&socket_, &QWebSocket::sslErrors, this, [this](const QList<QSslError>& errors) {
        qDebug() << "[WebSocketChannel] ignoring" << errors.size() << "SSL errors";
        socket_.ignoreSslErrors();
    });
}

WebSocketChannel::~WebSocketChannel()
{
    closing_ = true;
    socket_.disconnect(this);
    socket_.abort();
}

void WebSocketChannel::open(const QUrl& url, bool secure)
{
    if (secure) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        socket_.setSslConfiguration(ssl);
    }
    qDebug() << "[WebSocketChannel] opening" << url.toString();
    closing_ = false;
    socket_.open(url);
}

void WebSocketChannel::close()
{
    if (socket_.state() == QAbstractSocket::UnconnectedState)
        return;
    closing_ = true;
    // A handshake still in progress has nothing to close gracefully.
    if (socket_.state() == QAbstractSocket::ConnectedState)
        socket_.close();
    else
        socket_.abort();
}

bool WebSocketChannel::sendText(const QString& text)
{
    if (socket_.state() != QAbstractSocket::ConnectedState) {
        qWarning() << "[WebSocketChannel] write DROPPED (socket state:"
                   << static_cast<int>(socket_.state()) << ")";
        return false;
    }
    const qint64 sent = socket_.sendTextMessage(text);
    return sent == text.toUtf8().size();
}

bool WebSocketChannel::isOpen() const
{
    return socket_.state() == QAbstractSocket::ConnectedState;
}

void WebSocketChannel::onConnected()
{
    emit opened();
}

void WebSocketChannel::onDisconnected()
{
    emit closed();
}

} // namespace ssap
