#pragma once

#include <ssap/Transport/IChannel.hpp>
#include <QWebSocket>

namespace ssap {

class WebSocketChannel : public IChannel {
    Q_OBJECT
public:
    explicit WebSocketChannel(QObject* parent = nullptr);
    ~WebSocketChannel() override;

    void open(const QUrl& url, bool secure) override;
    void close() override;
    bool sendText(const QString& text) override;
    bool isOpen() const override;

private:
    void onConnected();
    void onDisconnected();

    QWebSocket socket_;
    bool closing_ = false;
};

} // namespace ssap
