#pragma once

#include <ssap/Transport/IChannel.hpp>
#include <QStringList>
#include <functional>

namespace ssap {

/// In-memory channel used by tests to stand in for the TV.
class ReplayChannel : public IChannel {
    Q_OBJECT
public:
    enum class OpenBehavior { Succeed, Fail, Hang };
    using Responder = std::function<void(ReplayChannel* channel, const QString& sent)>;

    explicit ReplayChannel(QObject* parent = nullptr);
    ~ReplayChannel() override;

    // IChannel interface
    void open(const QUrl& url, bool secure) override;
    void close() override;
    bool sendText(const QString& text) override;
    bool isOpen() const override;

    // Test API
    void setOpenBehavior(OpenBehavior behavior) { openBehavior_ = behavior; }
    void setResponder(Responder responder) { responder_ = std::move(responder); }
    void setFailWrites(bool fail) { failWrites_ = fail; }
    /// Delivers a frame from the "device" on the next event loop turn.
    void feedText(const QString& text);
    void simulateOpen();
    void simulateClose();
    QStringList writtenFrames() const { return written_; }
    void clearWritten() { written_.clear(); }
    QUrl url() const { return url_; }
    bool secure() const { return secure_; }
    int closeCount() const { return closeCount_; }

private:
    OpenBehavior openBehavior_ = OpenBehavior::Succeed;
    Responder responder_;
    bool failWrites_ = false;
    bool open_ = false;
    bool secure_ = false;
    int closeCount_ = 0;
    QUrl url_;
    QStringList written_;
};

} // namespace ssap
