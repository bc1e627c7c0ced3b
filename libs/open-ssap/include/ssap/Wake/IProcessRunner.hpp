#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>

namespace ssap {

struct ProcessResult {
    bool started = false;
    int exitCode = -1;
    QString standardError;
    QString errorString;    // why the process could not start
};

/// Runs an external tool without blocking the event loop.
class IProcessRunner {
public:
    using Callback = std::function<void(const ProcessResult& result)>;

    virtual ~IProcessRunner() = default;
    virtual void run(const QString& program, const QStringList& arguments, Callback done) = 0;
};

class QProcessRunner : public QObject, public IProcessRunner {
    Q_OBJECT
public:
    explicit QProcessRunner(int timeoutMs = 15000, QObject* parent = nullptr);

    void run(const QString& program, const QStringList& arguments, Callback done) override;

private:
    int timeoutMs_;
};

} // namespace ssap
