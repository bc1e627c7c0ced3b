#include <ssap/Wake/IProcessRunner.hpp>
#include <QDebug>
#include <QProcess>
#include <QTimer>
#include <memory>

namespace ssap {

QProcessRunner::QProcessRunner(int timeoutMs, QObject* parent)
    : QObject(parent)
    , timeoutMs_(timeoutMs)
{
}

void QProcessRunner::run(const QString& program, const QStringList& arguments, Callback done)
{
    auto* process = new QProcess(this);
    auto* timer = new QTimer(process);
    timer->setSingleShot(true);

    auto finished = std::make_shared<bool>(false);
    auto finish = [process, timer, finished, done](const ProcessResult& result) {
        if (*finished) return;
        *finished = true;
        timer->stop();
        process->disconnect();
        process->deleteLater();
        done(result);
    };

    connect(process, &QProcess::finished, this,
            [process, finish](int exitCode, QProcess::ExitStatus status) {
        ProcessResult result;
        result.started = true;
        result.exitCode = status == QProcess::NormalExit ? exitCode : -1;
        result.standardError = QString::fromLocal8Bit(process->readAllStandardError()).trimmed();
        finish(result);
    });
    connect(process, &QProcess::errorOccurred, this,
            [process, finish](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;   // crashes also end in finished()
        ProcessResult result;
        result.errorString = process->errorString();
        finish(result);
    });
    connect(timer, &QTimer::timeout, this, [process, program, finish]() {
        qWarning() << "[QProcessRunner]" << program << "timed out, killing";
        process->kill();
        ProcessResult result;
        result.started = true;
        result.standardError = QStringLiteral("timed out");
        finish(result);
    });

    qDebug() << "[QProcessRunner] run" << program << arguments;
    timer->start(timeoutMs_);
    process->start(program, arguments);
}

} // namespace ssap
