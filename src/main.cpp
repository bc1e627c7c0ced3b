#include <signal.h>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTimer>
#include <cstdio>
#include <memory>
#include <boost/log/trivial.hpp>
#include <ssap/Session/TvSession.hpp>
#include <ssap/Transport/ChannelFactory.hpp>
#include <ssap/Wake/IDatagramSender.hpp>
#include <ssap/Wake/IProcessRunner.hpp>
#include <ssap/Wake/WakeService.hpp>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/ActionRegistry.hpp"
#include "core/services/DeviceStore.hpp"
#include "core/services/RemoteController.hpp"

namespace {

enum ExitCode { ExitOk = 0, ExitFailure = 1, ExitUsage = 2 };

struct CliCommand {
    const char* name;
    const char* actionId;   // dispatched through the ActionRegistry when set
    bool needsSession;
};

const CliCommand kCommands[] = {
    {"connect", nullptr, true},
    {"authenticate", nullptr, false},
    {"status", nullptr, true},
    {"button", nullptr, true},
    {"volume-up", "volume_up", true},
    {"volume-down", "volume_down", true},
    {"mute", "mute", true},
    {"unmute", "unmute", true},
    {"power-on", "power_on", false},
    {"power-off", "power_off", true},
    {"fetch-mac", nullptr, true},
    {"set-mac", nullptr, false},
    {"wake-streaming", "wake_streaming_device", false},
    {"watch", nullptr, true},
};

const CliCommand* findCommand(const QString& name)
{
    for (const auto& command : kCommands)
        if (name == QLatin1String(command.name))
            return &command;
    return nullptr;
}

void printResult(const ssap::CommandResult& result)
{
    const QByteArray json = QJsonDocument(result.toJson()).toJson(QJsonDocument::Indented);
    std::fwrite(json.constData(), 1, static_cast<size_t>(json.size()), stdout);
    std::fflush(stdout);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("lgtv-remote");
    app.setApplicationVersion("0.1.0");

    qRegisterMetaType<ssap::SessionState>();
    qRegisterMetaType<ssap::ErrorKind>();

    QCommandLineParser parser;
    parser.setApplicationDescription("Remote control for LG webOS TVs");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "path",
                                    QDir::homePath() + "/.config/lgtv-remote/config.yaml");
    QCommandLineOption verboseOption({"v", "verbose"}, "Log at debug level.");
    QCommandLineOption sslOption("ssl", "authenticate: use the encrypted port.");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addOption(sslOption);
    parser.addPositionalArgument("command",
        "connect | authenticate <name> <address> | status | button <name> | volume-up | "
        "volume-down | mute | unmute | power-on | power-off | fetch-mac | set-mac <mac> | "
        "wake-streaming | watch");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    const CliCommand* command = args.isEmpty() ? nullptr : findCommand(args.first());
    if (!command) {
        std::fprintf(stderr, "%s\n", qPrintable(parser.helpText()));
        return ExitUsage;
    }
    const QString name = QString::fromLatin1(command->name);
    if ((name == "authenticate" && args.size() != 3)
        || ((name == "button" || name == "set-mac") && args.size() != 2)) {
        std::fprintf(stderr, "%s: wrong number of arguments\n", command->name);
        return ExitUsage;
    }

    // Load config if present; otherwise use built-in defaults
    const QString configPath = parser.value(configOption);
    ltr::YamlConfig yamlConfig;
    if (QFile::exists(configPath) && !yamlConfig.load(configPath))
        std::fprintf(stderr, "warning: %s could not be read, using defaults\n", qPrintable(configPath));
    ltr::initLogging(parser.isSet(verboseOption) ? QStringLiteral("debug") : yamlConfig.logLevel());

    const ssap::SessionConfig sessionConfig = yamlConfig.sessionConfig();
    auto channelFactory = std::make_unique<ssap::WebSocketChannelFactory>();
    auto datagramSender = std::make_unique<ssap::UdpDatagramSender>();
    auto processRunner = std::make_unique<ssap::QProcessRunner>();
    auto deviceStore = std::make_unique<ltr::DeviceStore>(&yamlConfig, configPath);

    // Declared after what they reference, so they are destroyed first.
    auto tvSession = std::make_unique<ssap::TvSession>(channelFactory.get(), sessionConfig);
    auto wakeService = std::make_unique<ssap::WakeService>(datagramSender.get(), processRunner.get());
    auto remoteController = std::make_unique<ltr::RemoteController>(
        tvSession.get(), wakeService.get(), deviceStore.get());
    auto registry = std::make_unique<ltr::ActionRegistry>();
    remoteController->registerActions(registry.get());

    ltr::RemoteController* controller = remoteController.get();
    ltr::ActionRegistry* actionRegistry = registry.get();

    auto finish = [](const ssap::CommandResult& result) {
        printResult(result);
        QCoreApplication::exit(result.success ? ExitOk : ExitFailure);
    };

    auto runCommand = [=]() {
        if (command->actionId) {
            actionRegistry->dispatch(QString::fromLatin1(command->actionId), {}, finish);
        } else if (name == "status") {
            ssap::CommandResult status = ssap::CommandResult::okWithMessage(
                controller->isConnected() ? QStringLiteral("Connected") : QStringLiteral("Disconnected"));
            finish(status);
        } else if (name == "button") {
            const QString button = args.at(1);
            if (!actionRegistry->dispatch(button.toLower(), {}, finish))
                controller->sendButton(button, finish);
        } else if (name == "fetch-mac") {
            controller->fetchMac(finish);
        } else if (name == "set-mac") {
            finish(controller->setMac(args.at(1)));
        } else if (name == "watch") {
            BOOST_LOG_TRIVIAL(info) << "Watching connection, Ctrl+C to stop";
            QObject::connect(controller, &ltr::RemoteController::connectionLost, [finish]() {
                finish(ssap::CommandResult::failure(ssap::ErrorKind::ChannelClosed,
                                                    QStringLiteral("Connection lost")));
            });
        }
    };

    const bool useSsl = parser.isSet(sslOption);
    QTimer::singleShot(0, &app, [=]() {
        if (name == "authenticate") {
            controller->authenticate(args.at(1), args.at(2), useSsl, finish);
            return;
        }
        if (!command->needsSession) {
            runCommand();
            return;
        }
        controller->connectActive([=](const ssap::CommandResult& connected) {
            if (!connected.success || name == "connect") {
                finish(connected);
                return;
            }
            runCommand();
        });
    });

    // SIGINT → end a watch cleanly
    static ltr::RemoteController* g_controller = controller;
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(g_controller, []() {
            g_controller->disconnectTv([](const ssap::CommandResult&) {
                QCoreApplication::exit(ExitOk);
            });
        }, Qt::QueuedConnection);
    });

    return app.exec();
}
