#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTimer>

#include "oasis_cloud.h"
#include "oasis_config.h"
#include "oasis_device.h"
#include "oasis_http_transport.h"
#include "oasis_mqtt_transport.h"
#include "oasis_tracks.h"

namespace {

using namespace oasis::control;

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kHttpWatchPollMs = 5000;
constexpr int kPublishDrainMs = 500;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

std::optional<bool> parseOnOff(const QString &text)
{
    const QString value = text.trimmed().toLower();
    if (value == QLatin1String("on") || value == QLatin1String("1") || value == QLatin1String("true"))
        return true;
    if (value == QLatin1String("off") || value == QLatin1String("0") || value == QLatin1String("false"))
        return false;
    return std::nullopt;
}

std::optional<int> parseInt(const QString &text)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok)
        return std::nullopt;
    return value;
}

std::optional<QList<int>> parseIds(const QStringList &args)
{
    QList<int> ids;
    for (const QString &arg : args) {
        for (const QString &token : arg.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            const auto id = parseInt(token);
            if (!id || *id <= 0)
                return std::nullopt;
            ids.append(*id);
        }
    }
    return ids;
}

void printState(const Device &device)
{
    QJsonObject state = QJsonObject::fromVariantMap(device.asVariantMap());
    QJsonArray playlist;
    for (int id : device.playlist())
        playlist.append(id);
    state.insert(fieldName(Field::Playlist), playlist);
    state.insert(QStringLiteral("status"), device.statusText());
    const QString error = device.errorMessage();
    if (!error.isEmpty())
        state.insert(QStringLiteral("error_message"), error);
    if (device.currentTrackId())
        state.insert(QStringLiteral("track"), device.trackName());
    if (const auto progress = device.drawingProgress())
        state.insert(QStringLiteral("drawing_progress"), *progress);
    std::cout << QJsonDocument(state).toJson(QJsonDocument::Compact).toStdString() << '\n';
}

int reportResult(const QString &command, const CommandResult &result)
{
    if (result.ok())
        return 0;
    std::cerr << command.toStdString() << " failed: " << result.error.toStdString() << '\n';
    return result.status == CmdStatus::InvalidArgument ? kExitUsage : kExitFailure;
}

int usageError(const QString &message)
{
    std::cerr << message.toStdString() << '\n';
    return kExitUsage;
}

void drainEvents(int ms)
{
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

int runCommand(Device &device, const QString &command, const QStringList &args)
{
    if (command == QLatin1String("status")) {
        printState(device);
        return 0;
    }
    if (command == QLatin1String("mac")) {
        CommandResult result;
        const QString mac = device.fetchMacAddress(&result);
        if (!result.ok()) {
            std::cerr << "MAC address unknown: " << result.error.toStdString() << '\n';
            return kExitFailure;
        }
        std::cout << mac.toStdString() << '\n';
        return 0;
    }
    if (command == QLatin1String("play"))
        return reportResult(command, device.play());
    if (command == QLatin1String("pause"))
        return reportResult(command, device.pause());
    if (command == QLatin1String("stop"))
        return reportResult(command, device.stop());
    if (command == QLatin1String("sleep"))
        return reportResult(command, device.sleep());
    if (command == QLatin1String("reboot"))
        return reportResult(command, device.reboot());

    if (command == QLatin1String("speed")) {
        const auto speed = args.isEmpty() ? std::nullopt : parseInt(args.first());
        if (!speed)
            return usageError(QStringLiteral("usage: speed <%1-%2>").arg(kBallSpeedMin).arg(kBallSpeedMax));
        return reportResult(command, device.setBallSpeed(*speed));
    }

    if (command == QLatin1String("led")) {
        if (args.isEmpty())
            return usageError(QStringLiteral("usage: led <effect> [color] [speed] [brightness]"));
        LedRequest request;
        request.effect = args.at(0);
        if (args.size() > 1)
            request.color = args.at(1);
        if (args.size() > 2) {
            request.speed = parseInt(args.at(2));
            if (!request.speed)
                return usageError(QStringLiteral("invalid LED speed: %1").arg(args.at(2)));
        }
        if (args.size() > 3) {
            request.brightness = parseInt(args.at(3));
            if (!request.brightness)
                return usageError(QStringLiteral("invalid brightness: %1").arg(args.at(3)));
        }
        return reportResult(command, device.setLed(request));
    }

    if (command == QLatin1String("playlist") || command == QLatin1String("add")) {
        const auto ids = parseIds(args);
        if (!ids || (command == QLatin1String("add") && ids->isEmpty()))
            return usageError(QStringLiteral("usage: %1 <track ids...>").arg(command));
        if (command == QLatin1String("add"))
            return reportResult(command, device.addTrackToPlaylist(*ids));
        return reportResult(command, device.setPlaylist(*ids));
    }

    if (command == QLatin1String("repeat") || command == QLatin1String("autoclean")) {
        const auto enabled = args.isEmpty() ? std::nullopt : parseOnOff(args.first());
        if (!enabled)
            return usageError(QStringLiteral("usage: %1 <on|off>").arg(command));
        if (command == QLatin1String("repeat"))
            return reportResult(command, device.setRepeatPlaylist(*enabled));
        return reportResult(command, device.setAutoClean(*enabled));
    }

    return usageError(QStringLiteral("unknown command: %1").arg(command));
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("oasisctl"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Control a Kinetic Oasis sand table."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("JSON configuration file."),
                                          QStringLiteral("file"));
    const QCommandLineOption hostOption(QStringLiteral("host"),
                                        QStringLiteral("Talk to the table over the local network."),
                                        QStringLiteral("address"));
    const QCommandLineOption serialOption(QStringLiteral("serial"),
                                          QStringLiteral("Talk to the table through the cloud broker."),
                                          QStringLiteral("serial"));
    const QCommandLineOption tokenOption(QStringLiteral("token"),
                                         QStringLiteral("Cloud access token, used for track names."),
                                         QStringLiteral("token"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Enable debug logging."));
    parser.addOptions({configOption, hostOption, serialOption, tokenOption, verboseOption});
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("status, watch, play, pause, stop, sleep, reboot, speed, "
                                                "led, playlist, add, repeat, autoclean, mac"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."), QStringLiteral("[args...]"));
    parser.process(app);

    if (parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules(QStringLiteral("oasis.control.*.debug=true"));

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty())
        return usageError(parser.helpText());
    const QString command = positional.takeFirst().toLower();

    const bool useHttp = parser.isSet(hostOption);
    const bool useMqtt = parser.isSet(serialOption);
    if (useHttp == useMqtt)
        return usageError(QStringLiteral("exactly one of --host or --serial is required"));

    ClientConfig config;
    if (parser.isSet(configOption)) {
        QString error;
        if (!ClientConfig::loadFile(parser.value(configOption), &config, &error)) {
            std::cerr << "failed to load config: " << error.toStdString() << '\n';
            return kExitFailure;
        }
    }

    TrackCatalog catalog;
    if (!config.trackCatalogPath.isEmpty()) {
        QString error;
        if (!TrackCatalog::loadFile(config.trackCatalogPath, &catalog, &error))
            std::cerr << "ignoring track catalog: " << error.toStdString() << '\n';
    }

    std::unique_ptr<CloudClient> cloud;
    if (parser.isSet(tokenOption)) {
        cloud = std::make_unique<CloudClient>(config.cloud, nullptr, config.httpTimeoutMs);
        cloud->setAccessToken(parser.value(tokenOption));
    }

    DeviceInfo info;
    info.model = QStringLiteral("Oasis");
    info.serialNumber = parser.value(serialOption).trimmed();
    info.ipAddress = parser.value(hostOption).trimmed();
    Device device(info);
    device.setTrackCatalog(&catalog);
    if (cloud)
        device.setTrackSource(cloud.get());

    std::unique_ptr<HttpTransport> http;
    std::unique_ptr<MqttTransport> mqtt;
    if (useHttp) {
        http = std::make_unique<HttpTransport>(info.ipAddress, nullptr, config.httpTimeoutMs);
        device.attachTransport(http.get());
        const CommandResult status = device.requestStatus();
        if (!status.ok()) {
            std::cerr << "cannot reach " << info.ipAddress.toStdString() << ": "
                      << status.error.toStdString() << '\n';
            return kExitFailure;
        }
    } else {
        mqtt = std::make_unique<MqttTransport>(config);
        if (!mqtt->registerDevice(&device))
            return usageError(QStringLiteral("invalid serial number"));
        mqtt->start();
        if (!mqtt->waitUntilReady(device, config.readyTimeoutMs)) {
            std::cerr << "device " << info.serialNumber.toStdString() << " did not report in time" << '\n';
            if (command == QLatin1String("status") || command == QLatin1String("mac")) {
                mqtt->stop();
                return kExitFailure;
            }
        }
    }

    int rc = 0;
    if (command == QLatin1String("watch")) {
        printState(device);
        const Device::Unsubscribe unsubscribe = device.addUpdateListener([&device]() {
            printState(device);
        });

        QEventLoop loop;
        QTimer signalPoll;
        QObject::connect(&signalPoll, &QTimer::timeout, &loop, [&loop]() {
            if (!g_running.load())
                loop.quit();
        });
        signalPoll.start(250);

        QTimer statusPoll;
        if (http) {
            QObject::connect(&statusPoll, &QTimer::timeout, &device, [&device]() {
                const CommandResult result = device.requestStatus();
                if (!result.ok())
                    std::cerr << "status poll failed: " << result.error.toStdString() << '\n';
            });
            statusPoll.start(kHttpWatchPollMs);
        }

        loop.exec();
        unsubscribe();
    } else {
        rc = runCommand(device, command, positional);
    }

    if (mqtt) {
        // Let the broker session write out what was just published.
        drainEvents(kPublishDrainMs);
        mqtt->stop();
    }
    if (http)
        http->close();
    if (cloud)
        cloud->close();

    return rc;
}
