#include "oasis_mqtt_transport.h"

#include <QEventLoop>

#include "oasis_broker.h"
#include "oasis_codec.h"
#include "oasis_device.h"
#include "oasis_log.h"

namespace oasis::control {

namespace {

constexpr quint8 kQos = 1;

QString formatDuration(qint64 ms)
{
    const qint64 totalSeconds = ms / 1000;
    return QStringLiteral("%1:%2:%3")
        .arg(totalSeconds / 3600)
        .arg((totalSeconds / 60) % 60, 2, 10, QLatin1Char('0'))
        .arg(totalSeconds % 60, 2, 10, QLatin1Char('0'));
}

} // namespace

MqttTransport::MqttTransport(const ClientConfig &config, QObject *parent)
    : MqttTransport(std::make_unique<MqttBrokerLink>(config.broker), config, parent)
{
}

MqttTransport::MqttTransport(std::unique_ptr<BrokerLink> link, const ClientConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_link(std::move(link))
{
    if (m_config.reconnectIntervalMs < kMinReconnectIntervalMs)
        m_config.reconnectIntervalMs = kDefaultReconnectIntervalMs;
    if (m_config.maxPendingCommands < 1)
        m_config.maxPendingCommands = kDefaultMaxPendingCommands;

    m_retryTimer.setSingleShot(true);
    m_retryTimer.setInterval(m_config.reconnectIntervalMs);
    connect(&m_retryTimer, &QTimer::timeout, this, &MqttTransport::onRetryTimeout);

    m_connectTimer.setSingleShot(true);
    connect(&m_connectTimer, &QTimer::timeout, this, &MqttTransport::onConnectTimeout);

    connect(m_link.get(), &BrokerLink::connected, this, &MqttTransport::onLinkConnected);
    connect(m_link.get(), &BrokerLink::disconnected, this, &MqttTransport::onLinkDisconnected);
    connect(m_link.get(), &BrokerLink::messageReceived, this, &MqttTransport::handleMessage);
    connect(m_link.get(), &BrokerLink::errorOccurred, this, [this](const QString &message) {
        if (m_state == State::Connected)
            return;
        qCDebug(oasisMqttLog) << "MQTT connection error:" << message;
    });
}

MqttTransport::~MqttTransport()
{
    stop();
    m_link->disconnect(this);
    for (Device *device : std::as_const(m_devices)) {
        device->disconnect(this);
        if (device->transport() == this)
            device->attachTransport(nullptr);
    }
}

QString MqttTransport::statusTopicFilter(const QString &serial)
{
    return QStringLiteral("%1/STATUS/#").arg(serial);
}

QString MqttTransport::commandTopic(const QString &serial)
{
    return QStringLiteral("%1/COMMAND/CMD").arg(serial);
}

void MqttTransport::start()
{
    if (m_state != State::Stopped)
        return;
    attemptConnect();
}

void MqttTransport::stop()
{
    if (m_state == State::Stopped) {
        m_queue.clear();
        return;
    }

    m_retryTimer.stop();
    m_connectTimer.stop();
    m_link->disconnectFromBroker();
    logConnectedDuration();

    if (!m_queue.isEmpty())
        qCDebug(oasisMqttLog) << "Dropping" << m_queue.size() << "pending commands on stop";
    m_queue.clear();
    m_subscribed.clear();
    setState(State::Stopped);
}

void MqttTransport::setState(State state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit connectionStateChanged(state);
}

void MqttTransport::attemptConnect()
{
    setState(State::Connecting);
    qCInfo(oasisMqttLog).noquote() << "Connecting MQTT WSS to" << m_config.broker.url().toString();
    if (m_config.connectTimeoutMs > 0)
        m_connectTimer.start(m_config.connectTimeoutMs);
    m_link->connectToBroker();
}

void MqttTransport::onLinkConnected()
{
    if (m_state != State::Connecting)
        return;

    m_connectTimer.stop();
    m_connectedAt = QDateTime::currentDateTimeUtc();
    setState(State::Connected);
    qCInfo(oasisMqttLog) << "Connected to MQTT broker";

    resubscribeAll();
    flushPendingCommands();
}

void MqttTransport::onLinkDisconnected()
{
    if (m_state == State::Stopped)
        return;
    m_connectTimer.stop();
    handleConnectionLost();
}

void MqttTransport::onConnectTimeout()
{
    if (m_state != State::Connecting)
        return;
    qCWarning(oasisMqttLog) << "MQTT connect attempt timed out after" << m_config.connectTimeoutMs << "ms";
    m_link->disconnectFromBroker();
    handleConnectionLost();
}

void MqttTransport::onRetryTimeout()
{
    if (m_state != State::Disconnected)
        return;
    attemptConnect();
}

void MqttTransport::handleConnectionLost()
{
    logConnectedDuration();
    m_subscribed.clear();
    setState(State::Disconnected);

    qCInfo(oasisMqttLog) << "Disconnected from broker, retrying in"
                         << m_config.reconnectIntervalMs / 1000.0 << "s";
    m_retryTimer.start(m_config.reconnectIntervalMs);
}

void MqttTransport::logConnectedDuration()
{
    if (!m_connectedAt.isValid())
        return;
    const qint64 ms = m_connectedAt.msecsTo(QDateTime::currentDateTimeUtc());
    qCInfo(oasisMqttLog).noquote() << "MQTT was connected for" << formatDuration(ms);
    m_connectedAt = QDateTime();
}

bool MqttTransport::registerDevice(Device *device)
{
    if (!device || device->serialNumber().isEmpty()) {
        qCWarning(oasisMqttLog) << "Device must have a serial number before registration";
        return false;
    }

    const QString serial = device->serialNumber();
    Device *previous = m_devices.value(serial);
    if (previous && previous != device)
        previous->disconnect(this);

    m_devices.insert(serial, device);
    connect(device, &QObject::destroyed, this, [this, serial](QObject *object) {
        if (static_cast<QObject *>(m_devices.value(serial)) != object)
            return;
        m_devices.remove(serial);
        m_initialized.remove(serial);
        m_macKnown.remove(serial);
    });

    if (!device->transport())
        device->attachTransport(this);

    if (m_state == State::Connected) {
        QTimer::singleShot(0, this, [this, serial]() {
            if (m_devices.contains(serial))
                subscribeSerial(serial);
        });
    }
    return true;
}

void MqttTransport::unregisterDevice(Device *device)
{
    if (!device || device->serialNumber().isEmpty())
        return;

    const QString serial = device->serialNumber();
    if (m_devices.value(serial) != device)
        return;

    device->disconnect(this);
    m_devices.remove(serial);
    m_initialized.remove(serial);
    m_macKnown.remove(serial);

    if (m_state == State::Connected && m_subscribed.contains(serial)) {
        QTimer::singleShot(0, this, [this, serial]() {
            if (!m_devices.contains(serial))
                unsubscribeSerial(serial);
        });
    }
}

void MqttTransport::subscribeSerial(const QString &serial)
{
    if (m_state != State::Connected || m_subscribed.contains(serial))
        return;

    const QString topic = statusTopicFilter(serial);
    if (!m_link->subscribe(topic, kQos)) {
        qCWarning(oasisMqttLog) << "Failed to subscribe to" << topic;
        return;
    }
    m_subscribed.insert(serial);
    qCInfo(oasisMqttLog) << "Subscribed to" << topic;
}

void MqttTransport::unsubscribeSerial(const QString &serial)
{
    if (m_state != State::Connected || !m_subscribed.contains(serial))
        return;

    const QString topic = statusTopicFilter(serial);
    m_link->unsubscribe(topic);
    m_subscribed.remove(serial);
    qCInfo(oasisMqttLog) << "Unsubscribed from" << topic;
}

void MqttTransport::resubscribeAll()
{
    m_subscribed.clear();
    const QStringList serials = m_devices.keys();
    for (const QString &serial : serials)
        subscribeSerial(serial);
}

CommandResult MqttTransport::publishCommand(Device &device, const Command &command)
{
    const QString serial = device.serialNumber();
    if (serial.isEmpty())
        return CommandResult::failure(CmdStatus::Failure, QStringLiteral("Device has no serial number set"));

    // A sleeping table ignores commands until it has been woken by GETALL.
    if (command.wakesDevice && device.isSleeping())
        publishCommand(device, command::getAll());

    publish(serial, command.toPayload());
    return CommandResult::success();
}

void MqttTransport::publish(const QString &serial, const QByteArray &payload)
{
    if (m_state != State::Connected || !m_link->isConnected()) {
        qCDebug(oasisMqttLog) << "MQTT not connected, queueing command for" << serial << ":" << payload;
        enqueue(serial, payload);
        return;
    }

    const QString topic = commandTopic(serial);
    qCDebug(oasisMqttLog) << "MQTT publish" << topic << "=>" << payload;
    if (!m_link->publish(topic, payload, kQos)) {
        qCDebug(oasisMqttLog) << "MQTT publish failed, queueing command for" << serial << ":" << payload;
        enqueue(serial, payload);
    }
}

void MqttTransport::enqueue(const QString &serial, const QByteArray &payload)
{
    while (m_queue.size() >= m_config.maxPendingCommands) {
        const PendingCommand dropped = m_queue.dequeue();
        qCDebug(oasisMqttLog) << "Command queue full, dropping oldest command:"
                              << dropped.serial << dropped.payload;
    }
    m_queue.enqueue(PendingCommand{serial, payload});
    qCDebug(oasisMqttLog) << "Queued command for" << serial << ":" << payload;
}

void MqttTransport::flushPendingCommands()
{
    int remaining = m_queue.size();
    while (remaining-- > 0 && !m_queue.isEmpty()) {
        if (m_state != State::Connected)
            return;

        const PendingCommand next = m_queue.dequeue();
        if (!m_devices.contains(next.serial)) {
            qCDebug(oasisMqttLog) << "Skipping queued command for unknown device" << next.serial
                                  << ":" << next.payload;
            continue;
        }

        const QString topic = commandTopic(next.serial);
        qCDebug(oasisMqttLog) << "Flushing queued MQTT command" << topic << "=>" << next.payload;
        if (!m_link->publish(topic, next.payload, kQos)) {
            qCDebug(oasisMqttLog) << "Failed to flush queued command for" << next.serial << ", re-queuing";
            enqueue(next.serial, next.payload);
            return;
        }
    }
}

void MqttTransport::handleMessage(const QString &topic, const QByteArray &payload)
{
    // <serial>/STATUS/<suffix>
    const QStringList parts = topic.split(QLatin1Char('/'));
    if (parts.size() < 3)
        return;

    const QString serial = parts.at(0);
    const QString suffix = parts.at(2);

    Device *device = m_devices.value(serial);
    if (!device) {
        qCDebug(oasisMqttLog) << "Received MQTT for unknown device" << serial << ":" << topic;
        return;
    }

    const QString text = QString::fromUtf8(payload);
    if (!isKnownStatusTopic(suffix)) {
        qCWarning(oasisMqttLog) << "Unknown status received for" << serial << ":" << suffix << "=" << text;
    } else {
        QString error;
        const std::optional<FieldMap> update = parseTopicValue(suffix, text, &error);
        if (!update) {
            qCWarning(oasisMqttLog) << "Error parsing MQTT payload for" << serial << suffix
                                    << ":" << text << "-" << error;
            return;
        }
        device->applyFieldMap(*update);

        if (suffix == QLatin1String("MAC_ADDRESS")) {
            m_macKnown.insert(serial);
            emit macAddressReceived(serial);
        }
    }

    // The device may have been unregistered by a listener.
    if (m_devices.value(serial) != device)
        return;
    if (device->isInitialized() && !m_initialized.contains(serial)) {
        m_initialized.insert(serial);
        emit deviceInitialized(serial);
    }
}

bool MqttTransport::waitFor(const std::function<bool()> &done, int timeoutMs)
{
    if (done())
        return true;
    if (timeoutMs <= 0 || m_state == State::Stopped)
        return false;

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    const auto check = [&]() {
        if (done() || m_state == State::Stopped)
            loop.quit();
    };
    connect(this, &MqttTransport::connectionStateChanged, &loop, check);
    connect(this, &MqttTransport::deviceInitialized, &loop, check);
    connect(this, &MqttTransport::macAddressReceived, &loop, check);

    timer.start(timeoutMs);
    loop.exec();
    return done();
}

bool MqttTransport::waitUntilReady(Device &device, int timeoutMs, bool requestStatus)
{
    const QString serial = device.serialNumber();
    if (serial.isEmpty()) {
        qCWarning(oasisMqttLog) << "waitUntilReady: device has no serial number set";
        return false;
    }

    const int timeout = timeoutMs < 0 ? m_config.readyTimeoutMs : timeoutMs;

    if (!waitFor([this]() { return m_state == State::Connected; }, timeout)) {
        qCDebug(oasisMqttLog) << "Timed out after" << timeout << "ms waiting for MQTT connection, device"
                              << serial;
        return false;
    }

    if (requestStatus) {
        m_initialized.remove(serial);
        publishCommand(device, command::getStatus());
    }

    if (!waitFor([this, serial]() { return m_initialized.contains(serial); }, timeout)) {
        qCDebug(oasisMqttLog) << "Timed out after" << timeout << "ms waiting for" << serial << "to initialize";
        return false;
    }
    return true;
}

CommandResult MqttTransport::requestFullState(Device &device)
{
    return publishCommand(device, command::getAll());
}

CommandResult MqttTransport::requestStatus(Device &device)
{
    return publishCommand(device, command::getStatus());
}

QString MqttTransport::macAddress(Device &device)
{
    if (!device.macAddress().isEmpty())
        return device.macAddress();

    const QString serial = device.serialNumber();
    if (serial.isEmpty())
        return {};

    m_macKnown.remove(serial);
    publishCommand(device, command::getStatus());

    if (!waitFor([this, serial]() { return m_macKnown.contains(serial); }, m_config.macTimeoutMs))
        qCDebug(oasisMqttLog) << "Timed out waiting for MAC_ADDRESS for" << serial;

    return device.macAddress();
}

CommandResult MqttTransport::sendAutoClean(Device &device, bool enabled)
{
    return publishCommand(device, command::autoClean(enabled));
}

CommandResult MqttTransport::sendBallSpeed(Device &device, int speed)
{
    return publishCommand(device, command::ballSpeed(speed));
}

CommandResult MqttTransport::sendLed(Device &device,
                                     const QString &effect,
                                     const QString &color,
                                     int speed,
                                     int brightness)
{
    return publishCommand(device, command::led(effect, color, speed, brightness));
}

CommandResult MqttTransport::sendSleep(Device &device)
{
    return publishCommand(device, command::sleep());
}

CommandResult MqttTransport::sendMoveJob(Device &device, int fromIndex, int toIndex)
{
    return publishCommand(device, command::moveJob(fromIndex, toIndex));
}

CommandResult MqttTransport::sendChangeTrack(Device &device, int index)
{
    return publishCommand(device, command::changeTrack(index));
}

CommandResult MqttTransport::sendAddJobList(Device &device, const QList<int> &tracks)
{
    return publishCommand(device, command::addJobList(tracks));
}

CommandResult MqttTransport::sendSetPlaylist(Device &device, const QList<int> &playlist)
{
    const CommandResult result = publishCommand(device, command::setJobList(playlist));
    if (!result.ok())
        return result;

    FieldMap update;
    update.insert(fieldName(Field::Playlist), QVariant::fromValue(playlist));
    device.applyFieldMap(update);
    return result;
}

CommandResult MqttTransport::sendRepeatPlaylist(Device &device, bool repeat)
{
    return publishCommand(device, command::repeatJob(repeat));
}

CommandResult MqttTransport::sendAutoplay(Device &device, const QString &option)
{
    return publishCommand(device, command::waitAfter(option));
}

CommandResult MqttTransport::sendUpgrade(Device &device, bool beta)
{
    return publishCommand(device, command::upgrade(beta));
}

CommandResult MqttTransport::sendPlay(Device &device)
{
    return publishCommand(device, command::play());
}

CommandResult MqttTransport::sendPause(Device &device)
{
    return publishCommand(device, command::pause());
}

CommandResult MqttTransport::sendStop(Device &device)
{
    return publishCommand(device, command::stop());
}

CommandResult MqttTransport::sendReboot(Device &device)
{
    return publishCommand(device, command::reboot());
}

} // namespace oasis::control
