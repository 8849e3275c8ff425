#include "oasis_broker.h"

#include <QUuid>
#include <QtMqtt/QMqttTopicFilter>
#include <QtMqtt/QMqttTopicName>

#include "oasis_log.h"

namespace oasis::control {

MqttBrokerLink::MqttBrokerLink(const BrokerSettings &settings, QObject *parent)
    : BrokerLink(parent)
    , m_settings(settings)
{
    m_device.setUrl(m_settings.url());
    m_device.setProtocol(QByteArrayLiteral("mqtt"));

    m_client.setProtocolVersion(QMqttClient::MQTT_3_1_1);
    m_client.setKeepAlive(quint16(m_settings.keepAliveSec));
    m_client.setUsername(m_settings.username);
    m_client.setPassword(m_settings.password);
    m_client.setClientId(QStringLiteral("oasis-control-%1")
                             .arg(QUuid::createUuid().toString(QUuid::Id128).left(12)));
    m_client.setTransport(&m_device, QMqttClient::IODevice);

    // The MQTT handshake starts once the WebSocket upgrade has completed.
    connect(&m_device, &WebSocketIODevice::socketConnected, this, [this]() {
        qCDebug(oasisMqttLog) << "WebSocket open, sending MQTT CONNECT";
        m_client.connectToHost();
    });
    connect(&m_device, &WebSocketIODevice::socketDisconnected, this, &MqttBrokerLink::handleDropped);
    connect(&m_device, &WebSocketIODevice::socketError, this, [this](const QString &message) {
        emit errorOccurred(message);
        handleDropped();
    });

    connect(&m_client, &QMqttClient::connected, this, [this]() {
        emit connected();
    });
    connect(&m_client, &QMqttClient::disconnected, this, &MqttBrokerLink::handleDropped);
    connect(&m_client, &QMqttClient::messageReceived, this,
            [this](const QByteArray &message, const QMqttTopicName &topic) {
        emit messageReceived(topic.name(), message);
    });
    connect(&m_client, &QMqttClient::errorChanged, this, [this](QMqttClient::ClientError error) {
        if (error == QMqttClient::NoError)
            return;
        emit errorOccurred(QStringLiteral("MQTT client error %1").arg(int(error)));
    });
}

MqttBrokerLink::~MqttBrokerLink()
{
    m_attemptActive = false;
    m_client.disconnect(this);
    m_device.disconnect(this);
}

void MqttBrokerLink::connectToBroker()
{
    if (m_attemptActive)
        return;
    m_attemptActive = true;

    if (m_device.isOpen())
        m_device.close();

    qCDebug(oasisMqttLog) << "Opening" << m_device.url().toString();
    if (!m_device.open(QIODevice::ReadWrite)) {
        emit errorOccurred(QStringLiteral("Invalid broker URL %1").arg(m_device.url().toString()));
        handleDropped();
    }
}

void MqttBrokerLink::disconnectFromBroker()
{
    m_attemptActive = false;
    if (m_client.state() != QMqttClient::Disconnected)
        m_client.disconnectFromHost();
    m_device.close();
}

bool MqttBrokerLink::isConnected() const
{
    return m_client.state() == QMqttClient::Connected;
}

bool MqttBrokerLink::subscribe(const QString &topicFilter, quint8 qos)
{
    if (!isConnected())
        return false;
    return m_client.subscribe(QMqttTopicFilter(topicFilter), qos) != nullptr;
}

void MqttBrokerLink::unsubscribe(const QString &topicFilter)
{
    if (!isConnected())
        return;
    m_client.unsubscribe(QMqttTopicFilter(topicFilter));
}

bool MqttBrokerLink::publish(const QString &topic, const QByteArray &payload, quint8 qos)
{
    if (!isConnected())
        return false;
    return m_client.publish(QMqttTopicName(topic), payload, qos) >= 0;
}

void MqttBrokerLink::handleDropped()
{
    if (!m_attemptActive)
        return;
    m_attemptActive = false;
    if (m_device.isOpen())
        m_device.close();
    emit disconnected();
}

} // namespace oasis::control
