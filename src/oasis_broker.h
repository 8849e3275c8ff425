#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QtMqtt/QMqttClient>

#include "oasis_config.h"
#include "oasis_websocket_device.h"

namespace oasis::control {

// Publish/subscribe session with the message broker. MqttTransport only
// talks to this interface so tests can drive it without a network.
class BrokerLink : public QObject
{
    Q_OBJECT
public:
    using QObject::QObject;
    ~BrokerLink() override = default;

    // Starts one connection attempt. Completion is reported through
    // connected(); a failed or dropped attempt emits disconnected() once.
    virtual void connectToBroker() = 0;
    // Tears the session down without emitting disconnected().
    virtual void disconnectFromBroker() = 0;
    virtual bool isConnected() const = 0;

    virtual bool subscribe(const QString &topicFilter, quint8 qos) = 0;
    virtual void unsubscribe(const QString &topicFilter) = 0;
    virtual bool publish(const QString &topic, const QByteArray &payload, quint8 qos) = 0;

signals:
    void connected();
    void disconnected();
    void messageReceived(const QString &topic, const QByteArray &payload);
    void errorOccurred(const QString &message);
};

// MQTT 3.1.1 over a secure WebSocket ("mqtt" subprotocol).
class MqttBrokerLink final : public BrokerLink
{
    Q_OBJECT
public:
    explicit MqttBrokerLink(const BrokerSettings &settings, QObject *parent = nullptr);
    ~MqttBrokerLink() override;

    void connectToBroker() override;
    void disconnectFromBroker() override;
    bool isConnected() const override;

    bool subscribe(const QString &topicFilter, quint8 qos) override;
    void unsubscribe(const QString &topicFilter) override;
    bool publish(const QString &topic, const QByteArray &payload, quint8 qos) override;

private:
    void handleDropped();

    BrokerSettings m_settings;
    WebSocketIODevice m_device;
    QMqttClient m_client;
    bool m_attemptActive = false;
};

} // namespace oasis::control
