#include "oasis_websocket_device.h"

#include <cstring>

#include <QNetworkRequest>

#include "oasis_log.h"

namespace oasis::control {

WebSocketIODevice::WebSocketIODevice(QObject *parent)
    : QIODevice(parent)
{
    connect(&m_socket, &QWebSocket::connected, this, &WebSocketIODevice::socketConnected);
    connect(&m_socket, &QWebSocket::binaryMessageReceived,
            this, &WebSocketIODevice::handleBinaryMessage);
    connect(&m_socket, &QWebSocket::disconnected, this, [this]() {
        qCDebug(oasisMqttLog) << "WebSocket closed:" << m_socket.closeReason();
        if (isOpen())
            QIODevice::close();
        m_buffer.clear();
        emit socketDisconnected();
    });
    connect(&m_socket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError error) {
        qCDebug(oasisMqttLog) << "WebSocket error" << error << m_socket.errorString();
        emit socketError(m_socket.errorString());
    });
}

WebSocketIODevice::~WebSocketIODevice()
{
    m_socket.disconnect(this);
    m_socket.abort();
}

bool WebSocketIODevice::open(OpenMode mode)
{
    if (!m_url.isValid())
        return false;

    QNetworkRequest request(m_url);
    if (!m_protocol.isEmpty())
        request.setRawHeader("Sec-WebSocket-Protocol", m_protocol);

    m_buffer.clear();
    m_socket.open(request);
    return QIODevice::open(mode);
}

void WebSocketIODevice::close()
{
    if (m_socket.state() != QAbstractSocket::UnconnectedState)
        m_socket.close();
    m_buffer.clear();
    if (isOpen())
        QIODevice::close();
}

qint64 WebSocketIODevice::bytesAvailable() const
{
    return m_buffer.size() + QIODevice::bytesAvailable();
}

qint64 WebSocketIODevice::readData(char *data, qint64 maxSize)
{
    const qint64 count = qMin(maxSize, qint64(m_buffer.size()));
    if (count <= 0)
        return 0;
    memcpy(data, m_buffer.constData(), size_t(count));
    m_buffer.remove(0, int(count));
    return count;
}

qint64 WebSocketIODevice::writeData(const char *data, qint64 maxSize)
{
    if (m_socket.state() != QAbstractSocket::ConnectedState)
        return -1;
    return m_socket.sendBinaryMessage(QByteArray(data, int(maxSize)));
}

void WebSocketIODevice::handleBinaryMessage(const QByteArray &message)
{
    m_buffer.append(message);
    emit readyRead();
}

} // namespace oasis::control
