#pragma once

#include <QByteArray>
#include <QIODevice>
#include <QUrl>
#include <QWebSocket>

namespace oasis::control {

// Presents a WebSocket as a sequential QIODevice so QMqttClient can run on
// top of it. Each binary frame received is appended to the read buffer and
// every write goes out as one binary frame.
class WebSocketIODevice : public QIODevice
{
    Q_OBJECT
public:
    explicit WebSocketIODevice(QObject *parent = nullptr);
    ~WebSocketIODevice() override;

    void setUrl(const QUrl &url) { m_url = url; }
    QUrl url() const { return m_url; }
    // Sent as Sec-WebSocket-Protocol.
    void setProtocol(const QByteArray &protocol) { m_protocol = protocol; }

    bool open(OpenMode mode) override;
    void close() override;
    bool isSequential() const override { return true; }
    qint64 bytesAvailable() const override;

signals:
    void socketConnected();
    void socketDisconnected();
    void socketError(const QString &message);

protected:
    qint64 readData(char *data, qint64 maxSize) override;
    qint64 writeData(const char *data, qint64 maxSize) override;

private:
    void handleBinaryMessage(const QByteArray &message);

    QWebSocket m_socket;
    QByteArray m_buffer;
    QUrl m_url;
    QByteArray m_protocol;
};

} // namespace oasis::control
