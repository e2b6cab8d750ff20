#pragma once

#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QHash>
#include <QByteArray>
#include <QJsonDocument>
#include <QTimer>
#include <QElapsedTimer>

class ExtractionService;

struct PendingRequest {
    QByteArray data;                // Headers + body as received so far
    qint64 contentLength = -1;
    int headerEnd = -1;
    QElapsedTimer lastActivity;     // For timeout tracking
};

struct HttpResponse {
    int statusCode = 200;
    QString contentType = QStringLiteral("application/json");
    QByteArray body;

    static HttpResponse json(int statusCode, const QJsonDocument& doc);
    static HttpResponse error(int statusCode, const QString& message);
};

/**
 * ExtractionServer - minimal HTTP/1.1 front end for the ExtractionService
 *
 * Routes:
 *   POST /start, /api/extraction      run one extraction (query parameters)
 *   GET  /metrics, /api/metrics       full history, oldest first
 *   GET  /api/trends?period=...       aggregate trends
 *   GET  /api/alerts                  alerts over the history
 *
 * Every response closes the connection.
 */
class ExtractionServer : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)
    Q_PROPERTY(QString url READ url NOTIFY urlChanged)
    Q_PROPERTY(int port READ port WRITE setPort NOTIFY portChanged)

public:
    explicit ExtractionServer(ExtractionService* service, QObject* parent = nullptr);
    ~ExtractionServer();

    bool isRunning() const { return m_server && m_server->isListening(); }
    QString url() const;
    int port() const { return m_port; }
    void setPort(int port);
    QString bindAddress() const { return m_bindAddress; }
    void setBindAddress(const QString& address) { m_bindAddress = address; }

    bool start();
    void stop();

    // Maps a request line onto a response. Independent of any socket.
    HttpResponse route(const QString& method, const QString& target) const;

signals:
    void runningChanged();
    void urlChanged();
    void portChanged();
    void clientConnected(const QString& address);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();
    void cleanupStaleConnections();

private:
    void handleRequest(QTcpSocket* socket, const QByteArray& request);
    void sendResponse(QTcpSocket* socket, const HttpResponse& response);
    void dropRequest(QTcpSocket* socket);

    HttpResponse handleStart(const QString& query) const;
    HttpResponse handleMetrics() const;
    HttpResponse handleTrends(const QString& query) const;
    HttpResponse handleAlerts() const;
    HttpResponse handleIndex() const;

    static QString statusText(int statusCode);

    QTcpServer* m_server = nullptr;
    ExtractionService* m_service = nullptr;
    QTimer* m_cleanupTimer = nullptr;
    int m_port = 3000;
    QString m_bindAddress = QStringLiteral("127.0.0.1");
    QHash<QTcpSocket*, PendingRequest> m_pendingRequests;

    // Limits to prevent resource exhaustion
    static constexpr qint64 MAX_HEADER_SIZE = 64 * 1024;       // 64 KB for headers
    static constexpr qint64 MAX_BODY_SIZE = 1024 * 1024;       // 1 MB
    static constexpr int CONNECTION_TIMEOUT_MS = 30000;        // 30 second timeout
};
