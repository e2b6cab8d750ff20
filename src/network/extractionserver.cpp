#include "extractionserver.h"
#include "../service/extractionservice.h"
#include "version.h"

#include <QHostAddress>
#include <QJsonArray>
#include <QJsonObject>
#include <QDateTime>
#include <QUrlQuery>
#include <QDebug>

HttpResponse HttpResponse::json(int statusCode, const QJsonDocument& doc)
{
    HttpResponse response;
    response.statusCode = statusCode;
    response.body = doc.toJson(QJsonDocument::Compact);
    return response;
}

HttpResponse HttpResponse::error(int statusCode, const QString& message)
{
    QJsonObject obj;
    obj["error"] = message;
    return json(statusCode, QJsonDocument(obj));
}

ExtractionServer::ExtractionServer(ExtractionService* service, QObject* parent)
    : QObject(parent)
    , m_service(service)
{
    // Timer to cleanup stale connections
    m_cleanupTimer = new QTimer(this);
    m_cleanupTimer->setInterval(10000);  // Check every 10 seconds
    connect(m_cleanupTimer, &QTimer::timeout, this, &ExtractionServer::cleanupStaleConnections);
}

ExtractionServer::~ExtractionServer()
{
    stop();
    m_pendingRequests.clear();
}

QString ExtractionServer::url() const
{
    if (!isRunning()) return QString();
    return QString("http://%1:%2").arg(m_bindAddress).arg(m_port);
}

void ExtractionServer::setPort(int port)
{
    if (m_port != port) {
        m_port = port;
        emit portChanged();
    }
}

bool ExtractionServer::start()
{
    if (m_server) {
        stop();
    }

    if (m_port < 0 || m_port > 65535) {
        qWarning() << "ExtractionServer: Invalid port" << m_port;
        return false;
    }

    QHostAddress address;
    if (!address.setAddress(m_bindAddress)) {
        qWarning() << "ExtractionServer: Invalid bind address" << m_bindAddress;
        return false;
    }

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection, this, &ExtractionServer::onNewConnection);

    if (!m_server->listen(address, static_cast<quint16>(m_port))) {
        qWarning() << "ExtractionServer: Failed to start on port" << m_port << m_server->errorString();
        delete m_server;
        m_server = nullptr;
        return false;
    }

    // Port 0 asks the OS for a free port
    setPort(m_server->serverPort());

    m_cleanupTimer->start();
    qInfo() << "ExtractionServer: Started on" << url();
    emit runningChanged();
    emit urlChanged();
    return true;
}

void ExtractionServer::stop()
{
    if (m_server) {
        m_cleanupTimer->stop();
        m_server->close();
        delete m_server;
        m_server = nullptr;
        emit runningChanged();
        emit urlChanged();
        qInfo() << "ExtractionServer: Stopped";
    }
}

void ExtractionServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        connect(socket, &QTcpSocket::readyRead, this, &ExtractionServer::onReadyRead);
        connect(socket, &QTcpSocket::disconnected, this, &ExtractionServer::onDisconnected);
        emit clientConnected(socket->peerAddress().toString());
    }
}

void ExtractionServer::onReadyRead()
{
    QTcpSocket* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) return;

    try {
        PendingRequest& pending = m_pendingRequests[socket];
        pending.lastActivity.start();
        pending.data.append(socket->readAll());

        if (pending.headerEnd < 0) {
            pending.headerEnd = static_cast<int>(pending.data.indexOf("\r\n\r\n"));

            // The terminator may arrive in the same chunk as an oversized header block
            qint64 headerSize = pending.headerEnd < 0 ? pending.data.size() : pending.headerEnd;
            if (headerSize > MAX_HEADER_SIZE) {
                qWarning() << "ExtractionServer: Headers too large, rejecting";
                sendResponse(socket, HttpResponse::error(413, "Headers too large"));
                dropRequest(socket);
                return;
            }
            if (pending.headerEnd < 0) {
                // Headers not complete yet
                return;
            }

            // Parse Content-Length
            QString headers = QString::fromUtf8(pending.data.left(pending.headerEnd));
            const QStringList lines = headers.split("\r\n");
            pending.contentLength = 0;
            for (const QString& line : lines) {
                if (line.startsWith("Content-Length:", Qt::CaseInsensitive)) {
                    pending.contentLength = line.mid(15).trimmed().toLongLong();
                    break;
                }
            }

            if (pending.contentLength < 0 || pending.contentLength > MAX_BODY_SIZE) {
                qWarning() << "ExtractionServer: Body too large:" << pending.contentLength << "bytes";
                sendResponse(socket, HttpResponse::error(413, "Request body too large"));
                dropRequest(socket);
                return;
            }
        }

        qint64 bodyReceived = pending.data.size() - (pending.headerEnd + 4);
        if (bodyReceived < pending.contentLength) {
            return;  // Still waiting for more data
        }

        QByteArray request = pending.data;
        m_pendingRequests.remove(socket);
        handleRequest(socket, request);

    } catch (const std::exception& e) {
        qWarning() << "ExtractionServer: Exception in onReadyRead:" << e.what();
        dropRequest(socket);
    }
}

void ExtractionServer::onDisconnected()
{
    QTcpSocket* socket = qobject_cast<QTcpSocket*>(sender());
    if (socket) {
        m_pendingRequests.remove(socket);
        socket->deleteLater();
    }
}

void ExtractionServer::dropRequest(QTcpSocket* socket)
{
    m_pendingRequests.remove(socket);
    socket->close();
}

void ExtractionServer::cleanupStaleConnections()
{
    QList<QTcpSocket*> staleConnections;
    for (auto it = m_pendingRequests.begin(); it != m_pendingRequests.end(); ++it) {
        if (it.value().lastActivity.isValid() &&
            it.value().lastActivity.elapsed() > CONNECTION_TIMEOUT_MS) {
            staleConnections.append(it.key());
        }
    }

    for (QTcpSocket* socket : staleConnections) {
        qWarning() << "ExtractionServer: Cleaning up stale connection from" << socket->peerAddress().toString();
        dropRequest(socket);
    }
}

void ExtractionServer::handleRequest(QTcpSocket* socket, const QByteArray& request)
{
    int lineEnd = static_cast<int>(request.indexOf("\r\n"));
    QString requestLine = QString::fromUtf8(lineEnd >= 0 ? request.left(lineEnd) : request);

    QStringList parts = requestLine.split(' ');
    if (parts.size() < 2) {
        sendResponse(socket, HttpResponse::error(400, "Malformed request line"));
        return;
    }

    QString method = parts[0];
    QString target = parts[1];
    qDebug() << "ExtractionServer:" << method << target;

    sendResponse(socket, route(method, target));
}

HttpResponse ExtractionServer::route(const QString& method, const QString& target) const
{
    qsizetype queryStart = target.indexOf('?');
    QString path = queryStart >= 0 ? target.left(queryStart) : target;
    QString query = queryStart >= 0 ? target.mid(queryStart + 1) : QString();

    if (path.size() > 1 && path.endsWith('/')) {
        path.chop(1);
    }

    if (path == "/start" || path == "/api/extraction") {
        if (method != "POST") return HttpResponse::error(405, "Use POST to start an extraction");
        return handleStart(query);
    }
    if (path == "/metrics" || path == "/api/metrics") {
        if (method != "GET") return HttpResponse::error(405, "Use GET to read metrics");
        return handleMetrics();
    }
    if (path == "/api/trends") {
        if (method != "GET") return HttpResponse::error(405, "Use GET to read trends");
        return handleTrends(query);
    }
    if (path == "/api/alerts") {
        if (method != "GET") return HttpResponse::error(405, "Use GET to read alerts");
        return handleAlerts();
    }
    if (path == "/") {
        if (method != "GET") return HttpResponse::error(405, "Use GET");
        return handleIndex();
    }

    return HttpResponse::error(404, "Not Found");
}

HttpResponse ExtractionServer::handleStart(const QString& query) const
{
    QUrlQuery urlQuery(query);

    // A present-but-empty value must stay distinguishable from an absent one
    auto item = [&urlQuery](const QString& key) {
        if (!urlQuery.hasQueryItem(key)) return QString();
        QString value = urlQuery.queryItemValue(key, QUrl::FullyDecoded);
        return value.isNull() ? QString("") : value;
    };

    RawExtractionParameters raw;
    raw.temperature = item(ParameterField::Temperature);
    raw.pressure = item(ParameterField::Pressure);
    raw.timeSeconds = item(ParameterField::TimeSeconds);

    StartResult result = m_service->start(raw);
    if (!result.isSuccess()) {
        return HttpResponse::json(400, QJsonDocument(result.error.toJson()));
    }
    return HttpResponse::json(200, QJsonDocument(result.record.toJson()));
}

HttpResponse ExtractionServer::handleMetrics() const
{
    const QVector<ExtractionRecord> records = m_service->history();
    QJsonArray arr;
    for (const ExtractionRecord& record : records) {
        arr.append(record.toJson());
    }
    return HttpResponse::json(200, QJsonDocument(arr));
}

HttpResponse ExtractionServer::handleTrends(const QString& query) const
{
    QUrlQuery urlQuery(query);
    TrendPeriod period = TrendPeriod::All;
    if (urlQuery.hasQueryItem("period")) {
        QString name = urlQuery.queryItemValue("period");
        if (!trendPeriodFromString(name, &period)) {
            return HttpResponse::error(400, QString("Unknown period \"%1\". Valid periods: daily, weekly, monthly, yearly, all").arg(name));
        }
    }

    ExtractionTrends trends = m_service->trends(period, QDateTime::currentDateTimeUtc());
    return HttpResponse::json(200, QJsonDocument(trends.toJson()));
}

HttpResponse ExtractionServer::handleAlerts() const
{
    const QList<Alert> alerts = m_service->alerts(QDateTime::currentDateTimeUtc());
    QJsonArray arr;
    for (const Alert& alert : alerts) {
        arr.append(alert.toJson());
    }
    return HttpResponse::json(200, QJsonDocument(arr));
}

HttpResponse ExtractionServer::handleIndex() const
{
    QJsonObject obj;
    obj["name"] = "Mastrena";
    obj["version"] = QString(VERSION_STRING);
    obj["records"] = m_service->history().size();
    obj["endpoints"] = QJsonArray{
        "POST /start", "GET /metrics", "GET /api/trends", "GET /api/alerts"
    };
    return HttpResponse::json(200, QJsonDocument(obj));
}

QString ExtractionServer::statusText(int statusCode)
{
    switch (statusCode) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

void ExtractionServer::sendResponse(QTcpSocket* socket, const HttpResponse& response)
{
    QByteArray data;
    data.append(QString("HTTP/1.1 %1 %2\r\n").arg(response.statusCode).arg(statusText(response.statusCode)).toUtf8());
    data.append(QString("Content-Type: %1\r\n").arg(response.contentType).toUtf8());
    data.append(QString("Content-Length: %1\r\n").arg(response.body.size()).toUtf8());
    data.append("Access-Control-Allow-Origin: *\r\n");
    data.append("Connection: close\r\n");
    data.append("\r\n");
    data.append(response.body);

    if (socket->write(data) == -1) {
        qWarning() << "ExtractionServer: Failed to write response -" << socket->errorString();
        socket->abort();
        return;
    }
    socket->flush();
    socket->disconnectFromHost();
}
