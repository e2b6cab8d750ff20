#include "logger.h"
#include <QDateTime>
#include <QTextStream>
#include <QDir>
#include <QFileInfo>

QFile* Logger::s_file = nullptr;
QMutex Logger::s_mutex;
QString Logger::s_filePath;
bool Logger::s_verbose = false;
QtMessageHandler Logger::s_originalHandler = nullptr;

bool Logger::init(const QString& filePath, bool verbose)
{
    QMutexLocker lock(&s_mutex);

    if (s_originalHandler) {
        return true; // Already initialized
    }

    s_verbose = verbose;

    if (!filePath.isEmpty()) {
        s_filePath = filePath;

        // Ensure directory exists
        QFileInfo fi(filePath);
        QDir().mkpath(fi.absolutePath());

        s_file = new QFile(filePath);
        if (!s_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            delete s_file;
            s_file = nullptr;
            s_filePath.clear();
            return false;
        }

        QTextStream stream(s_file);
        stream << "\n========================================\n";
        stream << "Log started: " << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
        stream << "========================================\n";
        s_file->flush();
    }

    // Capture all qDebug() etc. from here on
    s_originalHandler = qInstallMessageHandler(messageHandler);
    return true;
}

void Logger::shutdown()
{
    QMutexLocker lock(&s_mutex);

    if (s_originalHandler) {
        qInstallMessageHandler(s_originalHandler);
        s_originalHandler = nullptr;
    }

    if (s_file) {
        s_file->close();
        delete s_file;
        s_file = nullptr;
    }
    s_filePath.clear();
}

QString Logger::logFilePath()
{
    return s_filePath;
}

QString Logger::formatLine(QtMsgType type, const QString& msg)
{
    // Format: [HH:mm:ss.zzz] LEVEL: message
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString level;
    switch (type) {
        case QtDebugMsg:    level = "DEBUG"; break;
        case QtInfoMsg:     level = "INFO"; break;
        case QtWarningMsg:  level = "WARN"; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }
    return QString("[%1] %2: %3").arg(timestamp, level, msg);
}

bool Logger::shouldFilter(QtMsgType type, const char* category)
{
    // Qt's own debug categories (qt.network.*, qt.core.*) are noise here
    if (type == QtDebugMsg && category && qstrncmp(category, "qt.", 3) == 0) {
        return true;
    }
    return false;
}

void Logger::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    if (shouldFilter(type, context.category)) {
        return;
    }

    {
        QMutexLocker lock(&s_mutex);
        if (s_file && s_file->isOpen()) {
            QTextStream stream(s_file);
            stream << formatLine(type, msg) << "\n";
            s_file->flush();
        }
    }

    // Console output through the original handler
    if (s_originalHandler && (s_verbose || type != QtDebugMsg)) {
        s_originalHandler(type, context, msg);
    }
}
