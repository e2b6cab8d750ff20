#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>
#include <QMutex>

// Routes qDebug()/qInfo()/qWarning() output to a log file in addition to the
// console. With verbose off, debug messages are kept out of the console but
// still reach the file.
class Logger
{
public:
    static bool init(const QString& filePath, bool verbose = false);
    static void shutdown();
    static QString logFilePath();
    static QString formatLine(QtMsgType type, const QString& msg);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);
    static bool shouldFilter(QtMsgType type, const char* category);

    static QFile* s_file;
    static QMutex s_mutex;
    static QString s_filePath;
    static bool s_verbose;
    static QtMessageHandler s_originalHandler;
};

#endif // LOGGER_H
