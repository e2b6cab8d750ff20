#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDebug>
#include "version.h"

#include "core/settings.h"
#include "core/logger.h"
#include "extraction/parametervalidator.h"
#include "extraction/extractionsimulator.h"
#include "history/metricsstore.h"
#include "history/metricsjournal.h"
#include "service/extractionservice.h"
#include "network/extractionserver.h"

#include <memory>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setOrganizationName("Mastrena");
    app.setApplicationName("Mastrena");
    app.setApplicationVersion(VERSION_STRING);

    QCommandLineParser parser;
    parser.setApplicationDescription("Espresso extraction simulation server");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Read settings from this INI file.", "file");
    QCommandLineOption portOption({"p", "port"}, "Listen on this TCP port.", "port");
    QCommandLineOption bindOption("bind", "Listen on this address.", "address");
    QCommandLineOption journalOption("journal", "Mirror extraction records to this JSON-lines file.", "file");
    QCommandLineOption logOption("log", "Append log output to this file.", "file");
    QCommandLineOption verboseOption({"v", "verbose"}, "Print debug messages to the console.");
    parser.addOptions({configOption, portOption, bindOption, journalOption, logOption, verboseOption});
    parser.process(app);

    // Create core objects
    std::unique_ptr<Settings> settings = parser.isSet(configOption)
        ? std::make_unique<Settings>(parser.value(configOption))
        : std::make_unique<Settings>();

    QString logPath = parser.isSet(logOption) ? parser.value(logOption) : settings->logFilePath();
    if (!Logger::init(logPath, parser.isSet(verboseOption))) {
        qWarning() << "Failed to open log file" << logPath << "- logging to console only";
    }

    qInfo() << "Starting Mastrena" << VERSION_STRING << "simulation server, settings from" << settings->fileName();

    int port = settings->port();
    bool portOk = true;
    if (parser.isSet(portOption)) {
        port = parser.value(portOption).toInt(&portOk);
    }
    if (!portOk || port < 0 || port > 65535) {
        qCritical() << "Invalid port"
                    << (parser.isSet(portOption) ? parser.value(portOption) : QString::number(port));
        Logger::shutdown();
        return 2;
    }

    ParameterLimits limits = settings->parameterLimits();
    qInfo() << "Accepted ranges: temperature" << limits.temperature.toString()
            << "pressure" << limits.pressure.toString()
            << "time_seconds" << limits.timeSeconds.toString();

    MetricsStore store;
    MetricsJournal journal;
    QString journalPath = parser.isSet(journalOption) ? parser.value(journalOption) : settings->journalPath();
    if (!journalPath.isEmpty()) {
        if (journal.open(journalPath)) {
            store.setJournal(&journal);
        } else {
            qWarning() << "Continuing without a metrics journal";
        }
    }

    ExtractionService service(&store,
                              ParameterValidator(limits),
                              ExtractionSimulator(settings->doseGrams()));

    ExtractionServer server(&service);
    server.setPort(port);
    server.setBindAddress(parser.isSet(bindOption) ? parser.value(bindOption) : settings->bindAddress());

    if (!server.start()) {
        qCritical() << "Could not start the HTTP server";
        Logger::shutdown();
        return 1;
    }

    // Cleanup on exit
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&server, &store]() {
        server.stop();
        qInfo() << "Shutting down with" << store.size() << "extractions recorded";
    });

    int result = app.exec();
    Logger::shutdown();
    return result;
}
