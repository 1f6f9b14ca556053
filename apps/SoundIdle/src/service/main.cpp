#include <QCoreApplication>
#include <QCommandLineParser>

#include "logger/logger.h"
#include "ShutdownSignals.h"
#include "SoundIdleService.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("SoundIdle");
    QCoreApplication::setApplicationVersion("1.0.0");

    // Setup command line parser
    QCommandLineParser parser;
    parser.setApplicationDescription("Mutes the default audio output while the user is away");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Read settings from this INI file", "path");
    QCommandLineOption timeoutOption(QStringList() << "t" << "timeout",
                                     "Inactivity timeout in minutes (default 5)", "minutes");
    QCommandLineOption logFileOption("logfile", "Specify log file path", "path");
    QCommandLineOption logLevelOption("loglevel", "Set log level (debug, info, warning, error)", "level");

    parser.addOption(configOption);
    parser.addOption(timeoutOption);
    parser.addOption(logFileOption);
    parser.addOption(logLevelOption);

    parser.process(app);

    SoundIdleService service;
    ConfigManager *config = service.configManager();

    if (!service.initialize(parser.value(configOption))) {
        LOG_ERROR("Failed to initialize service");
        return 1;
    }

    // Command line wins over the config file
    if (parser.isSet(logLevelOption)) {
        bool ok = false;
        Logger::levelFromString(parser.value(logLevelOption), &ok);
        if (ok) {
            config->setLogLevel(parser.value(logLevelOption).toLower());
        } else {
            LOG_WARNING("Unknown log level: " + parser.value(logLevelOption));
        }
    }
    if (parser.isSet(logFileOption)) {
        config->setLogFilePath(parser.value(logFileOption));
    }

    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        quint64 minutes = parser.value(timeoutOption).toULongLong(&ok);
        QString error;
        if (!ok) {
            LOG_WARNING("Invalid timeout: " + parser.value(timeoutOption));
        } else if (!service.setInactivityTimeout(minutes, &error)) {
            LOG_WARNING("Inactivity timeout not applied: " + error);
        }
    }

    LOG_INFO("SoundIdle starting...");

    // Graceful shutdown on SIGINT/SIGTERM
    ShutdownSignals shutdownSignals;
    QObject::connect(&shutdownSignals, &ShutdownSignals::shutdownRequested,
                     &app, &QCoreApplication::quit);
    if (!shutdownSignals.install()) {
        LOG_WARNING("Running without graceful shutdown on SIGINT/SIGTERM");
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&service]() {
        LOG_INFO("Application shutting down...");
        service.stop();
    });

    // Monitor start failures are logged and never abort the application
    service.startMonitorAsync();

    return app.exec();
}
