#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QLoggingCategory>
#include <QLocale>
#include <QTextStream>
#include <QDebug>
#include <csignal>
#include <cstdio>
#include <cstdlib>

#include "backend/charts/chartaggregator.h"
#include "backend/database/databasemanager.h"
#include "backend/engine/trackingengine.h"
#include "backend/settings/settingsmanager.h"
#include "backend/sync/syncscheduler.h"
#include "backend/system/mpriscatalog.h"
#include "backend/system/mprisplaybacksampler.h"
#include "backend/system/signalwatcher.h"
#include "backend/tracking/livetrackingsession.h"

using namespace Encore;

// Prefix every line by severity; debug output is governed by the filter rules
void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg) {
    Q_UNUSED(context)

    switch (type) {
        case QtDebugMsg:
            fprintf(stderr, "[Debug] %s\n", qPrintable(msg));
            break;
        case QtInfoMsg:
            fprintf(stderr, "Info: %s\n", qPrintable(msg));
            break;
        case QtWarningMsg:
            fprintf(stderr, "[Warning] %s\n", qPrintable(msg));
            break;
        case QtCriticalMsg:
            fprintf(stderr, "Critical: %s\n", qPrintable(msg));
            break;
        case QtFatalMsg:
            fprintf(stderr, "Fatal: %s\n", qPrintable(msg));
            abort();
    }
}

static int printChart(DatabaseManager& database, ChartPeriod period)
{
    ChartAggregator charts(&database);
    // Printing must not move the reference ranks used for notifications
    const QList<ChartEntry> chart = charts.rankedTracks(period, false);

    QTextStream out(stdout);
    if (chart.isEmpty()) {
        out << "No plays recorded for this period.\n";
        return 0;
    }

    for (const ChartEntry& entry : chart) {
        out << QString("%1  %2  %3  %4 - %5\n")
                   .arg(entry.rank, 4)
                   .arg(entry.movement.symbol(), 4)
                   .arg(entry.playCount, 6)
                   .arg(entry.track.title.isEmpty() ? entry.track.persistentId : entry.track.title,
                        entry.track.artist);
    }
    return 0;
}

int main(int argc, char *argv[])
{
    QLoggingCategory::setFilterRules("*.debug=true\n"
                                     "qt.*.debug=false");

    // Install the custom message handler
    qInstallMessageHandler(messageHandler);

    QCoreApplication app(argc, argv);
    app.setOrganizationName("encore");
    app.setApplicationName("encore");
    app.setApplicationVersion("1.0.0");

    QLocale::setDefault(QLocale::system());

    QCommandLineParser parser;
    parser.setApplicationDescription("Listening tracker for MPRIS media players");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption playerOption("player", "MPRIS bus name of the player to observe.", "bus name");
    QCommandLineOption databaseOption("database", "Path of the play database.", "path");
    QCommandLineOption chartOption("chart", "Print the chart for <period> (all, week, month, year) and exit.", "period");
    QCommandLineOption syncOption("sync", "Run a full reconciliation with the player and exit.");
    QCommandLineOption quietOption("quiet", "Only print warnings and errors.");
    parser.addOption(playerOption);
    parser.addOption(databaseOption);
    parser.addOption(chartOption);
    parser.addOption(syncOption);
    parser.addOption(quietOption);
    parser.process(app);

    if (parser.isSet(quietOption)) {
        QLoggingCategory::setFilterRules("*.debug=false\n*.info=false");
    }

    SettingsManager* settings = SettingsManager::instance();

    // Command line values apply to this run only
    const QString playerService = parser.isSet(playerOption)
        ? parser.value(playerOption) : settings->playerService();
    QString databasePath = parser.isSet(databaseOption)
        ? parser.value(databaseOption) : settings->databasePath();
    if (databasePath.isEmpty()) {
        databasePath = DatabaseManager::defaultDatabasePath();
    }

    DatabaseManager database;
    if (!database.initializeDatabase(databasePath)) {
        qCritical() << "Main: Could not open the play database at" << databasePath;
        return 1;
    }

    if (parser.isSet(chartOption)) {
        ChartPeriod period = ChartPeriod::AllTime;
        if (!chartPeriodFromString(parser.value(chartOption), &period)) {
            qCritical() << "Main: Unknown chart period" << parser.value(chartOption);
            return 2;
        }
        return printChart(database, period);
    }

    MprisCatalog catalog(playerService);

    if (parser.isSet(syncOption)) {
        TrackingEngine engine(&database, &catalog);
        engine.setSettingsManager(settings);
        engine.scheduler()->setEngineState(database.loadEngineState());

        const ReconciliationReport report = engine.scheduler()->runFullSyncNow();
        QTextStream out(stdout);
        if (!report.succeeded()) {
            out << "Sync failed: " << syncErrorToString(report.error) << " " << report.errorMessage << "\n";
            return 1;
        }
        out << QString("Synced %1 tracks: %2 new, %3 plays added, %4 already counted live\n")
                   .arg(report.tracksProcessed)
                   .arg(report.tracksCreated)
                   .arg(report.playFactsCreated)
                   .arg(report.liveFactsAbsorbed);
        return 0;
    }

    MprisPlaybackSampler sampler(playerService);
    TrackingEngine engine(&database, &catalog, &sampler);
    engine.setSettingsManager(settings);

    QObject::connect(&engine, &TrackingEngine::chartMovement, [](const QString& message) {
        qInfo().noquote() << "Chart movement:" << message;
    });
    QObject::connect(engine.scheduler(), &SyncScheduler::seedingProgress,
                     [](int current, int total, const QString& title) {
        qInfo().noquote() << QString("Seeding library %1/%2 (%3)").arg(current).arg(total).arg(title);
    });
    QObject::connect(engine.scheduler(), &SyncScheduler::permissionDenied, []() {
        qCritical() << "Main: Access to the player was denied; grant access and run with --sync";
    });
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &engine, &TrackingEngine::shutdown);

    SignalWatcher signalWatcher;
    if (signalWatcher.watch({SIGINT, SIGTERM})) {
        QObject::connect(&signalWatcher, &SignalWatcher::signalReceived,
                         &app, &QCoreApplication::quit);
    } else {
        qWarning() << "Main: Shutdown on SIGINT/SIGTERM is not available";
    }

    if (!engine.start()) {
        return 1;
    }

    qDebug() << "Main: Observing" << playerService << "with database" << databasePath;

    int result = app.exec();

    delete settings;
    return result;
}
