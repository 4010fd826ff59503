
/************************************************************************\

    MediaFerry - Camera media transfer tool
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>
#include <QThread>

#include "MediaScanner.h"
#include "ProgressTracker.h"
#include "TransferLog.h"
#include "TransferOrchestrator.h"
#include "TransferProgress.h"
#include "TransferSettings.h"
#include "VolumeCatalog.h"

namespace {
constexpr int exitSuccess = 0;
constexpr int exitFailed = 1;
constexpr int exitUsage = 2;

const char applicationName[] = "MediaFerry";

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

bool applyOverrides(const QCommandLineParser &parser, TransferSettings &settings, QString *error)
{
    if (parser.isSet(QStringLiteral("mode"))) {
        TransferSettings::SelectionMode mode = settings.mode();
        if (!TransferSettings::parseMode(parser.value(QStringLiteral("mode")), &mode)) {
            *error = QCoreApplication::translate("main", "Unknown mode: %1").arg(parser.value(QStringLiteral("mode")));
            return false;
        }
        settings.setMode(mode);
    }
    if (parser.isSet(QStringLiteral("window"))) {
        settings.setTimeWindowText(parser.value(QStringLiteral("window")));
    }
    if (parser.isSet(QStringLiteral("count"))) {
        settings.setMaxFilesText(parser.value(QStringLiteral("count")));
    }
    if (parser.isSet(QStringLiteral("videos"))) {
        settings.setTransferVideos(true);
    }
    if (parser.isSet(QStringLiteral("no-videos"))) {
        settings.setTransferVideos(false);
    }
    if (parser.isSet(QStringLiteral("photos"))) {
        settings.setTransferPhotos(true);
    }
    if (parser.isSet(QStringLiteral("no-photos"))) {
        settings.setTransferPhotos(false);
    }
    if (parser.isSet(QStringLiteral("video-ext"))) {
        settings.setVideoExtensions(parser.value(QStringLiteral("video-ext")));
    }
    if (parser.isSet(QStringLiteral("photo-ext"))) {
        settings.setPhotoExtensions(parser.value(QStringLiteral("photo-ext")));
    }
    if (parser.isSet(QStringLiteral("log-file"))) {
        settings.setLogFilePath(parser.value(QStringLiteral("log-file")));
    }
    return true;
}

QString volumeLabelFor(const QVector<VolumeEntry> &volumes, const QString &path)
{
    const int index = VolumeCatalog::indexForPath(volumes, path);
    return index >= 0 ? volumes.at(index).label : path;
}

void printSnapshot(const ProgressSnapshot &snapshot)
{
    QString line = QStringLiteral("%1 %2% | %3").arg(snapshot.fileCounter).arg(snapshot.overallPercent).arg(snapshot.currentFileName);
    if (!snapshot.currentFileStatus.isEmpty()) {
        line += QStringLiteral(" | %1 %2").arg(snapshot.currentFileStatus, snapshot.currentFileEta);
    }
    if (!snapshot.overallEta.isEmpty()) {
        line += QStringLiteral(" | %1").arg(snapshot.overallEta);
    }
    out() << '\r' << line << Qt::flush;
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QLatin1String(applicationName));
    QCoreApplication::setOrganizationName(QLatin1String(applicationName));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate(
        "main", "Moves the latest captured media from a camera card to a backup volume."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {QStringLiteral("source"), QCoreApplication::translate("main", "Source folder (skips volume discovery)."), QStringLiteral("path")},
        {QStringLiteral("destination"), QCoreApplication::translate("main", "Destination folder (skips volume discovery)."), QStringLiteral("path")},
        {QStringLiteral("mode"), QCoreApplication::translate("main", "Selection mode: timeWindow or fixedCount."), QStringLiteral("mode")},
        {QStringLiteral("window"), QCoreApplication::translate("main", "Time window in minutes."), QStringLiteral("minutes")},
        {QStringLiteral("count"), QCoreApplication::translate("main", "Number of latest files to transfer."), QStringLiteral("files")},
        {QStringLiteral("videos"), QCoreApplication::translate("main", "Transfer videos.")},
        {QStringLiteral("no-videos"), QCoreApplication::translate("main", "Do not transfer videos.")},
        {QStringLiteral("photos"), QCoreApplication::translate("main", "Transfer photos.")},
        {QStringLiteral("no-photos"), QCoreApplication::translate("main", "Do not transfer photos.")},
        {QStringLiteral("video-ext"), QCoreApplication::translate("main", "Comma-separated video extensions."), QStringLiteral("list")},
        {QStringLiteral("photo-ext"), QCoreApplication::translate("main", "Comma-separated photo extensions."), QStringLiteral("list")},
        {QStringLiteral("log-file"), QCoreApplication::translate("main", "Append log lines to this file."), QStringLiteral("path")},
        {QStringLiteral("list-volumes"), QCoreApplication::translate("main", "List candidate volumes and exit.")},
        {QStringLiteral("dry-run"), QCoreApplication::translate("main", "Plan the transfer without copying.")},
        {QStringLiteral("save"), QCoreApplication::translate("main", "Persist the given options as defaults.")},
    });
    parser.process(app);

    QSettings settings(QSettings::IniFormat, QSettings::UserScope,
                       QLatin1String(applicationName), QLatin1String(applicationName));
    TransferSettings transferSettings;
    transferSettings.load(settings);
    QString error;
    if (!applyOverrides(parser, transferSettings, &error)) {
        err() << error << Qt::endl;
        return exitUsage;
    }
    if (parser.isSet(QStringLiteral("save"))) {
        transferSettings.save(settings);
    }

    TransferLog log;
    QObject::connect(&log, &TransferLog::lineAppended, &app, [](const QString &line) {
        out() << '\r' << line << Qt::endl;
    });
    if (!log.setLogFilePath(transferSettings.logFilePath(), &error)) {
        err() << error << Qt::endl;
    }

    const QVector<VolumeEntry> volumes = VolumeCatalog::mountedVolumes();
    if (parser.isSet(QStringLiteral("list-volumes"))) {
        for (const VolumeEntry &volume : volumes) {
            out() << volume.label << Qt::endl;
        }
        return exitSuccess;
    }

    const bool hasSource = parser.isSet(QStringLiteral("source"));
    const bool hasDestination = parser.isSet(QStringLiteral("destination"));
    if (hasSource != hasDestination) {
        err() << QCoreApplication::translate("main", "--source and --destination must be given together.") << Qt::endl;
        return exitUsage;
    }

    VolumeEntry source;
    VolumeEntry destination;
    if (hasSource) {
        source.rootPath = parser.value(QStringLiteral("source"));
        source.label = volumeLabelFor(volumes, source.rootPath);
        destination.rootPath = parser.value(QStringLiteral("destination"));
        destination.label = volumeLabelFor(volumes, destination.rootPath);
    } else {
        log.append(QCoreApplication::translate("main", "Checking for existing removable drives..."));
        const ExtensionClassifier classifier = transferSettings.classifier();
        const VolumeCatalog::Pairing pairing = VolumeCatalog::pickSourceAndDestination(
            volumes, [&classifier](const QString &rootPath) {
                return MediaScanner::hasMedia(rootPath, classifier);
            });
        log.append(pairing.message);
        if (pairing.outcome != VolumeCatalog::PairingOutcome::Ready) {
            return exitSuccess;
        }
        source = pairing.source;
        destination = pairing.destination;
    }
    log.append(QCoreApplication::translate("main", "Using %1 -> %2").arg(source.label, destination.label));

    TransferProgress progress;
    ProgressTracker tracker(&progress);
    QObject::connect(&tracker, &ProgressTracker::progressUpdated, &app, &printSnapshot);

    QThread thread;
    auto *orchestrator = new TransferOrchestrator(source.rootPath, destination.rootPath,
                                                  transferSettings, &progress, &log);
    orchestrator->setDryRun(parser.isSet(QStringLiteral("dry-run")));
    orchestrator->moveToThread(&thread);

    QObject::connect(&thread, &QThread::started, orchestrator, &TransferOrchestrator::start);
    QObject::connect(orchestrator, &TransferOrchestrator::reportingStarted, &tracker, &ProgressTracker::start);
    QObject::connect(orchestrator, &TransferOrchestrator::reportingStopped, &tracker, &ProgressTracker::stop);
    QObject::connect(orchestrator, &TransferOrchestrator::settingsCoerced, &app,
                     [&settings](const QString &key, const QString &value) {
                         TransferSettings::writeBack(settings, key, value);
                     });
    QObject::connect(orchestrator, &TransferOrchestrator::failed, &app, [](const QString &message) {
        err() << QCoreApplication::translate("main", "Transfer failed: %1").arg(message) << Qt::endl;
    });
    QObject::connect(orchestrator, &TransferOrchestrator::finished, &app,
                     [&thread](const QVariantMap &result) {
                         const QString summary = result.value(QStringLiteral("summary")).toString();
                         if (!summary.isEmpty()) {
                             out() << Qt::endl << summary << Qt::endl;
                         }
                         thread.quit();
                         QCoreApplication::exit(result.value(QStringLiteral("ok")).toBool() ? exitSuccess : exitFailed);
                     });
    QObject::connect(&thread, &QThread::finished, orchestrator, &QObject::deleteLater);
    thread.start();

    const int code = app.exec();
    tracker.stop();
    thread.quit();
    thread.wait();
    return code;
}
