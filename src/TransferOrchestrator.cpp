
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

#include "TransferOrchestrator.h"

#include <QDir>
#include <QScopeGuard>

#include <exception>
#include <memory>

#include "CopyEngine.h"
#include "DestinationIndex.h"
#include "FileOperationUtils.h"
#include "FormatUtils.h"
#include "MediaScanner.h"
#include "SelectionPolicy.h"
#include "TransferLog.h"
#include "TransferPlanner.h"
#include "TransferProgress.h"

namespace {
const char sessionFolderFormat[] = "yyyy-MM-dd_HH-mm-ss";
const char fileTimeFormat[] = "HH:mm:ss";
const char videosFolder[] = "Videos";
const char photosFolder[] = "Photos";

const char outcomeKey[] = "outcome";
const char outcomeCompleted[] = "completed";
const char outcomeNoWork[] = "noWork";
const char outcomeDryRun[] = "dryRun";
const char outcomeFailed[] = "failed";
} // namespace

QString TransferOrchestrator::sessionFolderName(const QDateTime &time)
{
    return time.toString(QLatin1String(sessionFolderFormat));
}

QString TransferOrchestrator::videosFolderName()
{
    return QLatin1String(videosFolder);
}

QString TransferOrchestrator::photosFolderName()
{
    return QLatin1String(photosFolder);
}

/**
 * @brief Creates an orchestrator for one transfer run.
 * @param sourceRoot Root folder of the source volume.
 * @param destinationRoot Root folder of the destination volume.
 * @param settings Selection and category settings for this run.
 * @param progress Shared progress record; must outlive the run. A private record is used when null.
 * @param log Log sink, may be null.
 * @param parent Parent QObject for ownership.
 */
TransferOrchestrator::TransferOrchestrator(const QString &sourceRoot,
                                           const QString &destinationRoot,
                                           const TransferSettings &settings,
                                           TransferProgress *progress,
                                           TransferLog *log,
                                           QObject *parent)
    : QObject(parent)
    , m_sourceRoot(sourceRoot)
    , m_destinationRoot(destinationRoot)
    , m_settings(settings)
    , m_classifier(settings.classifier())
    , m_progress(progress)
    , m_log(log)
{
    if (!m_progress) {
        m_ownedProgress = std::make_unique<TransferProgress>();
        m_progress = m_ownedProgress.get();
    }
}

/**
 * @brief Runs the whole pipeline and emits finished with the outcome.
 *
 * Sequence: scan, select, index, plan, then either stop with nothing to do or
 * copy every planned file and summarize. A copy failure aborts the remaining
 * queue and ends the run in the Failed state.
 */
void TransferOrchestrator::start()
{
    QVariantMap result;
    result.insert("ok", false);
    QString error;
    bool ok = false;
    try {
        ok = run(result, &error);
    } catch (const std::exception &ex) {
        stopReporting();
        error = tr("Unexpected error: %1").arg(QString::fromLocal8Bit(ex.what()));
        ok = false;
    }

    if (!ok) {
        setState(State::Failed);
        log(tr("Error during transfer: %1").arg(error));
        result.insert("ok", false);
        result.insert(QLatin1String(outcomeKey), QLatin1String(outcomeFailed));
        result.insert("error", error);
        emit failed(error);
        emit finished(result);
        return;
    }

    result.insert("ok", true);
    emit finished(result);
}

bool TransferOrchestrator::run(QVariantMap &result, QString *error)
{
    const LogCallback logCallback = [this](const QString &message) { log(message); };

    setState(State::Scanning);
    log(tr("Source: %1").arg(QDir::toNativeSeparators(m_sourceRoot)));
    log(tr("Destination: %1").arg(QDir::toNativeSeparators(m_destinationRoot)));
    const QVector<MediaFile> candidates = MediaScanner::scan(m_sourceRoot, m_classifier, logCallback);
    log(tr("Found %1 media file(s) on source.").arg(candidates.size()));

    setState(State::Selecting);
    QString coercedKey;
    QString coercedValue;
    if (m_settings.coerceActiveValue(&coercedKey, &coercedValue)) {
        log(tr("Invalid value for %1, using %2").arg(coercedKey, coercedValue));
        emit settingsCoerced(coercedKey, coercedValue);
    }
    const std::unique_ptr<SelectionPolicy> policy = createSelectionPolicy(m_settings);
    log(policy->description());
    const SelectionResult selection = policy->select(candidates, m_classifier, logCallback);
    if (selection.isEmpty()) {
        finishNoWork(result, tr("No media files found to transfer."));
        return true;
    }
    log(tr("Found %1 media file(s) to transfer: %2 video(s), %3 photo(s).")
            .arg(selection.files.size())
            .arg(selection.counts.videos)
            .arg(selection.counts.photos));

    setState(State::Indexing);
    const DestinationIndex index = DestinationIndex::build(m_destinationRoot, logCallback);

    setState(State::Planning);
    m_plan = TransferPlanner::plan(selection, index, m_classifier, logCallback);
    if (m_plan.isEmpty()) {
        finishNoWork(result, tr("All files already exist on destination. Nothing to transfer."));
        return true;
    }
    log(tr("Transferring %1 new file(s): %2 video(s), %3 photo(s). Skipped %4 duplicate(s).")
            .arg(m_plan.toCopy.size())
            .arg(m_plan.copyCounts.videos)
            .arg(m_plan.copyCounts.photos)
            .arg(m_plan.skipped.size()));

    if (m_dryRun) {
        logPlan();
        result.insert(QLatin1String(outcomeKey), QLatin1String(outcomeDryRun));
        result.insert("toCopy", int(m_plan.toCopy.size()));
        result.insert("skipped", int(m_plan.skipped.size()));
        result.insert("totalBytes", m_plan.copyBytes);
        setState(State::Idle);
        return true;
    }

    setState(State::Copying);
    m_progress->beginRun(int(m_plan.toCopy.size()), m_plan.copyBytes);
    startReporting();
    auto reportingGuard = qScopeGuard([this]() { stopReporting(); });

    const QDateTime sessionTime = m_sessionTime.isValid() ? m_sessionTime : QDateTime::currentDateTime();
    const QString sessionFolder = QDir(DestinationIndex::archivePath(m_destinationRoot))
                                      .filePath(sessionFolderName(sessionTime));
    m_summary = TransferSummary();
    m_summary.destinationFolder = sessionFolder;
    if (!copyPlannedFiles(sessionFolder, error)) {
        m_progress->endRun();
        return false;
    }
    m_progress->endRun();
    stopReporting();

    setState(State::Summarizing);
    m_summary.skipped = m_plan.skippedCounts;
    m_summary.oldest = m_plan.toCopy.first().lastModified;
    m_summary.newest = m_plan.toCopy.last().lastModified;
    m_summary.elapsedMs = m_progress->runElapsedMs();
    log(tr("Transfer completed in %1. %2 new file(s) transferred, %3 duplicate(s) skipped.")
            .arg(FormatUtils::formatDurationMs(m_summary.elapsedMs))
            .arg(m_summary.copiedCount())
            .arg(m_summary.skippedCount()));

    const QVariantMap summary = m_summary.toVariantMap();
    for (auto it = summary.cbegin(); it != summary.cend(); ++it) {
        result.insert(it.key(), it.value());
    }
    result.insert(QLatin1String(outcomeKey), QLatin1String(outcomeCompleted));
    setState(State::Idle);
    return true;
}

/**
 * @brief Creates the session layout and copies the planned files in order.
 * @param sessionFolder Timestamped folder receiving this run's files.
 * @param error Output error message for the first failure.
 * @return True when every planned file was copied.
 */
bool TransferOrchestrator::copyPlannedFiles(const QString &sessionFolder, QString *error)
{
    const char context[] = "TransferOrchestrator";
    if (!FileOperationUtils::ensureFolder(sessionFolder, context, error)) {
        return false;
    }
    const QDir sessionDir(sessionFolder);
    const QString videosPath = sessionDir.filePath(videosFolderName());
    const QString photosPath = sessionDir.filePath(photosFolderName());
    if (m_plan.copyCounts.videos > 0 && !FileOperationUtils::ensureFolder(videosPath, context, error)) {
        return false;
    }
    if (m_plan.copyCounts.photos > 0 && !FileOperationUtils::ensureFolder(photosPath, context, error)) {
        return false;
    }

    CopyEngine engine(m_progress);
    const int total = int(m_plan.toCopy.size());
    for (int i = 0; i < total; ++i) {
        const MediaFile &file = m_plan.toCopy.at(i);
        const MediaCategory category = m_classifier.categoryOf(file);
        const bool isPhoto = category == MediaCategory::Photo;
        const QString targetPath = FileOperationUtils::uniqueTargetPath(isPhoto ? photosPath : videosPath, file.name);

        m_progress->beginFile(i + 1, file.name, file.size);
        log(tr("Transferring (%1/%2) [%3]: %4 (%5) - %6")
                .arg(i + 1)
                .arg(total)
                .arg(isPhoto ? tr("Photo") : tr("Video"),
                     file.name,
                     FormatUtils::formatBytes(file.size),
                     file.lastModified.toString(QLatin1String(fileTimeFormat))));

        CopyResult copy;
        if (!engine.copyFile(file.path, targetPath, file.size, &copy, error)) {
            return false;
        }
        if (!copy.timesPreserved) {
            log(tr("Could not preserve timestamps of %1").arg(QDir::toNativeSeparators(targetPath)));
        }
        m_progress->completeFile(copy.bytesCopied);
        m_summary.copied.add(category);
        m_summary.totalBytes += copy.bytesCopied;
        log(tr("Completed: %1").arg(file.name));
    }
    return true;
}

void TransferOrchestrator::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void TransferOrchestrator::log(const QString &message)
{
    if (m_log) {
        m_log->append(message);
    }
}

void TransferOrchestrator::startReporting()
{
    m_progress->setActive(true);
    m_reporting = true;
    emit reportingStarted();
}

void TransferOrchestrator::stopReporting()
{
    if (!m_reporting) {
        return;
    }
    m_progress->setActive(false);
    m_reporting = false;
    emit reportingStopped();
}

void TransferOrchestrator::finishNoWork(QVariantMap &result, const QString &message)
{
    setState(State::NoWork);
    log(message);
    result.insert(QLatin1String(outcomeKey), QLatin1String(outcomeNoWork));
    result.insert("message", message);
}

void TransferOrchestrator::logPlan()
{
    log(tr("Dry run: %1 file(s), %2 would be copied.")
            .arg(m_plan.toCopy.size())
            .arg(FormatUtils::formatBytes(m_plan.copyBytes)));
    for (const MediaFile &file : m_plan.toCopy) {
        log(tr("Would copy: %1 (%2)").arg(file.name, FormatUtils::formatBytes(file.size)));
    }
}
