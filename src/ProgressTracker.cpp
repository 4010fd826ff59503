
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

#include "ProgressTracker.h"

#include <QCoreApplication>

#include "FormatUtils.h"

namespace {
constexpr double millisecondsPerSecond = 1000.0;
constexpr int fullPercent = 100;

int percentOf(qint64 done, qint64 total)
{
    if (total <= 0) {
        return 0;
    }
    const double ratio = double(done) / double(total);
    return qBound(0, int(ratio * fullPercent), fullPercent);
}
} // namespace

/**
 * @brief Creates a tracker polling a shared progress record.
 * @param progress Progress record written by the copy loop; must outlive the tracker.
 * @param parent Parent QObject for ownership.
 */
ProgressTracker::ProgressTracker(const TransferProgress *progress, QObject *parent)
    : QObject(parent)
    , m_progress(progress)
{
    m_timer.setInterval(tickIntervalMs);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &ProgressTracker::poll);
}

/**
 * @brief Derives throughput, ETAs and display strings from raw counters.
 *
 * Rates are only computed once a clock has run past its threshold, and ETAs
 * only when the rate is positive; until then the matching strings stay empty.
 * @param counters Counters read from the shared progress record.
 * @return Snapshot ready for display.
 */
ProgressSnapshot ProgressTracker::computeSnapshot(const ProgressCounters &counters)
{
    ProgressSnapshot snapshot;
    snapshot.currentFileIndex = counters.currentFileIndex;
    snapshot.totalFiles = counters.totalFiles;
    snapshot.currentFileName = counters.currentFileName;
    snapshot.fileCounter = QCoreApplication::translate("ProgressTracker", "Overall: %1 of %2 files")
                               .arg(counters.currentFileIndex)
                               .arg(counters.totalFiles);
    snapshot.filePercent = percentOf(counters.currentFileBytesDone, counters.currentFileSize);

    qint64 overallDone = counters.totalBytesDone + counters.currentFileBytesDone;
    if (counters.totalBytesPlanned > 0) {
        overallDone = qMin(overallDone, counters.totalBytesPlanned);
    }
    snapshot.overallPercent = percentOf(overallDone, counters.totalBytesPlanned);

    if (counters.currentFileSize > 0 && counters.fileClockRunning
        && counters.fileElapsedMs >= fileEtaThresholdMs) {
        const double seconds = counters.fileElapsedMs / millisecondsPerSecond;
        const double bytesPerSecond = counters.currentFileBytesDone / seconds;
        if (bytesPerSecond > 0) {
            const qint64 remainingBytes = qMax<qint64>(0, counters.currentFileSize - counters.currentFileBytesDone);
            const double secondsRemaining = remainingBytes / bytesPerSecond;
            snapshot.currentFileStatus = QCoreApplication::translate("ProgressTracker", "%1 / %2 @ %3/s")
                                             .arg(FormatUtils::formatBytes(counters.currentFileBytesDone),
                                                  FormatUtils::formatBytes(counters.currentFileSize),
                                                  FormatUtils::formatBytes(qint64(bytesPerSecond)));
            snapshot.currentFileEta = QCoreApplication::translate("ProgressTracker", "~%1 remaining")
                                          .arg(FormatUtils::formatDuration(secondsRemaining));
        }
    }

    if (counters.runClockRunning && counters.runElapsedMs >= overallEtaThresholdMs) {
        const double seconds = counters.runElapsedMs / millisecondsPerSecond;
        const double bytesPerSecond = overallDone / seconds;
        if (bytesPerSecond > 0) {
            const qint64 remainingBytes = qMax<qint64>(0, counters.totalBytesPlanned - overallDone);
            const double secondsRemaining = remainingBytes / bytesPerSecond;
            snapshot.overallEta = QCoreApplication::translate("ProgressTracker", "Total: ~%1 remaining @ %2/s")
                                      .arg(FormatUtils::formatDuration(secondsRemaining),
                                           FormatUtils::formatBytes(qint64(bytesPerSecond)));
        }
    }
    return snapshot;
}

bool ProgressTracker::isRunning() const
{
    return m_timer.isActive();
}

void ProgressTracker::start()
{
    if (!m_timer.isActive()) {
        m_timer.start();
    }
}

void ProgressTracker::stop()
{
    if (!m_timer.isActive()) {
        return;
    }
    m_timer.stop();
    emit stopped();
}

/**
 * @brief Reads the shared record once and publishes a snapshot.
 *
 * Does nothing once the copy loop has marked the record inactive, so a tick
 * queued before stop() never reports stale state.
 */
void ProgressTracker::poll()
{
    if (!m_progress || !m_progress->isActive()) {
        return;
    }
    m_lastSnapshot = computeSnapshot(m_progress->counters());
    emit progressUpdated(m_lastSnapshot);
}
