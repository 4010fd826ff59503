
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

#include "TransferProgress.h"

#include <QMutexLocker>

namespace {
constexpr qint64 notStarted = -1;
}

TransferProgress::TransferProgress()
{
    m_clock.start();
}

qint64 TransferProgress::now() const
{
    return m_clock.elapsed();
}

qint64 TransferProgress::elapsedBetween(qint64 start, qint64 end, qint64 current)
{
    if (start == notStarted) {
        return 0;
    }
    const qint64 stop = end == notStarted ? current : end;
    return qMax<qint64>(0, stop - start);
}

/**
 * @brief Resets all counters and starts the run clock.
 * @param totalFiles Number of files planned for copy.
 * @param totalBytes Sum of their sizes.
 */
void TransferProgress::beginRun(int totalFiles, qint64 totalBytes)
{
    m_totalFiles.storeRelease(totalFiles);
    m_totalBytesPlanned.storeRelease(totalBytes);
    m_totalBytesDone.storeRelease(0);
    m_fileIndex.storeRelease(0);
    m_fileBytesDone.storeRelease(0);
    m_fileSize.storeRelease(0);
    m_fileStart.storeRelease(notStarted);
    m_fileEnd.storeRelease(notStarted);
    m_runEnd.storeRelease(notStarted);
    m_runStart.storeRelease(now());
}

void TransferProgress::endRun()
{
    if (m_runStart.loadAcquire() != notStarted && m_runEnd.loadAcquire() == notStarted) {
        m_runEnd.storeRelease(now());
    }
}

void TransferProgress::beginFile(int index, const QString &name, qint64 size)
{
    {
        QMutexLocker locker(&m_nameMutex);
        m_fileName = name;
    }
    m_fileBytesDone.storeRelease(0);
    m_fileSize.storeRelease(size);
    m_fileIndex.storeRelease(index);
}

void TransferProgress::startFileClock()
{
    m_fileBytesDone.storeRelease(0);
    m_fileEnd.storeRelease(notStarted);
    m_fileStart.storeRelease(now());
}

void TransferProgress::stopFileClock()
{
    if (m_fileStart.loadAcquire() != notStarted && m_fileEnd.loadAcquire() == notStarted) {
        m_fileEnd.storeRelease(now());
    }
}

void TransferProgress::addFileBytes(qint64 bytes)
{
    m_fileBytesDone.fetchAndAddOrdered(bytes);
}

/**
 * @brief Moves the finished file's bytes into the run total.
 * @param bytes Bytes actually copied for the file.
 */
void TransferProgress::completeFile(qint64 bytes)
{
    // counters() loads the total before the file bytes, so a reader may miss
    // the finished file for one poll but never counts it twice.
    m_fileBytesDone.storeRelease(0);
    m_totalBytesDone.fetchAndAddOrdered(bytes);
}

void TransferProgress::setActive(bool active)
{
    m_active.storeRelease(active ? 1 : 0);
}

bool TransferProgress::isActive() const
{
    return m_active.loadAcquire() != 0;
}

ProgressCounters TransferProgress::counters() const
{
    ProgressCounters counters;
    const qint64 current = now();
    counters.currentFileIndex = m_fileIndex.loadAcquire();
    counters.totalFiles = m_totalFiles.loadAcquire();
    counters.totalBytesDone = m_totalBytesDone.loadAcquire();
    counters.currentFileBytesDone = m_fileBytesDone.loadAcquire();
    counters.currentFileSize = m_fileSize.loadAcquire();
    counters.totalBytesPlanned = m_totalBytesPlanned.loadAcquire();

    const qint64 fileStart = m_fileStart.loadAcquire();
    const qint64 fileEnd = m_fileEnd.loadAcquire();
    counters.fileClockRunning = fileStart != notStarted && fileEnd == notStarted;
    counters.fileElapsedMs = elapsedBetween(fileStart, fileEnd, current);

    const qint64 runStart = m_runStart.loadAcquire();
    const qint64 runEnd = m_runEnd.loadAcquire();
    counters.runClockRunning = runStart != notStarted && runEnd == notStarted;
    counters.runElapsedMs = elapsedBetween(runStart, runEnd, current);

    QMutexLocker locker(&m_nameMutex);
    counters.currentFileName = m_fileName;
    return counters;
}

qint64 TransferProgress::runElapsedMs() const
{
    return elapsedBetween(m_runStart.loadAcquire(), m_runEnd.loadAcquire(), now());
}
