#pragma once

#include <QAtomicInteger>
#include <QElapsedTimer>
#include <QMutex>
#include <QString>

struct ProgressCounters {
    int currentFileIndex = 0;
    int totalFiles = 0;
    QString currentFileName;
    qint64 currentFileBytesDone = 0;
    qint64 currentFileSize = 0;
    qint64 totalBytesDone = 0;
    qint64 totalBytesPlanned = 0;
    qint64 fileElapsedMs = 0;
    qint64 runElapsedMs = 0;
    bool fileClockRunning = false;
    bool runClockRunning = false;
};

/**
 * @brief Progress record shared between the copy loop and the progress reporter.
 *
 * The copy loop is the only writer. Counters are atomics so the reporter can
 * read them at any time without blocking the copy; the current file name is
 * the only field behind a mutex.
 */
class TransferProgress
{
public:
    TransferProgress();

    void beginRun(int totalFiles, qint64 totalBytes);
    void endRun();
    void beginFile(int index, const QString &name, qint64 size);
    void startFileClock();
    void stopFileClock();
    void addFileBytes(qint64 bytes);
    void completeFile(qint64 bytes);

    void setActive(bool active);
    bool isActive() const;

    ProgressCounters counters() const;
    qint64 runElapsedMs() const;

private:
    qint64 now() const;
    static qint64 elapsedBetween(qint64 start, qint64 end, qint64 current);

    QElapsedTimer m_clock;
    QAtomicInt m_active = 0;
    QAtomicInt m_fileIndex = 0;
    QAtomicInt m_totalFiles = 0;
    QAtomicInteger<qint64> m_fileBytesDone = 0;
    QAtomicInteger<qint64> m_fileSize = 0;
    QAtomicInteger<qint64> m_totalBytesDone = 0;
    QAtomicInteger<qint64> m_totalBytesPlanned = 0;
    QAtomicInteger<qint64> m_runStart = -1;
    QAtomicInteger<qint64> m_runEnd = -1;
    QAtomicInteger<qint64> m_fileStart = -1;
    QAtomicInteger<qint64> m_fileEnd = -1;
    mutable QMutex m_nameMutex;
    QString m_fileName;
};
