#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>
#include <QTimer>

#include "TransferProgress.h"

struct ProgressSnapshot {
    int filePercent = 0;
    int overallPercent = 0;
    int currentFileIndex = 0;
    int totalFiles = 0;
    QString currentFileName;
    QString currentFileStatus;
    QString currentFileEta;
    QString overallEta;
    QString fileCounter;
};

Q_DECLARE_METATYPE(ProgressSnapshot)

class ProgressTracker : public QObject
{
    Q_OBJECT

public:
    static constexpr int tickIntervalMs = 250;
    static constexpr qint64 fileEtaThresholdMs = 500;
    static constexpr qint64 overallEtaThresholdMs = 1000;

    explicit ProgressTracker(const TransferProgress *progress, QObject *parent = nullptr);

    static ProgressSnapshot computeSnapshot(const ProgressCounters &counters);

    bool isRunning() const;
    ProgressSnapshot lastSnapshot() const { return m_lastSnapshot; }

public slots:
    void start();
    void stop();
    void poll();

signals:
    void progressUpdated(const ProgressSnapshot &snapshot);
    void stopped();

private:
    const TransferProgress *m_progress = nullptr;
    QTimer m_timer;
    ProgressSnapshot m_lastSnapshot;
};
