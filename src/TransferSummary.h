#pragma once

#include <QDateTime>
#include <QString>
#include <QVariantMap>

#include "MediaTypes.h"

struct TransferSummary {
    CategoryCounts copied;
    CategoryCounts skipped;
    QDateTime oldest;
    QDateTime newest;
    qint64 totalBytes = 0;
    qint64 elapsedMs = 0;
    QString destinationFolder;

    int copiedCount() const { return copied.total(); }
    int skippedCount() const { return skipped.total(); }
    qint64 averageBytesPerSecond() const;

    QString toText() const;
    QVariantMap toVariantMap() const;
};
