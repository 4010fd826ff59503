
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

#include "TransferSummary.h"

#include <QCoreApplication>
#include <QDir>
#include <QStringList>

#include "FormatUtils.h"

namespace {
const char rangeTimeFormat[] = "HH:mm:ss";
constexpr double millisecondsPerSecond = 1000.0;

QString tr(const char *text)
{
    return QCoreApplication::translate("TransferSummary", text);
}
} // namespace

qint64 TransferSummary::averageBytesPerSecond() const
{
    if (elapsedMs <= 0) {
        return 0;
    }
    return qint64(totalBytes / (elapsedMs / millisecondsPerSecond));
}

QString TransferSummary::toText() const
{
    QStringList lines;
    lines << tr("Transfer complete!") << QString();
    lines << tr("Files transferred: %1").arg(copiedCount());
    lines << tr("  - Videos: %1").arg(copied.videos);
    lines << tr("  - Photos: %1").arg(copied.photos);
    lines << tr("Files skipped (duplicates): %1").arg(skippedCount());
    if (oldest.isValid() && newest.isValid()) {
        lines << tr("Time range: %1 to %2")
                     .arg(oldest.toString(QLatin1String(rangeTimeFormat)),
                          newest.toString(QLatin1String(rangeTimeFormat)));
    }
    lines << tr("Total size: %1").arg(FormatUtils::formatBytes(totalBytes));
    lines << tr("Total time: %1").arg(FormatUtils::formatDurationMs(elapsedMs));
    lines << tr("Average speed: %1/s").arg(FormatUtils::formatBytes(averageBytesPerSecond()));
    lines << QString() << tr("Files saved to:") << QDir::toNativeSeparators(destinationFolder);
    return lines.join(QLatin1Char('\n'));
}

QVariantMap TransferSummary::toVariantMap() const
{
    QVariantMap map;
    map.insert(QStringLiteral("copied"), copiedCount());
    map.insert(QStringLiteral("copiedVideos"), copied.videos);
    map.insert(QStringLiteral("copiedPhotos"), copied.photos);
    map.insert(QStringLiteral("skipped"), skippedCount());
    map.insert(QStringLiteral("skippedVideos"), skipped.videos);
    map.insert(QStringLiteral("skippedPhotos"), skipped.photos);
    map.insert(QStringLiteral("oldest"), oldest);
    map.insert(QStringLiteral("newest"), newest);
    map.insert(QStringLiteral("totalBytes"), totalBytes);
    map.insert(QStringLiteral("elapsedMs"), elapsedMs);
    map.insert(QStringLiteral("averageBytesPerSecond"), averageBytesPerSecond());
    map.insert(QStringLiteral("destinationFolder"), destinationFolder);
    map.insert(QStringLiteral("summary"), toText());
    return map;
}
